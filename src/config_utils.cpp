#include "config_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>

#include "parse_utils.hpp"
#include "system_utils.hpp"

using nlohmann::json;

namespace gitmigrate {

namespace {

/// Plain YAML scalars stay strings; the typed getters below convert them.
json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Sequence: {
        json arr = json::array();
        for (const auto& item : node)
            arr.push_back(yaml_to_json(item));
        return arr;
    }
    case YAML::NodeType::Map: {
        json obj = json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar())
                throw ConfigValidationError("mapping keys must be scalars");
            obj[it->first.Scalar()] = yaml_to_json(it->second);
        }
        return obj;
    }
    case YAML::NodeType::Scalar:
        return node.Scalar();
    default:
        return nullptr;
    }
}

const json* find_field(const json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

std::string scalar_text(const json& v, const std::string& path) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_boolean())
        return v.get<bool>() ? "true" : "false";
    if (v.is_number())
        return v.dump();
    throw ConfigValidationError("'" + path + "' must be a scalar value");
}

std::optional<std::string> get_string(const json& obj, const std::string& key,
                                      const std::string& path) {
    const json* v = find_field(obj, key);
    if (!v)
        return std::nullopt;
    return scalar_text(*v, path + key);
}

std::string require_string(const json& obj, const std::string& key, const std::string& path) {
    auto v = get_string(obj, key, path);
    if (!v || v->empty())
        throw ConfigValidationError("missing required field '" + path + key + "'");
    return *v;
}

bool get_bool(const json& obj, const std::string& key, const std::string& path, bool fallback) {
    const json* v = find_field(obj, key);
    if (!v)
        return fallback;
    if (v->is_boolean())
        return v->get<bool>();
    std::string s = scalar_text(*v, path + key);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "yes" || s == "on" || s == "1")
        return true;
    if (s == "false" || s == "no" || s == "off" || s == "0")
        return false;
    throw ConfigValidationError("'" + path + key + "' must be a boolean");
}

long long get_int(const json& obj, const std::string& key, const std::string& path,
                  long long fallback) {
    const json* v = find_field(obj, key);
    if (!v)
        return fallback;
    if (v->is_number_integer())
        return v->get<long long>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        bool ok = false;
        int n = parse_int(s, INT_MIN, INT_MAX, ok);
        if (ok && s.find_first_not_of("+-0123456789") == std::string::npos)
            return n;
    }
    throw ConfigValidationError("'" + path + key + "' must be an integer");
}

std::chrono::seconds get_seconds(const json& obj, const std::string& key,
                                 const std::string& path, std::chrono::seconds fallback) {
    const json* v = find_field(obj, key);
    if (!v)
        return fallback;
    if (v->is_number_integer()) {
        long long n = v->get<long long>();
        if (n < 0)
            throw ConfigValidationError("'" + path + key + "' must not be negative");
        return std::chrono::seconds(n);
    }
    bool ok = false;
    auto d = parse_duration(scalar_text(*v, path + key), ok);
    if (!ok)
        throw ConfigValidationError("'" + path + key + "' must be a duration in seconds");
    return d;
}

std::string expand_secret(const json& obj, const std::string& key, const std::string& path) {
    auto v = get_string(obj, key, path);
    return v ? expand_env_vars(*v, path + key) : std::string();
}

AuthCredential parse_auth(const json& parent, const std::string& path) {
    const json* node = find_field(parent, "auth");
    if (!node)
        return NoAuth{};
    const std::string p = path + "auth.";
    if (!node->is_object())
        throw ConfigValidationError("'" + path + "auth' must be a mapping");
    if (node->empty())
        return NoAuth{};
    std::string type = get_string(*node, "type", p).value_or("ssh");
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (type == "none")
        return NoAuth{};
    if (type == "token")
        return TokenAuth{expand_secret(*node, "token", p)};
    if (type == "basic")
        return BasicAuth{expand_secret(*node, "username", p), expand_secret(*node, "password", p)};
    if (type == "ssh") {
        SshAuth ssh;
        if (auto key = get_string(*node, "ssh_key", p); key && !key->empty())
            ssh.key_path = procutil::expand_home(expand_env_vars(*key, p + "ssh_key"));
        return ssh;
    }
    throw ConfigValidationError("unknown authentication type '" + type + "' in '" + path +
                                "auth.type'");
}

TaskOptions parse_task_options(const json& entry, const std::string& path) {
    TaskOptions options;
    const json* node = find_field(entry, "options");
    if (!node)
        return options;
    if (!node->is_object())
        throw ConfigValidationError("'" + path + "options' must be a mapping");
    for (auto it = node->begin(); it != node->end(); ++it) {
        if (it->is_null())
            continue;
        options[it.key()] = scalar_text(*it, path + "options." + it.key());
    }
    return options;
}

MigrationTask parse_task(const json& entry, size_t index) {
    const std::string path = "migrations[" + std::to_string(index) + "].";
    if (!entry.is_object())
        throw ConfigValidationError("'" + path.substr(0, path.size() - 1) +
                                    "' must be a mapping");
    MigrationTask task;
    task.name = require_string(entry, "name", path);

    const json* src = find_field(entry, "source");
    if (!src || !src->is_object())
        throw ConfigValidationError("missing required section '" + path + "source'");
    task.source.url = require_string(*src, "url", path + "source.");
    if (auto branch = get_string(*src, "branch", path + "source."); branch && !branch->empty())
        task.source.branch = *branch;
    task.source.auth = parse_auth(*src, path + "source.");

    const json* dst = find_field(entry, "destination");
    if (!dst || !dst->is_object())
        throw ConfigValidationError("missing required section '" + path + "destination'");
    task.destination.url = require_string(*dst, "url", path + "destination.");
    task.destination.create_if_missing =
        get_bool(*dst, "create_if_missing", path + "destination.", true);
    task.destination.auth = parse_auth(*dst, path + "destination.");

    task.options = parse_task_options(entry, path);
    return task;
}

BatchSettings parse_batch(const json& root) {
    BatchSettings s;
    const json* batch = find_field(root, "batch");
    if (!batch)
        return s;
    if (!batch->is_object())
        throw ConfigValidationError("'batch' must be a mapping");
    const std::string p = "batch.";
    long long conc = get_int(*batch, "max_concurrent", p, static_cast<long long>(s.max_concurrent));
    if (conc < 1 || conc > INT_MAX)
        throw ConfigValidationError("'batch.max_concurrent' must be between 1 and " +
                                    std::to_string(INT_MAX));
    s.max_concurrent = static_cast<size_t>(conc);
    s.retry_on_failure = get_bool(*batch, "retry_on_failure", p, s.retry_on_failure);
    long long retries = get_int(*batch, "max_retries", p, s.max_retries);
    if (retries < 0 || retries > INT_MAX)
        throw ConfigValidationError("'batch.max_retries' must be between 0 and " +
                                    std::to_string(INT_MAX));
    s.max_retries = static_cast<int>(retries);
    s.retry_delay = get_seconds(*batch, "retry_delay", p, s.retry_delay);
    s.transfer_timeout = get_seconds(*batch, "timeout", p, s.transfer_timeout);
    if (s.transfer_timeout.count() < 1)
        throw ConfigValidationError("'batch.timeout' must be at least 1 second");
    return s;
}

LoggingSettings parse_logging(const json& root) {
    LoggingSettings l;
    const json* node = find_field(root, "logging");
    if (!node)
        return l;
    if (!node->is_object())
        throw ConfigValidationError("'logging' must be a mapping");
    const std::string p = "logging.";
    if (auto level = get_string(*node, "level", p)) {
        if (!parse_log_level(*level, l.level))
            throw ConfigValidationError("unknown log level '" + *level + "' in 'logging.level'");
    }
    if (auto file = get_string(*node, "file", p))
        l.file = *file;
    l.json = get_bool(*node, "json", p, l.json);
    if (auto size = get_string(*node, "max_size", p)) {
        bool ok = false;
        l.max_size = parse_bytes(*size, ok);
        if (!ok)
            throw ConfigValidationError("invalid size '" + *size + "' in 'logging.max_size'");
    }
    long long files = get_int(*node, "max_files", p, static_cast<long long>(l.max_files));
    if (files < 1 || files > INT_MAX)
        throw ConfigValidationError("'logging.max_files' must be between 1 and " +
                                    std::to_string(INT_MAX));
    l.max_files = static_cast<size_t>(files);
    l.compress = get_bool(*node, "compress", p, l.compress);
    l.syslog = get_bool(*node, "syslog", p, l.syslog);
    return l;
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs)
        throw ConfigValidationError("cannot open configuration file: " + path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool has_json_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

} // namespace

std::string expand_env_vars(const std::string& value, const std::string& field) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);
        size_t end = value.find('}', start + 2);
        if (end == std::string::npos)
            throw ConfigValidationError("unterminated variable reference in '" + field + "'");
        const std::string name = value.substr(start + 2, end - start - 2);
        auto env = procutil::get_env(name);
        if (name.empty() || !env)
            throw ConfigValidationError("environment variable '" + name +
                                        "' referenced by '" + field + "' is not defined");
        out += *env;
        pos = end + 1;
    }
    return out;
}

void ensure_unique_names(const std::vector<MigrationTask>& tasks) {
    std::set<std::string> seen;
    for (const auto& t : tasks) {
        if (!seen.insert(t.name).second)
            throw ConfigValidationError("duplicate migration name '" + t.name + "'");
    }
}

TaskCatalog build_catalog(const json& root) {
    if (!root.is_object())
        throw ConfigValidationError("configuration root must be a mapping");
    const json* migrations = find_field(root, "migrations");
    if (!migrations)
        throw ConfigValidationError("missing required section 'migrations'");
    if (!migrations->is_array())
        throw ConfigValidationError("'migrations' must be a list");
    if (migrations->empty())
        throw ConfigValidationError("'migrations' must contain at least one entry");

    TaskCatalog catalog;
    for (size_t i = 0; i < migrations->size(); ++i)
        catalog.tasks.push_back(parse_task((*migrations)[i], i));
    ensure_unique_names(catalog.tasks);
    catalog.settings = parse_batch(root);
    catalog.logging = parse_logging(root);
    return catalog;
}

TaskCatalog parse_yaml_catalog(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigValidationError(std::string("invalid YAML: ") + e.what());
    }
    return build_catalog(yaml_to_json(root));
}

TaskCatalog parse_json_catalog(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigValidationError(std::string("invalid JSON: ") + e.what());
    }
    return build_catalog(root);
}

TaskCatalog load_task_catalog(const std::string& path, bool force_json) {
    const std::string text = read_file(path);
    if (force_json || has_json_extension(path))
        return parse_json_catalog(text);
    return parse_yaml_catalog(text);
}

} // namespace gitmigrate
