#include "system_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace procutil {

static std::string sanitize_label(const std::string& label) {
    std::string out;
    for (char c : label) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.')
            out += c;
        else
            out += '_';
    }
    if (out.empty() || out[0] == '.')
        out.insert(out.begin(), 'w');
    if (out.size() > 48)
        out.resize(48);
    return out;
}

TempWorkspace::TempWorkspace(const fs::path& parent, const std::string& label) {
    fs::create_directories(parent);
    std::string tmpl = (parent / ("gitmigrate-" + sanitize_label(label) + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        int err = errno;
        throw fs::filesystem_error("cannot create workspace", parent,
                                   std::error_code(err, std::generic_category()));
    }
    path_ = fs::path(buf.data());
}

TempWorkspace::~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v)
        return std::string(v);
    return std::nullopt;
}

fs::path expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~')
        return fs::path(path);
    if (path.size() > 1 && path[1] != '/')
        return fs::path(path);
    auto home = get_env("HOME");
    if (!home || home->empty())
        return fs::path(path);
    return fs::path(*home) / path.substr(path.size() > 1 ? 2 : 1);
}

} // namespace procutil
