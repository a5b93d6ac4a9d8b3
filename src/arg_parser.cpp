#include "arg_parser.hpp"

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map,
                     const std::set<std::string>& value_flags)
    : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
    bool only_positional = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (only_positional) {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }
        std::string key;
        std::string inline_value;
        bool has_inline = false;
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            key = arg.substr(0, eq);
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                has_inline = true;
            }
        } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
            key = short_map_.at(arg[1]);
            if (arg.size() > 2) {
                inline_value = arg[2] == '=' ? arg.substr(3) : arg.substr(2);
                has_inline = true;
            }
        } else if (arg.size() >= 2 && arg[0] == '-') {
            unknown_flags_.push_back(arg);
            continue;
        } else {
            positional_.push_back(arg);
            continue;
        }

        if (!value_flags_.count(key)) {
            add(key, has_inline ? &inline_value : nullptr);
            continue;
        }
        if (has_inline) {
            add(key, &inline_value);
        } else if (i + 1 < argc) {
            std::string next = argv[++i];
            add(key, &next);
        } else {
            missing_values_.push_back(key);
        }
    }
}

void ArgParser::add(const std::string& key, const std::string* value) {
    if (!known_flags_.empty() && !known_flags_.count(key)) {
        unknown_flags_.push_back(key);
        return;
    }
    flags_.insert(key);
    if (value)
        options_[key] = *value;
}
