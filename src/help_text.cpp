#include "options.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--config-json", "", "", "Read the configuration file as JSON", "Basics"},
        {"--dry-run", "", "", "Print the migration plan and exit", "Basics"},
        {"--no-preflight", "", "", "Skip destination reachability checks", "Basics"},
        {"--report", "", "<file>", "Write the final result as JSON", "Basics"},
        {"--concurrency", "-n", "<n>", "Maximum concurrent migrations", "Batch"},
        {"--max-retries", "", "<n>", "Retries per failed migration", "Batch"},
        {"--retry-delay", "", "<N[s|m|h]>", "Delay before each retry", "Batch"},
        {"--no-retry", "", "", "Do not retry failed migrations", "Batch"},
        {"--timeout", "", "<N[s|m|h]>", "Time limit of each fetch or push", "Batch"},
        {"--workspace", "", "<dir>", "Parent directory for temporary mirrors", "Batch"},
        {"--log-file", "-l", "<path>", "File for general logs", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--silent", "-s", "", "Disable console output", "Display"},
        {"--no-colors", "", "", "Disable ANSI colors", "Display"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    auto label = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, label(o).size());
    }

    std::cout << "gitmigrate - Batch Git repository migration\n";
    std::cout << "Mirrors every repository listed in a YAML or JSON file from its source\n";
    std::cout << "to its destination, with bounded concurrency and retries.\n\n";
    std::cout << "Usage: " << prog << " [config.yaml] [options]\n\n";
    const std::vector<std::string> order{"Basics", "Batch", "Logging", "Display"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat])
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << label(*o)
                      << o->desc << "\n";
        std::cout << "\n";
    }
    std::cout << "Exit status: 0 all migrations succeeded, 1 some failed, 2 configuration error\n";
}
