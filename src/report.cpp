#include "report.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "credential_resolver.hpp"
#include "time_utils.hpp"

using namespace gitmigrate;

ReportColors make_report_colors(bool no_colors) {
    if (no_colors)
        return {};
    return {"\033[0m", "\033[32m", "\033[33m", "\033[31m", "\033[36m", "\033[1m"};
}

std::string render_progress(size_t completed, size_t total) {
    std::ostringstream out;
    double pct = total ? (static_cast<double>(completed) * 100.0 / static_cast<double>(total)) : 100.0;
    out << "Progress: [" << completed << "/" << total << "] " << std::fixed
        << std::setprecision(1) << pct << "%";
    return out.str();
}

std::string render_summary(const BatchResult& result, const ReportColors& colors) {
    const std::string rule(50, '=');
    std::ostringstream out;
    out << "\n" << rule << "\n";
    out << colors.bold << "=== MIGRATION SUMMARY ===" << colors.reset << "\n";
    out << rule << "\n";
    out << "Total repositories: " << result.total << "\n";
    out << colors.green << "Succeeded: " << result.success << colors.reset << "\n";
    out << (result.failed ? colors.red : colors.green) << "Failed: " << result.failed
        << colors.reset << "\n";
    if (!result.failed_names.empty()) {
        out << "\nFailed repositories:\n";
        for (const auto& name : result.failed_names) {
            out << "  - " << name;
            if (const TaskOutcome* d = result.find(name)) {
                out << colors.yellow << " (" << failure_kind_name(d->failure) << ", attempt "
                    << d->attempt << ")" << colors.reset;
            }
            out << "\n";
        }
    }
    out << rule << "\n";
    return out.str();
}

std::string render_plan(const TaskCatalog& catalog, const ReportColors& colors) {
    const auto& s = catalog.settings;
    std::ostringstream out;
    out << colors.bold << "Migration plan (" << catalog.tasks.size() << " repositories)"
        << colors.reset << "\n";
    out << "  max concurrent: " << s.max_concurrent << ", retries: "
        << (s.retry_on_failure ? std::to_string(s.max_retries) : std::string("off"))
        << ", retry delay: " << format_duration_short(s.retry_delay)
        << ", timeout: " << format_duration_short(s.transfer_timeout) << "\n";
    for (const auto& t : catalog.tasks) {
        out << colors.cyan << t.name << colors.reset << "\n";
        out << "  from " << redact_url(t.source.url) << " [" << t.source.branch << "] auth="
            << auth_kind_name(t.source.auth) << "\n";
        out << "  to   " << redact_url(t.destination.url)
            << " auth=" << auth_kind_name(t.destination.auth) << "\n";
        for (const auto& kv : t.options)
            out << "  option " << kv.first << "=" << kv.second << "\n";
    }
    return out.str();
}

nlohmann::json result_to_json(const BatchResult& result) {
    nlohmann::json details = nlohmann::json::array();
    for (const auto& d : result.details) {
        nlohmann::json j{{"name", d.name},
                         {"success", d.success},
                         {"attempt", d.attempt},
                         {"retry", d.retry}};
        if (!d.success)
            j["failure"] = failure_kind_name(d.failure);
        if (d.error)
            j["error"] = *d.error;
        details.push_back(std::move(j));
    }
    return {{"total", result.total},
            {"success", result.success},
            {"failed", result.failed},
            {"failed_migrations", result.failed_names},
            {"details", std::move(details)}};
}

void write_report(const std::filesystem::path& path, const BatchResult& result) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("cannot write report: " + path.string());
    ofs << result_to_json(result).dump(2) << "\n";
    if (!ofs)
        throw std::runtime_error("cannot write report: " + path.string());
}
