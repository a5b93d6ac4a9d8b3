#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return std::string(out);
}

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count();
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = (total / 3600) % 24;
    long long d = total / 86400;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (h > 0 || d > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0 || d > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(dur);
    long long frac = (dur - secs).count();
    long long m = secs.count() / 60;
    long long s = secs.count() % 60;
    char buf[48];
    if (m > 0)
        std::snprintf(buf, sizeof(buf), "%lldm%lld.%03llds", m, s, frac);
    else
        std::snprintf(buf, sizeof(buf), "%lld.%03llds", s, frac);
    return std::string(buf);
}
