#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <stdexcept>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::logic_error&) {
        return 0;
    }
}

int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_int(parser.get_option(flag), min, max, ok);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        return 0;
    }
}

size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_size_t(parser.get_option(flag), min, max, ok);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    unsigned long long mult = 1;
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        case 't':
            mult = 1024ull * 1024 * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::logic_error&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

size_t parse_bytes(const std::string& value, bool& ok) {
    return parse_bytes(value, 0, SIZE_MAX, ok);
}

size_t parse_bytes(const ArgParser& parser, const std::string& flag, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_bytes(parser.get_option(flag), ok);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h') {
        num.pop_back();
    } else if (std::isdigit(static_cast<unsigned char>(unit))) {
        unit = 's';
    } else {
        return std::chrono::seconds(0);
    }
    if (!all_digits(num))
        return std::chrono::seconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::logic_error&) {
        return std::chrono::seconds(0);
    }
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    default:
        return std::chrono::seconds(n);
    }
}

std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return std::chrono::seconds(0);
    }
    return parse_duration(parser.get_option(flag), ok);
}
