#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "arg_parser.hpp"

// Numeric and unit parsers shared by the command line and the task catalog.
// None of them throw: on bad input @p ok is cleared and a zero value returned.

/// Signed decimal in [min, max]. The whole string must be consumed.
int parse_int(const std::string& value, int min, int max, bool& ok);
int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok);

/// Unsigned decimal in [min, max]. Signs and whitespace are rejected.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);
size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok);

/**
 * Byte count such as "512", "64k" or "10MB".
 *
 * Units K, M, G and T are powers of 1024, case-insensitive, with an optional
 * trailing B. The result must lie in [min, max].
 */
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);
size_t parse_bytes(const std::string& value, bool& ok);
size_t parse_bytes(const ArgParser& parser, const std::string& flag, bool& ok);

/**
 * Non-negative duration such as "30", "45s", "5m" or "2h".
 *
 * A bare number is taken as seconds.
 */
std::chrono::seconds parse_duration(const std::string& value, bool& ok);
std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok);

#endif // PARSE_UTILS_HPP
