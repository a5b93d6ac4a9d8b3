#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Current local time formatted as YYYY-MM-DD HH:MM:SS.mmm.
 */
std::string timestamp();

/**
 * @brief Format a duration as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Format a duration with millisecond precision, e.g. 2m5.120s.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
