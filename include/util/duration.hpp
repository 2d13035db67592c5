/**
 * @file duration.hpp
 * @brief Parse durations such as "90s", "2m" or "1m30s".
 */
#ifndef ISSUESCAN_UTIL_DURATION_HPP
#define ISSUESCAN_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace iscan {

/**
 * Parse a duration made of number/unit pairs. Units are `ms`, `s`, `m` and
 * `h`; a bare number means seconds. An empty string is zero.
 *
 * @throws std::invalid_argument On a malformed string or unknown unit.
 */
std::chrono::milliseconds parse_duration(const std::string &text);

} // namespace iscan

#endif // ISSUESCAN_UTIL_DURATION_HPP
