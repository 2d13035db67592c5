#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace {

constexpr long long kMaxMs = std::numeric_limits<long long>::max();

[[noreturn]] void out_of_range(const std::string &text) {
  throw std::invalid_argument("Duration '" + text + "' is too large");
}

/// Add @p value units of @p unit_ms to @p total, rejecting overflow.
void accumulate(long long &total, long long value, long long unit_ms,
                const std::string &text) {
  if (value > kMaxMs / unit_ms)
    out_of_range(text);
  long long part = value * unit_ms;
  if (total > kMaxMs - part)
    out_of_range(text);
  total += part;
}

} // namespace

namespace iscan {

std::chrono::milliseconds parse_duration(const std::string &text) {
  using std::chrono::milliseconds;
  if (text.empty())
    return milliseconds{0};

  long long total_ms = 0;
  bool had_unit = false;
  std::size_t i = 0;
  while (i < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("Invalid duration '" + text + "'");
    }
    long long value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      int digit = text[i] - '0';
      if (value > (kMaxMs - digit) / 10)
        out_of_range(text);
      value = value * 10 + digit;
      ++i;
    }
    std::size_t unit_start = i;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i])))
      ++i;
    std::string unit = text.substr(unit_start, i - unit_start);
    for (auto &c : unit)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (unit.empty()) {
      // "90" is seconds, but "1m30" is ambiguous.
      if (had_unit)
        throw std::invalid_argument("Missing unit in duration '" + text + "'");
      accumulate(total_ms, value, 1000, text);
      continue;
    }
    had_unit = true;
    if (unit == "ms") {
      accumulate(total_ms, value, 1, text);
    } else if (unit == "s") {
      accumulate(total_ms, value, 1000, text);
    } else if (unit == "m") {
      accumulate(total_ms, value, 60 * 1000, text);
    } else if (unit == "h") {
      accumulate(total_ms, value, 60 * 60 * 1000, text);
    } else {
      throw std::invalid_argument("Unknown duration unit '" + unit + "' in '" +
                                  text + "'");
    }
  }
  return milliseconds{total_ms};
}

} // namespace iscan
