#include "slug_filter.hpp"

#include <algorithm>
#include <stdexcept>

namespace iscan {

namespace {

constexpr const char *kRegexPrefix = "regex:";

/// Translate a `*`/`?` glob into an anchored regular expression.
std::regex glob_to_regex(const std::string &glob) {
  std::string rx = "^";
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx);
}

} // namespace

SlugFilter::Pattern SlugFilter::compile(const std::string &pattern) {
  if (pattern.empty()) {
    throw std::invalid_argument("Empty repository pattern");
  }
  Pattern out{pattern, std::nullopt};
  if (pattern.rfind(kRegexPrefix, 0) == 0) {
    try {
      out.regex = std::regex(pattern.substr(std::string(kRegexPrefix).size()));
    } catch (const std::regex_error &e) {
      throw std::invalid_argument("Invalid repository regex '" + pattern +
                                  "': " + e.what());
    }
  } else if (pattern.find_first_of("*?") != std::string::npos) {
    out.regex = glob_to_regex(pattern);
  }
  return out;
}

bool SlugFilter::Pattern::matches(const std::string &slug) const {
  if (regex)
    return std::regex_search(slug, *regex);
  return slug == text;
}

SlugFilter::SlugFilter(const std::vector<std::string> &include,
                       const std::vector<std::string> &exclude) {
  include_.reserve(include.size());
  for (const auto &p : include)
    include_.push_back(compile(p));
  exclude_.reserve(exclude.size());
  for (const auto &p : exclude)
    exclude_.push_back(compile(p));
}

bool SlugFilter::allows(const std::string &slug) const {
  auto hit = [&slug](const Pattern &p) { return p.matches(slug); };
  if (std::any_of(exclude_.begin(), exclude_.end(), hit))
    return false;
  return include_.empty() || std::any_of(include_.begin(), include_.end(), hit);
}

} // namespace iscan
