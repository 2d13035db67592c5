/**
 * @file slug_filter.hpp
 * @brief Include/exclude filtering of repository slugs.
 */
#ifndef ISSUESCAN_SLUG_FILTER_HPP
#define ISSUESCAN_SLUG_FILTER_HPP

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace iscan {

/**
 * Decides which repositories are scanned.
 *
 * Patterns are matched against the full `owner/repo` slug and may be:
 * - an exact slug (`octo/widgets`)
 * - a glob using `*` and `?` (`octo/*`)
 * - a regular expression prefixed with `regex:` (`regex:^octo/.+-api$`)
 *
 * An empty include list allows every slug. Exclusions always win.
 */
class SlugFilter {
public:
  SlugFilter() = default;

  /**
   * @throws std::invalid_argument When a `regex:` pattern does not compile or
   *         a pattern is empty.
   */
  SlugFilter(const std::vector<std::string> &include,
             const std::vector<std::string> &exclude);

  /// Whether @p slug should be scanned.
  bool allows(const std::string &slug) const;

  /// True when no patterns are configured.
  bool empty() const { return include_.empty() && exclude_.empty(); }

private:
  struct Pattern {
    std::string text;
    std::optional<std::regex> regex;

    bool matches(const std::string &slug) const;
  };

  static Pattern compile(const std::string &pattern);

  std::vector<Pattern> include_;
  std::vector<Pattern> exclude_;
};

} // namespace iscan

#endif // ISSUESCAN_SLUG_FILTER_HPP
