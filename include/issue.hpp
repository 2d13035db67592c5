/**
 * @file issue.hpp
 * @brief Canonical issue record produced by a scan.
 */
#ifndef ISSUESCAN_ISSUE_HPP
#define ISSUESCAN_ISSUE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace iscan {

/// A GitHub issue belonging to one of the scanned repositories.
struct Issue {
  std::string repo;                ///< `owner/repo` slug used for the fetch
  int number{0};                   ///< Issue number within the repository
  std::string title;               ///< Issue title
  std::string url;                 ///< Web URL of the issue
  std::string state;               ///< State reported by GitHub
  std::vector<std::string> labels; ///< Label names in API order
};

bool operator==(const Issue &a, const Issue &b);
bool operator!=(const Issue &a, const Issue &b);

/// Serialize as `{repo, number, title, url, state, labels}`.
void to_json(nlohmann::json &j, const Issue &issue);

/// Inverse of to_json; used when reading exported listings back.
void from_json(const nlohmann::json &j, Issue &issue);

} // namespace iscan

#endif // ISSUESCAN_ISSUE_HPP
