/**
 * @file issue_normalizer.hpp
 * @brief Convert raw GitHub issue JSON into Issue records.
 *
 * Records missing a required field are dropped rather than reported as
 * errors, so one malformed entry never spoils the rest of a batch.
 */
#ifndef ISSUESCAN_ISSUE_NORMALIZER_HPP
#define ISSUESCAN_ISSUE_NORMALIZER_HPP

#include "issue.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace iscan {

/**
 * Fields decoded from one element of the `repos/{slug}/issues` response.
 *
 * `number`, `title`, `html_url` and `state` are required; `labels` and the
 * pull request marker are optional.
 */
struct RawIssueFields {
  int number{0};
  std::string title;
  std::string html_url;
  std::string state;
  std::vector<std::string> labels;
  bool is_pull_request{false};
};

/// Knobs applied while normalizing.
struct NormalizeOptions {
  bool skip_pull_requests{false}; ///< Drop records carrying `pull_request`
};

/**
 * Decode the fields of one raw record.
 *
 * @return Decoded fields, or `std::nullopt` when a required field is missing
 *         or has the wrong type.
 */
std::optional<RawIssueFields> decode_issue_fields(const nlohmann::json &raw);

/**
 * Names of the labels in @p raw's `labels` array. Entries without a string
 * `name` are skipped; an absent or non-array `labels` yields an empty list.
 */
std::vector<std::string> extract_label_names(const nlohmann::json &raw);

/**
 * Normalize a single record.
 *
 * @param raw Element of the API response.
 * @param repo Slug the record was fetched for.
 * @return The issue, or `std::nullopt` when the record is dropped.
 */
std::optional<Issue> normalize_issue(const nlohmann::json &raw,
                                     const std::string &repo,
                                     const NormalizeOptions &options = {});

/// Result of normalizing a whole response.
struct NormalizedBatch {
  std::vector<Issue> issues; ///< Accepted records in response order
  std::size_t dropped{0};    ///< Records that were skipped
};

/**
 * Normalize every element of @p raw_issues (a JSON array) in order.
 * Non-array input yields an empty batch.
 */
NormalizedBatch normalize_issues(const nlohmann::json &raw_issues,
                                 const std::string &repo,
                                 const NormalizeOptions &options = {});

} // namespace iscan

#endif // ISSUESCAN_ISSUE_NORMALIZER_HPP
