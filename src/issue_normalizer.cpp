#include "issue_normalizer.hpp"
#include "log.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> normalize_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("normalize");
  }();
  return logger;
}

const nlohmann::json *member(const nlohmann::json &object,
                             const char *key) {
  if (!object.is_object())
    return nullptr;
  auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

std::optional<std::string> string_field(const nlohmann::json &object,
                                        const char *key) {
  const auto *value = member(object, key);
  if (value == nullptr || !value->is_string())
    return std::nullopt;
  return value->get<std::string>();
}

/// Integer field that fits in an int. Floats and booleans are rejected.
std::optional<int> int_field(const nlohmann::json &object, const char *key) {
  const auto *value = member(object, key);
  if (value == nullptr || !value->is_number_integer())
    return std::nullopt;
  if (value->is_number_unsigned()) {
    auto v = value->get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
      return std::nullopt;
    return static_cast<int>(v);
  }
  auto v = value->get<std::int64_t>();
  if (v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max())
    return std::nullopt;
  return static_cast<int>(v);
}

} // namespace

std::vector<std::string> extract_label_names(const nlohmann::json &raw) {
  std::vector<std::string> names;
  const auto *labels = member(raw, "labels");
  if (labels == nullptr || !labels->is_array())
    return names;
  for (const auto &label : *labels) {
    if (auto name = string_field(label, "name"))
      names.push_back(std::move(*name));
  }
  return names;
}

std::optional<RawIssueFields> decode_issue_fields(const nlohmann::json &raw) {
  RawIssueFields fields;
  auto number = int_field(raw, "number");
  if (!number)
    return std::nullopt;
  fields.number = *number;
  auto title = string_field(raw, "title");
  if (!title)
    return std::nullopt;
  fields.title = std::move(*title);
  auto url = string_field(raw, "html_url");
  if (!url)
    return std::nullopt;
  fields.html_url = std::move(*url);
  auto state = string_field(raw, "state");
  if (!state)
    return std::nullopt;
  fields.state = std::move(*state);

  fields.labels = extract_label_names(raw);
  fields.is_pull_request = member(raw, "pull_request") != nullptr;
  return fields;
}

std::optional<Issue> normalize_issue(const nlohmann::json &raw,
                                     const std::string &repo,
                                     const NormalizeOptions &options) {
  auto fields = decode_issue_fields(raw);
  if (!fields)
    return std::nullopt;
  if (options.skip_pull_requests && fields->is_pull_request)
    return std::nullopt;
  Issue issue;
  issue.repo = repo;
  issue.number = fields->number;
  issue.title = std::move(fields->title);
  issue.url = std::move(fields->html_url);
  issue.state = std::move(fields->state);
  issue.labels = std::move(fields->labels);
  return issue;
}

NormalizedBatch normalize_issues(const nlohmann::json &raw_issues,
                                 const std::string &repo,
                                 const NormalizeOptions &options) {
  NormalizedBatch batch;
  if (!raw_issues.is_array())
    return batch;
  batch.issues.reserve(raw_issues.size());
  for (const auto &raw : raw_issues) {
    if (auto issue = normalize_issue(raw, repo, options)) {
      batch.issues.push_back(std::move(*issue));
    } else {
      ++batch.dropped;
    }
  }
  if (batch.dropped > 0) {
    normalize_log()->debug("{}: dropped {} of {} records", repo,
                           batch.dropped, raw_issues.size());
  }
  return batch;
}

} // namespace iscan
