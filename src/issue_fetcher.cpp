/**
 * @file issue_fetcher.cpp
 * @brief Runs `gh api repos/{slug}/issues` and decodes its output.
 */
#include "issue_fetcher.hpp"
#include "log.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> fetch_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("fetch");
  }();
  return logger;
}

/// First line of @p text, for compact log and error messages.
std::string first_line(const std::string &text) {
  auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

nlohmann::json decode_issue_payload(const std::string &slug,
                                    const std::string &body) {
  // The parser rejects ill-formed UTF-8 inside strings as well.
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw FetchDecodeError(slug, std::string("failed to parse gh output: ") +
                                     e.what());
  }
  if (!parsed.is_array()) {
    throw FetchDecodeError(slug, std::string("expected a JSON array, got ") +
                                     parsed.type_name());
  }
  return parsed;
}

GhIssueSource::GhIssueSource(GhCli gh, std::string state)
    : gh_(std::move(gh)), state_(std::move(state)) {}

std::vector<std::string>
GhIssueSource::request_args(const std::string &slug) const {
  std::string endpoint = "repos/" + slug + "/issues";
  if (!state_.empty())
    endpoint += "?state=" + state_;
  return {"api", endpoint};
}

nlohmann::json GhIssueSource::fetch_issues(const std::string &slug) {
  auto args = request_args(slug);
  fetch_log()->debug("Running {} {} {}", gh_.executable(), args[0], args[1]);
  CommandResult result;
  try {
    result = gh_.invoke(args);
  } catch (const std::system_error &e) {
    throw FetchError(FetchError::Kind::LaunchFailed, slug, e.what());
  }
  if (result.cancelled) {
    throw FetchError(FetchError::Kind::Cancelled, slug, "cancelled");
  }
  if (result.timed_out) {
    throw FetchError(FetchError::Kind::TimedOut, slug,
                     gh_.executable() + " timed out");
  }
  if (result.exit_code != 0) {
    fetch_log()->debug("{} stderr: {}", slug, result.err);
    std::string detail = gh_.executable() + " exited with status " +
                         std::to_string(result.exit_code);
    if (!result.err.empty())
      detail += ": " + first_line(result.err);
    throw FetchError(FetchError::Kind::CommandFailed, slug, detail);
  }
  auto issues = decode_issue_payload(slug, result.out);
  fetch_log()->debug("{}: received {} raw issue(s)", slug, issues.size());
  return issues;
}

} // namespace iscan
