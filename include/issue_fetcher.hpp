/**
 * @file issue_fetcher.hpp
 * @brief Fetch the raw issue list of a repository through `gh api`.
 */
#ifndef ISSUESCAN_ISSUE_FETCHER_HPP
#define ISSUESCAN_ISSUE_FETCHER_HPP

#include "process.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace iscan {

/// Raised when the issues of one repository cannot be fetched.
class FetchError : public std::runtime_error {
public:
  /// Reason for the failure.
  enum class Kind {
    LaunchFailed,  ///< `gh` could not be started
    CommandFailed, ///< `gh` exited with a non-zero status
    TimedOut,      ///< `gh` exceeded the configured timeout
    Cancelled,     ///< The scan was cancelled while `gh` ran
    Decode         ///< Output was not UTF-8 or not a JSON array
  };

  FetchError(Kind kind, const std::string &slug, const std::string &detail)
      : std::runtime_error(slug + ": " + detail), kind_(kind), slug_(slug) {}

  Kind kind() const noexcept { return kind_; }
  const std::string &slug() const noexcept { return slug_; }

private:
  Kind kind_;
  std::string slug_;
};

/// `gh` succeeded but its output could not be decoded.
class FetchDecodeError : public FetchError {
public:
  FetchDecodeError(const std::string &slug, const std::string &detail)
      : FetchError(Kind::Decode, slug, detail) {}
};

/**
 * Source of raw issue data for a repository slug.
 */
class IssueSource {
public:
  virtual ~IssueSource() = default;

  /**
   * Fetch the first page of `repos/{slug}/issues`.
   *
   * Implementations must be safe to call from several threads at once.
   *
   * @param slug Repository in `owner/repo` form.
   * @return JSON array of raw issue objects.
   * @throws FetchError When the request fails or its output is unusable.
   */
  virtual nlohmann::json fetch_issues(const std::string &slug) = 0;
};

/**
 * IssueSource backed by `gh api`, relying on gh's stored credentials.
 */
class GhIssueSource : public IssueSource {
public:
  /**
   * @param gh Wrapper used to run `gh`.
   * @param state Optional `state` query value (`open`, `closed`, `all`).
   *        Empty leaves the API default.
   */
  explicit GhIssueSource(GhCli gh, std::string state = "");

  nlohmann::json fetch_issues(const std::string &slug) override;

  /// Arguments passed to `gh` for @p slug.
  std::vector<std::string> request_args(const std::string &slug) const;

private:
  GhCli gh_;
  std::string state_;
};

/**
 * Decode the stdout of `gh api` into a JSON array.
 *
 * @throws FetchDecodeError When @p body is not UTF-8, not JSON, or not an
 *         array.
 */
nlohmann::json decode_issue_payload(const std::string &slug,
                                    const std::string &body);

} // namespace iscan

#endif // ISSUESCAN_ISSUE_FETCHER_HPP
