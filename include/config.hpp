#ifndef ISSUESCAN_CONFIG_HPP
#define ISSUESCAN_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace iscan {

/**
 * Directory holding per-user state: `$ISSUESCAN_CONFIG_ROOT` when set,
 * otherwise `$HOME/.claude`. Empty when neither variable is available.
 */
std::string default_config_root();

/// `<default_config_root()>/projects`, or empty when no root is known.
std::string default_projects_root();

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Directory whose subdirectories are scanned.
  const std::string &projects_root() const { return projects_root_; }

  /// Set the directory to scan.
  void set_projects_root(const std::string &root) { projects_root_ = root; }

  /// Name or path of the `gh` executable.
  const std::string &gh_path() const { return gh_path_; }

  /// Set the `gh` executable.
  void set_gh_path(const std::string &path) { gh_path_ = path; }

  /// Per-invocation timeout for `gh` (zero disables it).
  std::chrono::milliseconds fetch_timeout() const { return fetch_timeout_; }

  /// Set the `gh` timeout.
  void set_fetch_timeout(std::chrono::milliseconds timeout) {
    fetch_timeout_ = timeout.count() < 0 ? std::chrono::milliseconds{0}
                                         : timeout;
  }

  /// Number of repositories fetched concurrently.
  int workers() const { return workers_; }

  /// Set concurrent fetches (minimum 1).
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// `state` query sent to the issues endpoint; empty uses GitHub's default.
  const std::string &issue_state() const { return issue_state_; }

  /**
   * Set the issue state filter.
   * @throws std::invalid_argument Unless @p state is empty, `open`, `closed`
   *         or `all`.
   */
  void set_issue_state(const std::string &state);

  /// Whether pull requests returned by the issues endpoint are dropped.
  bool skip_pull_requests() const { return skip_pull_requests_; }

  /// Enable or disable dropping pull requests.
  void set_skip_pull_requests(bool skip) { skip_pull_requests_ = skip; }

  /// Slug patterns to scan; empty means all.
  const std::vector<std::string> &include_repos() const {
    return include_repos_;
  }

  /// Set slug patterns to scan.
  void set_include_repos(const std::vector<std::string> &repos) {
    include_repos_ = repos;
  }

  /// Slug patterns never scanned.
  const std::vector<std::string> &exclude_repos() const {
    return exclude_repos_;
  }

  /// Set slug patterns to skip.
  void set_exclude_repos(const std::vector<std::string> &repos) {
    exclude_repos_ = repos;
  }

  /// Listing format name (`json`, `text`, `csv`).
  const std::string &output_format() const { return output_format_; }

  /// Set listing format name.
  void set_output_format(const std::string &format) { output_format_ = format; }

  /// File receiving the listing; empty writes to stdout.
  const std::string &output_file() const { return output_file_; }

  /// Set the listing destination file.
  void set_output_file(const std::string &file) { output_file_ = file; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path of the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Category specific log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace category specific log level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /**
   * Load configuration from a file; the format follows the extension.
   * @throws std::runtime_error On I/O, parse or format errors.
   */
  static Config from_file(const std::string &path);

  /// Build a configuration from an already parsed JSON document.
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  std::string projects_root_{default_projects_root()};
  std::string gh_path_{"gh"};
  std::chrono::milliseconds fetch_timeout_{std::chrono::seconds{60}};
  int workers_{1};
  std::string issue_state_;
  bool skip_pull_requests_{false};
  std::vector<std::string> include_repos_;
  std::vector<std::string> exclude_repos_;
  std::string output_format_{"json"};
  std::string output_file_;
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace iscan

#endif // ISSUESCAN_CONFIG_HPP
