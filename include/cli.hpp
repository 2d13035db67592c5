/**
 * @file cli.hpp
 * @brief Command line parsing for issuescan.
 */

#ifndef ISSUESCAN_CLI_HPP
#define ISSUESCAN_CLI_HPP

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace iscan {

/**
 * Signals that CLI parsing requested an immediate exit (help, version or a
 * usage error). Carries the exit code back to `main` without treating it as
 * a failure of the scan itself.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Every setting that may also come from the configuration file has an
 * `_explicit` companion so the caller can apply CLI > config > default.
 */
struct CliOptions {
  bool verbose{false};     ///< Shortcut for `--log-level debug`
  std::string config_file; ///< Optional YAML/TOML/JSON configuration

  // Logging
  std::string log_level{"info"};
  bool log_level_explicit{false};
  std::string log_file;
  int log_rotate{3};
  bool log_rotate_explicit{false};
  bool log_compress{false};
  bool log_compress_explicit{false};
  std::unordered_map<std::string, std::string> log_categories;
  bool log_categories_explicit{false};

  // Scan
  std::string projects_root;       ///< Empty uses config or default root
  std::string gh_path;             ///< Empty uses config or `gh`
  std::chrono::milliseconds fetch_timeout{0};
  bool fetch_timeout_explicit{false};
  int workers{1};
  bool workers_explicit{false};
  std::string issue_state;
  bool issue_state_explicit{false};
  bool skip_pull_requests{false};  ///< Only ever turns the setting on
  std::vector<std::string> include_repos;
  std::vector<std::string> exclude_repos;

  // Output
  std::string output_file;
  std::string output_format;       ///< Empty uses config or `json`

  // `issuescan gh <args...>`
  bool gh_passthrough{false};
  std::vector<std::string> gh_args;
};

/**
 * Parse command line arguments.
 *
 * @throws CliParseExit For `--help`, `--version` and usage errors, after
 *         CLI11 printed its message.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace iscan

#endif // ISSUESCAN_CLI_HPP
