/**
 * @file app.hpp
 * @brief Command line and configuration front end for issuescan.
 *
 * App parses the command line, loads the optional configuration file, merges
 * both into one effective Config and sets up logging.
 */

#ifndef ISSUESCAN_APP_HPP
#define ISSUESCAN_APP_HPP

#include "cli.hpp"
#include "config.hpp"

namespace iscan {

/**
 * Resolves the settings for a run. The scan itself is driven by `main`.
 */
class App {
public:
  /**
   * Parse @p argv, load the configuration and initialize logging.
   *
   * @return Zero on success. Non-zero when execution should stop, for
   *         example after `--help` or on an unreadable configuration file.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /**
   * Effective configuration: explicit CLI flags override file values, which
   * override built-in defaults.
   */
  const Config &config() const { return config_; }

  /// Whether the caller should return run()'s result without scanning.
  bool should_exit() const { return should_exit_; }

private:
  void merge_cli_options();
  void setup_logging();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace iscan

#endif // ISSUESCAN_APP_HPP
