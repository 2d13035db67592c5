#include "app.hpp"
#include "log.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace iscan {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Parse the command line, then load and merge the configuration file.
 *
 * @return Zero when the scan should proceed or CLI parsing asked for a clean
 *         exit; otherwise the exit code to report.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  config_ = Config{};
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("{}", e.what());
      should_exit_ = true;
      return 1;
    }
  }
  merge_cli_options();
  setup_logging();
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  if (options_.gh_passthrough) {
    app_log()->debug("Passing {} argument(s) to {}", options_.gh_args.size(),
                     config_.gh_path());
  } else {
    app_log()->debug("Scanning {} with {} worker(s)", config_.projects_root(),
                     config_.workers());
  }
  return 0;
}

void App::merge_cli_options() {
  if (!options_.projects_root.empty()) {
    config_.set_projects_root(options_.projects_root);
  }
  if (!options_.gh_path.empty()) {
    config_.set_gh_path(options_.gh_path);
  }
  if (options_.fetch_timeout_explicit) {
    config_.set_fetch_timeout(options_.fetch_timeout);
  }
  if (options_.workers_explicit) {
    config_.set_workers(options_.workers);
  }
  if (options_.issue_state_explicit) {
    config_.set_issue_state(options_.issue_state);
  }
  if (options_.skip_pull_requests) {
    config_.set_skip_pull_requests(true);
  }
  if (!options_.include_repos.empty()) {
    config_.set_include_repos(options_.include_repos);
  }
  if (!options_.exclude_repos.empty()) {
    config_.set_exclude_repos(options_.exclude_repos);
  }
  if (!options_.output_file.empty()) {
    config_.set_output_file(options_.output_file);
  }
  if (!options_.output_format.empty()) {
    config_.set_output_format(options_.output_format);
  }
  if (options_.log_level_explicit || options_.verbose) {
    config_.set_log_level(options_.log_level);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  if (options_.log_categories_explicit) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(categories);
  }
}

void App::setup_logging() {
  spdlog::level::level_enum lvl = spdlog::level::info;
  try {
    lvl = spdlog::level::from_str(config_.log_level());
  } catch (const spdlog::spdlog_ex &) {
    // keep default
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    try {
      category_levels[category] = spdlog::level::from_str(level_str);
    } catch (const spdlog::spdlog_ex &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
    }
  }
  configure_log_categories(category_levels);
}

} // namespace iscan
