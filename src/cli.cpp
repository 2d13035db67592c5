#include "cli.hpp"
#include "log.hpp"
#include "output.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 11> categories = {
      "aggregate", "app",    "cli",     "config",    "fetch",       "logging",
      "main",      "normalize", "output", "process", "repo.locator"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., fetch=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  oss << "\nRun 'issuescan gh ARGS...' to call the GitHub CLI directly.";
  return oss.str();
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"issuescan: list GitHub issues of local repositories"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "issuescan " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option_function<std::string>(
         "-G,--log-level",
         [&options](const std::string &value) {
           options.log_level = value;
           options.log_level_explicit = true;
         },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::int64_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Gzip rotated log files")
      ->group("Logging");
  app.add_flag_function(
         "--no-log-compress",
         [&options](std::int64_t) {
           options.log_compress = false;
           options.log_compress_explicit = true;
         },
         "Keep rotated log files uncompressed")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Set a logging category level (NAME or NAME=LEVEL); repeatable")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-r,--root", options.projects_root,
                 "Directory whose subdirectories are scanned")
      ->type_name("DIR")
      ->group("Scan");
  app.add_option("--gh", options.gh_path, "Path to the gh executable")
      ->type_name("PATH")
      ->group("Scan");
  app.add_option_function<std::string>(
         "-t,--fetch-timeout",
         [&options](const std::string &value) {
           try {
             options.fetch_timeout = parse_duration(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--fetch-timeout", e.what());
           }
           options.fetch_timeout_explicit = true;
         },
         "Timeout for each gh call, e.g. 90s or 2m (0 disables)")
      ->type_name("DURATION")
      ->group("Scan");
  app.add_option_function<int>(
         "-w,--workers",
         [&options](int value) {
           if (value < 1) {
             throw CLI::ValidationError("--workers",
                                        "worker count must be at least 1");
           }
           options.workers = value;
           options.workers_explicit = true;
         },
         "Number of repositories fetched concurrently")
      ->type_name("N")
      ->group("Scan");
  app.add_option_function<std::string>(
         "-s,--state",
         [&options](const std::string &value) {
           options.issue_state = value;
           options.issue_state_explicit = true;
         },
         "Issue state to request (open, closed, all)")
      ->type_name("STATE")
      ->check(CLI::IsMember({"open", "closed", "all"}))
      ->group("Scan");
  app.add_flag("--skip-pull-requests", options.skip_pull_requests,
               "Drop pull requests returned by the issues endpoint")
      ->group("Scan");
  app.add_option("-I,--include", options.include_repos,
                 "Only scan repositories matching PATTERN; repeatable")
      ->type_name("PATTERN")
      ->group("Scan");
  app.add_option("-X,--exclude", options.exclude_repos,
                 "Skip repositories matching PATTERN; repeatable")
      ->type_name("PATTERN")
      ->group("Scan");

  app.add_option("-o,--output", options.output_file,
                 "Write the issue listing to FILE instead of stdout")
      ->type_name("FILE")
      ->group("Output");
  app.add_option_function<std::string>(
         "--format",
         [&options](const std::string &value) {
           try {
             options.output_format = to_string(output_format_from_string(value));
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--format", e.what());
           }
         },
         "Listing format (json, text, csv)")
      ->type_name("FORMAT")
      ->group("Output");

  CLI::App *gh = app.add_subcommand(
      "gh", "Run the GitHub CLI with the remaining arguments");
  gh->prefix_command();
  gh->allow_extras();
  gh->set_help_flag();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (gh->parsed()) {
    options.gh_passthrough = true;
    options.gh_args = gh->remaining();
    cli_log()->debug("gh passthrough with {} argument(s)",
                     options.gh_args.size());
  }
  if (options.verbose && !options.log_level_explicit) {
    options.log_level = "debug";
  }
  return options;
}

} // namespace iscan
