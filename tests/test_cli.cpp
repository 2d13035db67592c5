#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace {

/// Parse an argument list given as strings.
iscan::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "issuescan");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return iscan::parse_cli(static_cast<int>(args.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const iscan::CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}

} // namespace

TEST_CASE("test cli defaults", "[cli]") {
  auto opts = parse({});
  REQUIRE_FALSE(opts.verbose);
  REQUIRE(opts.config_file.empty());
  REQUIRE(opts.log_level == "info");
  REQUIRE_FALSE(opts.log_level_explicit);
  REQUIRE_FALSE(opts.fetch_timeout_explicit);
  REQUIRE_FALSE(opts.workers_explicit);
  REQUIRE_FALSE(opts.gh_passthrough);
  REQUIRE(opts.projects_root.empty());
  REQUIRE(opts.output_format.empty());
}

TEST_CASE("test cli general and logging options", "[cli]") {
  auto verbose = parse({"--verbose", "--config", "cfg.yaml"});
  REQUIRE(verbose.verbose);
  REQUIRE(verbose.log_level == "debug");
  REQUIRE(verbose.config_file == "cfg.yaml");

  auto logging = parse({"-G", "warn", "-F", "scan.log", "--log-rotate", "5",
                        "--log-compress", "--log-category", "fetch=trace",
                        "--log-category", "process"});
  REQUIRE(logging.log_level == "warn");
  REQUIRE(logging.log_level_explicit);
  REQUIRE(logging.log_file == "scan.log");
  REQUIRE(logging.log_rotate == 5);
  REQUIRE(logging.log_rotate_explicit);
  REQUIRE(logging.log_compress);
  REQUIRE(logging.log_compress_explicit);
  REQUIRE(logging.log_categories_explicit);
  REQUIRE(logging.log_categories.at("fetch") == "trace");
  REQUIRE(logging.log_categories.at("process") == "debug");

  auto no_compress = parse({"--no-log-compress"});
  REQUIRE_FALSE(no_compress.log_compress);
  REQUIRE(no_compress.log_compress_explicit);

  auto quiet_verbose = parse({"-v", "--log-level", "error"});
  REQUIRE(quiet_verbose.log_level == "error");
}

TEST_CASE("test cli scan options", "[cli]") {
  auto opts = parse({"--root", "/tmp/projects", "--gh", "/opt/gh", "-t", "90s",
                     "-w", "4", "--state", "closed", "--skip-pull-requests",
                     "-I", "octo/*", "--include", "lab/api", "-X",
                     "octo/old", "-o", "out.csv", "--format", "CSV"});
  REQUIRE(opts.projects_root == "/tmp/projects");
  REQUIRE(opts.gh_path == "/opt/gh");
  REQUIRE(opts.fetch_timeout == std::chrono::seconds{90});
  REQUIRE(opts.fetch_timeout_explicit);
  REQUIRE(opts.workers == 4);
  REQUIRE(opts.workers_explicit);
  REQUIRE(opts.issue_state == "closed");
  REQUIRE(opts.issue_state_explicit);
  REQUIRE(opts.skip_pull_requests);
  REQUIRE(opts.include_repos == std::vector<std::string>{"octo/*", "lab/api"});
  REQUIRE(opts.exclude_repos == std::vector<std::string>{"octo/old"});
  REQUIRE(opts.output_file == "out.csv");
  REQUIRE(opts.output_format == "csv");

  auto no_timeout = parse({"--fetch-timeout", "0"});
  REQUIRE(no_timeout.fetch_timeout.count() == 0);
  REQUIRE(no_timeout.fetch_timeout_explicit);
}

TEST_CASE("test cli rejects invalid values", "[cli]") {
  REQUIRE(exit_code_of({"--workers", "0"}) != 0);
  REQUIRE(exit_code_of({"--state", "merged"}) != 0);
  REQUIRE(exit_code_of({"--fetch-timeout", "soon"}) != 0);
  REQUIRE(exit_code_of({"--format", "xml"}) != 0);
  REQUIRE(exit_code_of({"--log-rotate", "-1"}) != 0);
  REQUIRE(exit_code_of({"--log-category", "=debug"}) != 0);
  REQUIRE(exit_code_of({"--unknown-flag"}) != 0);
}

TEST_CASE("test cli help and version exit cleanly", "[cli]") {
  REQUIRE(exit_code_of({"--help"}) == 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
}

TEST_CASE("test cli gh passthrough", "[cli]") {
  auto opts = parse({"gh", "api", "repos/octo/widgets/issues", "--paginate",
                     "-q", ".[].title"});
  REQUIRE(opts.gh_passthrough);
  REQUIRE(opts.gh_args ==
          std::vector<std::string>{"api", "repos/octo/widgets/issues",
                                   "--paginate", "-q", ".[].title"});

  auto with_global = parse({"--gh", "/opt/gh", "gh", "auth", "status"});
  REQUIRE(with_global.gh_passthrough);
  REQUIRE(with_global.gh_path == "/opt/gh");
  REQUIRE(with_global.gh_args ==
          std::vector<std::string>{"auth", "status"});

  auto bare = parse({"gh"});
  REQUIRE(bare.gh_passthrough);
  REQUIRE(bare.gh_args.empty());
}
