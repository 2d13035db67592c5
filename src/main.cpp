#include "aggregator.hpp"
#include "app.hpp"
#include "github_url.hpp"
#include "issue_fetcher.hpp"
#include "log.hpp"
#include "output.hpp"
#include "process.hpp"
#include "repo_locator.hpp"
#include "slug_filter.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

#include <signal.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    iscan::ensure_default_logger();
    return iscan::category_logger("main");
  }();
  return logger;
}

constexpr int kExitCancelled = 130;

// Set once before the handlers are installed.
std::atomic<bool> *g_cancel_target = nullptr;

extern "C" void handle_termination(int) {
  if (g_cancel_target != nullptr) {
    g_cancel_target->store(true);
  }
}

void install_cancel_handlers(const iscan::CancelFlag &cancel) {
  g_cancel_target = cancel.get();
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = handle_termination;
  sigemptyset(&action.sa_mask);
  for (int sig : {SIGINT, SIGTERM}) {
    if (::sigaction(sig, &action, nullptr) != 0) {
      main_log()->warn("Unable to install handler for signal {}: {}", sig,
                       std::strerror(errno));
    }
  }
}

/// `issuescan gh ARGS...`: forward to gh, print its output.
int run_gh_passthrough(const iscan::Config &cfg,
                       const std::vector<std::string> &args,
                       const iscan::CancelFlag &cancel) {
  auto runner = std::make_shared<iscan::ProcessCommandRunner>(
      std::chrono::milliseconds{0}, cancel);
  iscan::GhCli gh(runner, cfg.gh_path());
  try {
    std::cout << gh.run(args);
    std::cout.flush();
  } catch (const iscan::GhCommandError &e) {
    std::cerr << e.what();
    std::string message = e.what();
    if (message.empty() || message.back() != '\n') {
      std::cerr << '\n';
    }
    main_log()->debug("{} exited with status {}", cfg.gh_path(),
                      e.exit_code());
    return cancel->load() ? kExitCancelled : 1;
  }
  return 0;
}

int run_scan(const iscan::Config &cfg, const iscan::CancelFlag &cancel) {
  iscan::OutputFormat format = iscan::OutputFormat::Json;
  iscan::AggregatorOptions options;
  try {
    format = iscan::output_format_from_string(cfg.output_format());
    options.filter =
        iscan::SlugFilter(cfg.include_repos(), cfg.exclude_repos());
  } catch (const std::invalid_argument &e) {
    main_log()->error("{}", e.what());
    return 1;
  }
  if (cfg.projects_root().empty()) {
    main_log()->error("No projects directory configured; set HOME, "
                      "ISSUESCAN_CONFIG_ROOT or pass --root");
    return 1;
  }
  options.workers = cfg.workers();
  options.normalize.skip_pull_requests = cfg.skip_pull_requests();

  auto runner = std::make_shared<iscan::ProcessCommandRunner>(
      cfg.fetch_timeout(), cancel);
  auto source = std::make_shared<iscan::GhIssueSource>(
      iscan::GhCli(runner, cfg.gh_path()), cfg.issue_state());
  iscan::IssueAggregator aggregator(source, options, cancel);

  std::vector<iscan::Issue> issues;
  try {
    issues = aggregator.collect(cfg.projects_root());
  } catch (const iscan::ScanCancelled &e) {
    main_log()->warn("{}", e.what());
    return kExitCancelled;
  } catch (const iscan::DiscoveryIoError &e) {
    main_log()->error("{}", e.what());
    return 1;
  } catch (const iscan::MalformedRemoteUrl &e) {
    main_log()->error("{}", e.what());
    return 1;
  }

  const auto &report = aggregator.last_report();
  main_log()->info("Scanned {} repositories ({} fetched, {} failed, {} "
                   "filtered): {} issues, {} records dropped",
                   report.repositories, report.fetched, report.failed,
                   report.filtered, report.issues, report.dropped);

  try {
    if (cfg.output_file().empty()) {
      iscan::write_issues(std::cout, issues, format);
      std::cout.flush();
    } else {
      iscan::export_issues(cfg.output_file(), issues, format);
      main_log()->info("Wrote {} issues to {}", issues.size(),
                       cfg.output_file());
    }
  } catch (const std::runtime_error &e) {
    main_log()->error("{}", e.what());
    return 1;
  }
  return 0;
}
} // namespace

/**
 * Program entry point: resolves settings, then either forwards to gh or
 * scans the projects directory and prints the collected issues.
 */
int main(int argc, char **argv) {
  iscan::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    spdlog::shutdown();
    return ret;
  }

  auto cancel = std::make_shared<std::atomic<bool>>(false);
  install_cancel_handlers(cancel);

  const auto &opts = app.options();
  if (opts.gh_passthrough) {
    ret = run_gh_passthrough(app.config(), opts.gh_args, cancel);
  } else {
    ret = run_scan(app.config(), cancel);
  }
  spdlog::shutdown();
  return ret;
}
