/**
 * @file aggregator.cpp
 * @brief Implements the locate, resolve, fetch and normalize pipeline.
 */
#include "aggregator.hpp"
#include "github_url.hpp"
#include "log.hpp"
#include "repo_locator.hpp"

#include <deque>
#include <future>
#include <iterator>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> aggregate_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("aggregate");
  }();
  return logger;
}

} // namespace

IssueAggregator::IssueAggregator(std::shared_ptr<IssueSource> source,
                                 AggregatorOptions options, CancelFlag cancel)
    : source_(std::move(source)), options_(std::move(options)),
      cancel_(std::move(cancel)) {
  if (options_.workers < 1)
    options_.workers = 1;
}

bool IssueAggregator::cancelled() const { return cancel_ && cancel_->load(); }

IssueAggregator::RepoOutcome
IssueAggregator::fetch_repository(const std::string &slug) const {
  RepoOutcome outcome;
  if (cancelled()) {
    outcome.failed = true;
    return outcome;
  }
  try {
    auto raw = source_->fetch_issues(slug);
    auto batch = normalize_issues(raw, slug, options_.normalize);
    outcome.issues = std::move(batch.issues);
    outcome.dropped = batch.dropped;
  } catch (const FetchError &e) {
    // One unreachable repository must not hide the others.
    if (e.kind() != FetchError::Kind::Cancelled)
      aggregate_log()->warn("Skipping issues of {}", e.what());
    outcome.failed = true;
  }
  return outcome;
}

std::vector<Issue> IssueAggregator::collect(const std::filesystem::path &root) {
  report_ = ScanReport{};
  aggregate_log()->info("Listing GitHub issues from {}", root.string());
  auto candidates = locate_remote_candidates(root);
  report_.repositories = candidates.size();

  // Resolve every slug before fetching: a malformed URL fails the whole run.
  std::vector<std::string> slugs;
  slugs.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    std::string slug = resolve_github_slug(candidate.url);
    if (!options_.filter.allows(slug)) {
      aggregate_log()->debug("Repository {} excluded by filter", slug);
      ++report_.filtered;
      continue;
    }
    slugs.push_back(std::move(slug));
  }

  std::vector<Issue> issues;
  auto absorb = [this, &issues](RepoOutcome outcome) {
    if (outcome.failed) {
      ++report_.failed;
      return;
    }
    ++report_.fetched;
    report_.dropped += outcome.dropped;
    issues.insert(issues.end(),
                  std::make_move_iterator(outcome.issues.begin()),
                  std::make_move_iterator(outcome.issues.end()));
  };

  if (options_.workers == 1) {
    for (const auto &slug : slugs) {
      if (cancelled())
        throw ScanCancelled();
      absorb(fetch_repository(slug));
    }
  } else {
    // Keep at most `workers` fetches in flight and consume them oldest first
    // so the output keeps locator order.
    std::deque<std::future<RepoOutcome>> in_flight;
    std::size_t next = 0;
    while (next < slugs.size() || !in_flight.empty()) {
      while (next < slugs.size() &&
             in_flight.size() < static_cast<std::size_t>(options_.workers) &&
             !cancelled()) {
        in_flight.push_back(std::async(std::launch::async,
                                       &IssueAggregator::fetch_repository,
                                       this, slugs[next]));
        ++next;
      }
      if (in_flight.empty())
        break;
      absorb(in_flight.front().get());
      in_flight.pop_front();
    }
  }
  if (cancelled())
    throw ScanCancelled();

  report_.issues = issues.size();
  aggregate_log()->info(
      "Collected {} issue(s) from {} repositories ({} failed, {} filtered)",
      report_.issues, report_.fetched, report_.failed, report_.filtered);
  return issues;
}

} // namespace iscan
