/**
 * @file aggregator.hpp
 * @brief Scan a projects directory and collect the issues of every GitHub
 * repository found in it.
 */
#ifndef ISSUESCAN_AGGREGATOR_HPP
#define ISSUESCAN_AGGREGATOR_HPP

#include "issue.hpp"
#include "issue_fetcher.hpp"
#include "issue_normalizer.hpp"
#include "process.hpp"
#include "slug_filter.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace iscan {

/// Raised by IssueAggregator::collect when the scan was cancelled.
class ScanCancelled : public std::runtime_error {
public:
  ScanCancelled() : std::runtime_error("Issue scan cancelled") {}
};

/// Counters describing the last scan.
struct ScanReport {
  std::size_t repositories{0}; ///< GitHub repositories located
  std::size_t filtered{0};     ///< Repositories skipped by the slug filter
  std::size_t fetched{0};      ///< Repositories fetched successfully
  std::size_t failed{0};       ///< Repositories whose fetch failed
  std::size_t issues{0};       ///< Issues returned
  std::size_t dropped{0};      ///< Raw records dropped by normalization
};

/// Settings for IssueAggregator.
struct AggregatorOptions {
  int workers{1};             ///< Concurrent fetches (values below 1 mean 1)
  NormalizeOptions normalize; ///< Passed to the normalizer
  SlugFilter filter;          ///< Repositories to scan
};

/**
 * Drives discovery, slug resolution, fetching and normalization.
 *
 * Results are ordered by directory listing order, then by API order within
 * each repository, regardless of the number of workers. A failed fetch only
 * removes that repository's issues from the result.
 */
class IssueAggregator {
public:
  /**
   * @param source Where raw issues come from.
   * @param options Worker count, normalization and filtering settings.
   * @param cancel Optional flag; once set no new fetch starts and collect()
   *        throws ScanCancelled.
   */
  explicit IssueAggregator(std::shared_ptr<IssueSource> source,
                           AggregatorOptions options = {},
                           CancelFlag cancel = nullptr);

  /**
   * Collect the issues of every GitHub repository directly below @p root.
   *
   * @param root Projects directory. A missing directory yields no issues.
   * @return Issues in locator order, then API order.
   * @throws DiscoveryIoError When @p root cannot be listed.
   * @throws MalformedRemoteUrl When a GitHub remote lacks `github.com/`.
   * @throws ScanCancelled When cancellation was requested.
   */
  std::vector<Issue> collect(const std::filesystem::path &root);

  /// Counters of the most recent collect() call.
  const ScanReport &last_report() const { return report_; }

private:
  struct RepoOutcome {
    std::vector<Issue> issues;
    std::size_t dropped{0};
    bool failed{false};
  };

  RepoOutcome fetch_repository(const std::string &slug) const;
  bool cancelled() const;

  std::shared_ptr<IssueSource> source_;
  AggregatorOptions options_;
  CancelFlag cancel_;
  ScanReport report_;
};

} // namespace iscan

#endif // ISSUESCAN_AGGREGATOR_HPP
