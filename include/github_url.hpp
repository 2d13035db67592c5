/**
 * @file github_url.hpp
 * @brief Resolve `owner/repo` slugs from git remote URLs.
 */
#ifndef ISSUESCAN_GITHUB_URL_HPP
#define ISSUESCAN_GITHUB_URL_HPP

#include <stdexcept>
#include <string>

namespace iscan {

/// Raised when a remote URL does not contain the `github.com/` marker.
class MalformedRemoteUrl : public std::runtime_error {
public:
  explicit MalformedRemoteUrl(const std::string &url)
      : std::runtime_error("Invalid GitHub URL: " + url), url_(url) {}

  /// The offending remote URL.
  const std::string &url() const noexcept { return url_; }

private:
  std::string url_;
};

/// Whether @p url mentions github.com anywhere.
bool is_github_remote(const std::string &url);

/**
 * Extract the `owner/repo` slug from a GitHub remote URL.
 *
 * A single trailing `.git` is removed, then everything after the first
 * `github.com/` is returned verbatim. No further validation is done, so
 * `https://github.com/owner/repo/` yields `owner/repo/`.
 *
 * @param url Remote URL as stored in the git config.
 * @return Slug text following the marker.
 * @throws MalformedRemoteUrl When the marker is absent.
 */
std::string resolve_github_slug(const std::string &url);

} // namespace iscan

#endif // ISSUESCAN_GITHUB_URL_HPP
