/**
 * @file repo_locator.hpp
 * @brief Locate git repositories with a GitHub `origin` remote.
 *
 * Scans the immediate children of a projects directory and reads each
 * repository's git config to find the URL of its `origin` remote.
 */
#ifndef ISSUESCAN_REPO_LOCATOR_HPP
#define ISSUESCAN_REPO_LOCATOR_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace iscan {

/// A local repository directory paired with its GitHub remote URL.
struct RemoteCandidate {
  std::filesystem::path path; ///< Repository working directory
  std::string url;            ///< URL of the `origin` remote
};

/// Raised when the projects directory listing cannot be read.
class DiscoveryIoError : public std::runtime_error {
public:
  DiscoveryIoError(const std::filesystem::path &path, std::error_code ec)
      : std::runtime_error("Failed to read projects directory '" +
                           path.string() + "': " + ec.message()),
        path_(path), code_(ec) {}

  const std::filesystem::path &path() const noexcept { return path_; }
  std::error_code code() const noexcept { return code_; }

private:
  std::filesystem::path path_;
  std::error_code code_;
};

/**
 * Find the git config file belonging to the repository at @p dir.
 *
 * Handles regular checkouts (`.git/config`), worktrees and submodules whose
 * `.git` is a file holding a `gitdir:` pointer, and bare repositories.
 *
 * @param dir Candidate repository directory.
 * @return Path to the config file, or `std::nullopt` when @p dir is not a
 *         repository.
 */
std::optional<std::filesystem::path>
find_git_config(const std::filesystem::path &dir);

/**
 * Read the `url` of the `origin` remote from a git config file.
 *
 * @param config_path Path to a git `config` file.
 * @return The URL, or `std::nullopt` when the file is unreadable, has no
 *         `origin` remote, or the remote has no URL value.
 */
std::optional<std::string>
read_origin_url(const std::filesystem::path &config_path);

/**
 * List the GitHub repositories directly below @p root.
 *
 * Entries are returned in directory listing order. Entries that are not
 * directories, not repositories, lack an `origin` URL or point somewhere
 * other than github.com are skipped. A missing @p root yields an empty list.
 *
 * @param root Projects directory to scan.
 * @return Discovered candidates.
 * @throws DiscoveryIoError When the directory listing fails.
 */
std::vector<RemoteCandidate>
locate_remote_candidates(const std::filesystem::path &root);

} // namespace iscan

#endif // ISSUESCAN_REPO_LOCATOR_HPP
