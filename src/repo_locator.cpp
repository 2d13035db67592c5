/**
 * @file repo_locator.cpp
 * @brief Finds GitHub-backed repositories below a projects directory.
 *
 * Git metadata is read directly from the repository's config file, so no git
 * binary or library is needed for discovery.
 */
#include "repo_locator.hpp"
#include "github_url.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace iscan {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> locator_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repo.locator");
  }();
  return logger;
}

std::string lowercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return std::string(first, last);
}

/**
 * Decode a config value the way git does: double quotes group text and are
 * removed, `\"` and `\\` are escapes, and an unquoted `;` or `#` starts a
 * comment. Unquoted trailing whitespace is dropped.
 */
std::string parse_value(const std::string &raw) {
  std::string value;
  std::size_t keep = 0; // length without unquoted trailing whitespace
  bool quoted = false;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '"') {
      quoted = !quoted;
      keep = value.size();
      continue;
    }
    if (!quoted && (c == ';' || c == '#'))
      break;
    if (c == '\\' && i + 1 < raw.size() &&
        (raw[i + 1] == '"' || raw[i + 1] == '\\')) {
      value.push_back(raw[++i]);
      keep = value.size();
      continue;
    }
    value.push_back(c);
    if (quoted || !std::isspace(static_cast<unsigned char>(c)))
      keep = value.size();
  }
  value.resize(keep);
  return value;
}

/**
 * Check whether a section header body (text between the brackets) names the
 * `origin` remote. The section name is case-insensitive, the subsection is
 * not.
 */
bool is_origin_section(const std::string &header) {
  auto quote = header.find('"');
  if (quote == std::string::npos)
    return false;
  if (lowercase(trim(header.substr(0, quote))) != "remote")
    return false;
  auto closing = header.find('"', quote + 1);
  if (closing == std::string::npos)
    return false;
  return header.substr(quote + 1, closing - quote - 1) == "origin";
}

bool is_file(const fs::path &p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

bool is_dir(const fs::path &p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

/// First line of a small text file, trimmed.
std::optional<std::string> read_first_line(const fs::path &p) {
  std::ifstream in(p);
  std::string line;
  if (!in || !std::getline(in, line))
    return std::nullopt;
  return trim(line);
}

/**
 * Resolve the config of a repository whose `.git` entry is a file.
 *
 * Worktrees keep their config in the common directory named by the
 * `commondir` file; submodules keep it in the gitdir itself.
 */
std::optional<fs::path> config_from_gitdir_file(const fs::path &dir,
                                                const fs::path &git_file) {
  auto line = read_first_line(git_file);
  constexpr std::string_view key = "gitdir:";
  if (!line || line->size() <= key.size() ||
      lowercase(line->substr(0, key.size())) != key) {
    return std::nullopt;
  }
  fs::path gitdir(trim(line->substr(key.size())));
  if (gitdir.is_relative())
    gitdir = dir / gitdir;
  std::error_code ec;
  gitdir = fs::weakly_canonical(gitdir, ec);
  if (ec)
    return std::nullopt;

  if (auto common = read_first_line(gitdir / "commondir")) {
    fs::path common_dir(*common);
    if (common_dir.is_relative())
      common_dir = gitdir / common_dir;
    if (is_file(common_dir / "config"))
      return common_dir / "config";
  }
  if (is_file(gitdir / "config"))
    return gitdir / "config";
  return std::nullopt;
}

} // namespace

std::optional<fs::path> find_git_config(const fs::path &dir) {
  const fs::path dot_git = dir / ".git";
  if (is_dir(dot_git)) {
    if (is_file(dot_git / "config"))
      return dot_git / "config";
    return std::nullopt;
  }
  if (is_file(dot_git))
    return config_from_gitdir_file(dir, dot_git);
  if (is_file(dir / "HEAD") && is_dir(dir / "objects") &&
      is_file(dir / "config")) {
    return dir / "config";
  }
  return std::nullopt;
}

std::optional<std::string> read_origin_url(const fs::path &config_path) {
  std::ifstream config(config_path);
  if (!config)
    return std::nullopt;

  std::string line;
  bool in_origin = false;
  while (std::getline(config, line)) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == ';' || trimmed[0] == '#')
      continue;
    if (trimmed.front() == '[') {
      auto close = trimmed.find(']');
      in_origin = close != std::string::npos &&
                  is_origin_section(trimmed.substr(1, close - 1));
      continue;
    }
    if (!in_origin)
      continue;
    auto eq = trimmed.find('=');
    if (eq == std::string::npos)
      continue;
    if (lowercase(trim(trimmed.substr(0, eq))) != "url")
      continue;
    std::string value = parse_value(trim(trimmed.substr(eq + 1)));
    if (value.empty())
      return std::nullopt;
    return value;
  }
  return std::nullopt;
}

std::vector<RemoteCandidate> locate_remote_candidates(const fs::path &root) {
  std::vector<RemoteCandidate> candidates;
  std::error_code ec;
  bool exists = fs::exists(root, ec);
  if (ec)
    throw DiscoveryIoError(root, ec);
  if (!exists) {
    locator_log()->warn("Projects directory does not exist: {}",
                        root.string());
    return candidates;
  }

  fs::directory_iterator it(root, ec);
  if (ec)
    throw DiscoveryIoError(root, ec);
  for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
    const fs::path path = it->path();
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec))
      continue;

    auto config_path = find_git_config(path);
    if (!config_path) {
      locator_log()->debug("Skipping {}: not a git repository", path.string());
      continue;
    }
    auto url = read_origin_url(*config_path);
    if (!url) {
      locator_log()->debug("Skipping {}: no origin remote URL", path.string());
      continue;
    }
    if (!is_github_remote(*url)) {
      locator_log()->debug("Skipping {}: origin {} is not on GitHub",
                           path.string(), *url);
      continue;
    }
    locator_log()->debug("Found GitHub repository {} ({})", path.string(),
                         *url);
    candidates.push_back({path, *url});
  }
  // A failed increment() leaves the iterator at end.
  if (ec)
    throw DiscoveryIoError(root, ec);
  locator_log()->info("Located {} GitHub repositories under {}",
                      candidates.size(), root.string());
  return candidates;
}

} // namespace iscan
