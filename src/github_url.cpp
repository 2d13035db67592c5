#include "github_url.hpp"

#include <string_view>

namespace iscan {

namespace {
constexpr std::string_view kHost = "github.com";
constexpr std::string_view kMarker = "github.com/";
constexpr std::string_view kGitSuffix = ".git";
} // namespace

bool is_github_remote(const std::string &url) {
  return url.find(kHost) != std::string::npos;
}

std::string resolve_github_slug(const std::string &url) {
  std::string_view view(url);
  if (view.size() >= kGitSuffix.size() &&
      view.substr(view.size() - kGitSuffix.size()) == kGitSuffix) {
    view.remove_suffix(kGitSuffix.size());
  }
  auto pos = view.find(kMarker);
  if (pos == std::string_view::npos) {
    throw MalformedRemoteUrl(url);
  }
  return std::string(view.substr(pos + kMarker.size()));
}

} // namespace iscan
