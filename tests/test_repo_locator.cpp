#include "repo_locator.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

struct TempDir {
  fs::path path;
  explicit TempDir(const std::string &name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() /
           fs::path("issuescan_" + name + "_" + std::to_string(stamp));
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
}

void make_repo(const fs::path &dir, const std::string &url) {
  write_file(dir / ".git" / "config",
             "[core]\n\tbare = false\n[remote \"origin\"]\n\turl = " + url +
                 "\n\tfetch = +refs/heads/*:refs/remotes/origin/*\n");
}

bool has_path(const std::vector<iscan::RemoteCandidate> &list,
              const fs::path &dir) {
  return std::any_of(list.begin(), list.end(),
                     [&dir](const iscan::RemoteCandidate &c) {
                       return c.path.filename() == dir.filename();
                     });
}

} // namespace

TEST_CASE("missing projects root yields no candidates", "[locator]") {
  TempDir tmp("locator_missing");
  auto candidates = iscan::locate_remote_candidates(tmp.path / "nope");
  REQUIRE(candidates.empty());
}

TEST_CASE("only github origins are reported", "[locator]") {
  TempDir tmp("locator_filter");
  make_repo(tmp.path / "widgets", "https://github.com/octo/widgets.git");
  make_repo(tmp.path / "elsewhere", "https://gitlab.com/octo/elsewhere.git");
  fs::create_directories(tmp.path / "plain-dir");
  write_file(tmp.path / "notes.txt", "not a directory");
  write_file(tmp.path / "no-origin" / ".git" / "config",
             "[remote \"upstream\"]\n\turl = https://github.com/up/x.git\n");
  write_file(tmp.path / "no-url" / ".git" / "config",
             "[remote \"origin\"]\n\tfetch = +refs/heads/*\n");

  auto candidates = iscan::locate_remote_candidates(tmp.path);
  REQUIRE(candidates.size() == 1);
  REQUIRE(candidates[0].path.filename() == "widgets");
  REQUIRE(candidates[0].url == "https://github.com/octo/widgets.git");
}

TEST_CASE("origin url parsing follows git config syntax", "[locator]") {
  TempDir tmp("locator_config");
  auto cfg = tmp.path / "config";

  write_file(cfg, "# comment\n[Remote \"origin\"]\n  URL = \"https://github.com/a/b\"\n");
  REQUIRE(iscan::read_origin_url(cfg) == std::string("https://github.com/a/b"));

  write_file(cfg, "[remote \"Origin\"]\n\turl = https://github.com/a/b\n");
  REQUIRE_FALSE(iscan::read_origin_url(cfg).has_value());

  write_file(cfg, "[remote \"origin\"]\n\turl = https://github.com/first/one\n"
                  "\turl = https://github.com/second/two\n");
  REQUIRE(iscan::read_origin_url(cfg) ==
          std::string("https://github.com/first/one"));

  write_file(cfg, "[remote \"origin\"]\n"
                  "\turl = https://github.com/o/r.git # mirror\n");
  REQUIRE(iscan::read_origin_url(cfg) ==
          std::string("https://github.com/o/r.git"));

  write_file(cfg, "[remote \"origin\"]\n\turl = https://github.com/o/r.git;old\n");
  REQUIRE(iscan::read_origin_url(cfg) ==
          std::string("https://github.com/o/r.git"));

  write_file(cfg, "[remote \"origin\"]\n\turl = \"https://github.com/o/r#1\" ; x\n");
  REQUIRE(iscan::read_origin_url(cfg) ==
          std::string("https://github.com/o/r#1"));

  write_file(cfg, "[remote \"origin\"]\n\turl = # nothing\n");
  REQUIRE_FALSE(iscan::read_origin_url(cfg).has_value());

  write_file(cfg, "[remote \"origin\"]\n\turl =\n");
  REQUIRE_FALSE(iscan::read_origin_url(cfg).has_value());

  REQUIRE_FALSE(iscan::read_origin_url(tmp.path / "missing").has_value());
}

TEST_CASE("worktrees and bare repositories are recognised", "[locator]") {
  TempDir tmp("locator_layouts");

  // Main repository with a linked worktree registered under .git/worktrees.
  make_repo(tmp.path / "main", "https://github.com/octo/main.git");
  fs::path admin = tmp.path / "main" / ".git" / "worktrees" / "feature";
  write_file(admin / "commondir", "../..\n");
  write_file(admin / "HEAD", "ref: refs/heads/feature\n");
  write_file(tmp.path / "feature" / ".git", "gitdir: " + admin.string() + "\n");

  // Bare clone.
  fs::path bare = tmp.path / "mirror.git";
  write_file(bare / "HEAD", "ref: refs/heads/main\n");
  fs::create_directories(bare / "objects");
  write_file(bare / "config", "[core]\n\tbare = true\n[remote \"origin\"]\n"
                              "\turl = https://github.com/octo/mirror.git\n");

  auto config = iscan::find_git_config(tmp.path / "feature");
  REQUIRE(config.has_value());
  REQUIRE(iscan::read_origin_url(*config) ==
          std::string("https://github.com/octo/main.git"));

  auto candidates = iscan::locate_remote_candidates(tmp.path);
  REQUIRE(candidates.size() == 3);
  REQUIRE(has_path(candidates, tmp.path / "main"));
  REQUIRE(has_path(candidates, tmp.path / "feature"));
  REQUIRE(has_path(candidates, tmp.path / "mirror.git"));
}

TEST_CASE("nested repositories are not searched", "[locator]") {
  TempDir tmp("locator_depth");
  make_repo(tmp.path / "group" / "inner", "https://github.com/octo/inner.git");
  REQUIRE(iscan::locate_remote_candidates(tmp.path).empty());
}

TEST_CASE("a file as projects root is an I/O error", "[locator]") {
  TempDir tmp("locator_file_root");
  write_file(tmp.path / "file", "x");
  REQUIRE_THROWS_AS(iscan::locate_remote_candidates(tmp.path / "file"),
                    iscan::DiscoveryIoError);
}
