#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

namespace {

std::string read_file(const std::string &path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

std::string temp_log(const std::string &name) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() /
          (name + "_" + std::to_string(stamp) + ".log"))
      .string();
}

} // namespace

TEST_CASE("test log") {
  const std::string path = temp_log("issuescan_test");
  iscan::init_logger(spdlog::level::info, "", path, 0);
  spdlog::debug("debug message");
  spdlog::info("info message");
  spdlog::shutdown();
  std::string content = read_file(path);
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  std::remove(path.c_str());
}

TEST_CASE("category loggers share the file sink and honour overrides") {
  const std::string path = temp_log("issuescan_categories");
  auto early = iscan::category_logger("config");
  iscan::init_logger(spdlog::level::info, "", path, 2);
  iscan::configure_log_categories({{"fetch", spdlog::level::debug}});

  auto fetch = iscan::category_logger("fetch");
  REQUIRE(fetch->name() == "issuescan.fetch");
  REQUIRE(fetch->level() == spdlog::level::debug);
  REQUIRE(iscan::category_logger("fetch") == fetch);

  early->info("config loaded");
  fetch->debug("fetch detail");
  iscan::category_logger("output")->debug("output detail");
  spdlog::shutdown();

  std::string content = read_file(path);
  REQUIRE(content.find("config loaded") != std::string::npos);
  REQUIRE(content.find("fetch detail") != std::string::npos);
  REQUIRE(content.find("output detail") == std::string::npos);
  std::remove(path.c_str());
}

TEST_CASE("file sink is added while category loggers are busy") {
  const std::string path = temp_log("issuescan_live_sink");
  auto config = iscan::category_logger("config");
  for (int i = 0; i < 2000; ++i) {
    config->info("queued message {}", i);
  }
  iscan::init_logger(spdlog::level::info, "", path, 0);
  config->info("after file sink");
  iscan::category_logger("app")->info("new category after file sink");
  spdlog::shutdown();

  std::string content = read_file(path);
  REQUIRE(content.find("after file sink") != std::string::npos);
  REQUIRE(content.find("new category after file sink") != std::string::npos);
  std::remove(path.c_str());
}
