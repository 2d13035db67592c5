#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kDefaultLoggerName = "issuescan";
constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_default;
// Every issuescan logger writes through this sink; sinks are added to it,
// never to a running logger.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_sinks;
std::string g_file_sink_path;
std::string g_pattern;
std::mutex g_mutex;

/// Caller holds g_mutex. spdlog::shutdown() drops the pool, so recreate it.
std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    spdlog::init_thread_pool(8192, 1);
    pool = spdlog::thread_pool();
  }
  return pool;
}

/// Logger used from inside sink callbacks; never creates anything.
void report_rotation_problem(const std::string &message) {
  if (auto log = spdlog::get(std::string(kDefaultLoggerName) + ".logging")) {
    log->warn("{}", message);
  }
}

/**
 * Name of the Nth rotated file the way spdlog's rotating sink names it:
 * `app.log` -> `app.1.log`.
 */
fs::path rotated_name(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  std::string stem = base.stem().string();
  std::string ext = base.extension().string();
  if (stem.empty()) {
    stem = base.filename().string();
    ext.clear();
  }
  return base.parent_path() / (stem + "." + std::to_string(index) + ext);
}

fs::path gz_name(const fs::path &path) { return fs::path(path.string() + ".gz"); }

/**
 * Move `app.N.log.gz` archives one slot up, dropping the oldest.
 *
 * @param base Active log file path.
 * @param keep Number of archives to retain.
 */
void shift_archives(const fs::path &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(gz_name(rotated_name(base, keep)), ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = gz_name(rotated_name(base, i - 1));
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::rename(from, gz_name(rotated_name(base, i)), ec);
    if (ec) {
      report_rotation_problem("Failed to shift log archive " + from.string() +
                              ": " + ec.message());
    }
  }
}

/**
 * Gzip @p path into `<path>.gz` and remove the original.
 *
 * @return Empty string on success, otherwise a description of the failure.
 */
std::string gzip_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return "cannot open " + path.string();
  }
  const std::string target = gz_name(path).string();
  gzFile gz = gzopen(target.c_str(), "wb");
  if (gz == nullptr) {
    return "cannot create " + target;
  }
  char chunk[8192];
  while (in) {
    in.read(chunk, sizeof(chunk));
    const auto got = static_cast<int>(in.gcount());
    if (got > 0 && gzwrite(gz, chunk, static_cast<unsigned>(got)) != got) {
      int code = 0;
      const char *msg = gzerror(gz, &code);
      std::string error = "write to " + target + " failed: " +
                          (msg != nullptr ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(target, ec);
      return error;
    }
  }
  if (gzclose(gz) != Z_OK) {
    return "closing " + target + " failed";
  }
  in.close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    return "cannot remove " + path.string() + ": " + ec.message();
  }
  return {};
}

spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files, bool compress) {
  if (rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
  }
  spdlog::file_event_handlers handlers;
  if (compress) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      fs::path base(spdlog::details::os::filename_to_str(name));
      shift_archives(base, rotate_files);
      fs::path newest = rotated_name(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        auto error = gzip_file(newest);
        if (!error.empty()) {
          report_rotation_problem("Log compression failed: " + error);
        }
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kRotateBytes, rotate_files, false, handlers);
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}

} // namespace

namespace iscan {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::shared_ptr<spdlog::logger> logger;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    logger = spdlog::get(kDefaultLoggerName);
    if (!logger) {
      g_sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
      g_sinks->add_sink(
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      logger = make_async_logger(kDefaultLoggerName, {g_sinks});
      spdlog::set_default_logger(logger);
      g_default = logger;
      g_file_sink_path.clear();
      g_pattern.clear();
    }
    // Loggers created before the first explicit init (e.g. while loading the
    // config) reach the file through the shared distributing sink.
    if (!file.empty() && g_file_sink_path.empty()) {
      auto sink = make_file_sink(file, rotate_files, compress_rotations);
      if (!g_pattern.empty()) {
        sink->set_pattern(g_pattern);
      }
      g_sinks->add_sink(sink);
      g_file_sink_path = file;
    }
    if (!pattern.empty()) {
      g_pattern = pattern;
    }
  }
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(kDefaultLoggerName, 0) == 0) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logging ready (level={}, file='{}', rotate={}, compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto ours = g_default.lock();
  if (current && ours && current.get() == ours.get()) {
    return;
  }
  init_logger(spdlog::level::info);
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kDefaultLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  ensure_default_logger();
  std::lock_guard<std::mutex> lock(g_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto parent = spdlog::default_logger();
  auto logger = make_async_logger(name, {g_sinks});
  logger->set_level(parent->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} category level override(s)",
                                      overrides.size());
  }
}

} // namespace iscan
