#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Parse @p s completely as an integer (any base prefix strtoll accepts).
bool parse_integer(const std::string &s, long long &out) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
    return false;
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(s.c_str(), &end, 0);
  if (errno != 0 || end != s.c_str() + s.size())
    return false;
  out = value;
  return true;
}

bool parse_floating(const std::string &s, double &out) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
    return false;
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size())
    return false;
  out = value;
  return true;
}

/**
 * Convert a YAML node into the equivalent JSON value. Scalars that read as
 * booleans or numbers keep that type; everything else stays a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    long long i = 0;
    if (parse_integer(s, i))
      return i;
    double d = 0.0;
    if (parse_floating(s, d))
      return d;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    std::transform(node.begin(), node.end(), std::back_inserter(arr),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a parsed TOML node to JSON. Dates and times become strings.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  std::ostringstream oss;
  if (const auto *value = node.as_date())
    oss << value->get();
  else if (const auto *value = node.as_time())
    oss << value->get();
  else if (const auto *value = node.as_date_time())
    oss << value->get();
  else
    return nullptr;
  return oss.str();
}

/**
 * Lift the keys of grouped sections (`scan`, `fetch`, ...) to the top level
 * so grouped and flat files are read the same way. Grouped keys win over flat
 * ones of the same name.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name :
       {"scan", "fetch", "output", "repositories", "logging"}) {
    auto it = source.find(std::string{name});
    if (it == source.end() || !it->is_object())
      continue;
    for (const auto &[key, value] : it->items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

/// Accept a single string or a list of strings.
std::vector<std::string> string_list(const nlohmann::json &value) {
  if (value.is_string())
    return {value.get<std::string>()};
  return value.get<std::vector<std::string>>();
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign = [&categories](const std::string &raw) {
    auto pos = raw.find('=');
    std::string name = pos == std::string::npos ? raw : raw.substr(0, pos);
    std::string level =
        pos == std::string::npos ? std::string{} : raw.substr(pos + 1);
    if (name.empty())
      return;
    categories[name] = level.empty() ? "debug" : level;
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (key.empty())
        continue;
      if (v.is_string()) {
        std::string level = v.get<std::string>();
        categories[key] = level.empty() ? "debug" : level;
      } else if (v.is_null()) {
        categories[key] = "debug";
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string())
        assign(item.get<std::string>());
    }
  } else if (value.is_string()) {
    assign(value.get<std::string>());
  } else {
    config_log()->warn("Ignoring log_categories of type {}", value.type_name());
  }
  return categories;
}

} // namespace

std::string default_config_root() {
  if (const char *env = std::getenv("ISSUESCAN_CONFIG_ROOT")) {
    if (*env != '\0')
      return env;
  }
  if (const char *home = std::getenv("HOME")) {
    if (*home != '\0')
      return (std::filesystem::path(home) / ".claude").string();
  }
  return {};
}

std::string default_projects_root() {
  std::string root = default_config_root();
  if (root.empty())
    return {};
  return (std::filesystem::path(root) / "projects").string();
}

void Config::set_issue_state(const std::string &state) {
  std::string lower = to_lower_copy(state);
  if (!lower.empty() && lower != "open" && lower != "closed" &&
      lower != "all") {
    throw std::invalid_argument("Invalid issue state: " + state);
  }
  issue_state_ = lower;
}

/**
 * Read known keys from @p j into this configuration.
 *
 * @throws nlohmann::json::exception When a value has the wrong type.
 * @throws std::invalid_argument On an invalid duration or issue state.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    if (j.is_null())
      return;
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("projects_root")) {
    set_projects_root(cfg["projects_root"].get<std::string>());
  }
  if (cfg.contains("gh_path")) {
    set_gh_path(cfg["gh_path"].get<std::string>());
  }
  if (cfg.contains("fetch_timeout")) {
    const auto &timeout = cfg["fetch_timeout"];
    if (timeout.is_number_integer()) {
      constexpr long long kMaxSeconds =
          std::numeric_limits<long long>::max() / 1000;
      bool out_of_range = false;
      if (timeout.is_number_unsigned()) {
        out_of_range = timeout.get<unsigned long long>() >
                       static_cast<unsigned long long>(kMaxSeconds);
      } else {
        auto value = timeout.get<long long>();
        out_of_range = value > kMaxSeconds || value < -kMaxSeconds;
      }
      if (out_of_range) {
        throw std::invalid_argument("fetch_timeout is too large");
      }
      set_fetch_timeout(std::chrono::seconds(timeout.get<long long>()));
    } else {
      set_fetch_timeout(parse_duration(timeout.get<std::string>()));
    }
  }
  if (cfg.contains("workers")) {
    set_workers(cfg["workers"].get<int>());
  }
  if (cfg.contains("issue_state")) {
    set_issue_state(cfg["issue_state"].get<std::string>());
  }
  if (cfg.contains("skip_pull_requests")) {
    set_skip_pull_requests(cfg["skip_pull_requests"].get<bool>());
  }
  if (cfg.contains("include_repos")) {
    set_include_repos(string_list(cfg["include_repos"]));
  }
  if (cfg.contains("exclude_repos")) {
    set_exclude_repos(string_list(cfg["exclude_repos"]));
  }
  if (cfg.contains("output_format")) {
    set_output_format(cfg["output_format"].get<std::string>());
  }
  if (cfg.contains("output_file")) {
    set_output_file(cfg["output_file"].get<std::string>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  std::string ext = std::filesystem::path(path).extension().string();
  if (ext.empty()) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  ext = to_lower_copy(ext.substr(1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      j = nlohmann::json::parse(f);
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error(std::string("Failed to load config ") + path +
                             ": " + e.what());
  }

  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const std::exception &e) {
    config_log()->error("Invalid config {}: {}", path, e.what());
    throw std::runtime_error(std::string("Invalid config ") + path + ": " +
                             e.what());
  }
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace iscan
