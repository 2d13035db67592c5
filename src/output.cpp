#include "output.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace iscan {

namespace {

std::shared_ptr<spdlog::logger> output_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("output");
  }();
  return logger;
}

std::string csv_field(std::string_view field) {
  bool quote = field.find_first_of(",\"\r\n") != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size() + 2);
  if (quote)
    escaped += '"';
  for (char c : field) {
    if (c == '"')
      escaped += "\"\"";
    else
      escaped += c;
  }
  if (quote)
    escaped += '"';
  return escaped;
}

std::string join(const std::vector<std::string> &parts, const char *sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0)
      out += sep;
    out += parts[i];
  }
  return out;
}

void write_json(std::ostream &out, const std::vector<Issue> &issues) {
  nlohmann::json j = issues;
  out << j.dump(2) << '\n';
}

void write_text(std::ostream &out, const std::vector<Issue> &issues) {
  for (const auto &issue : issues) {
    out << '#' << issue.number << " [" << issue.state << "] " << issue.repo
        << ": " << issue.title;
    if (!issue.labels.empty())
      out << " (" << join(issue.labels, ", ") << ')';
    out << ' ' << issue.url << '\n';
  }
}

void write_csv(std::ostream &out, const std::vector<Issue> &issues) {
  out << "repo,number,title,url,state,labels\n";
  for (const auto &issue : issues) {
    out << csv_field(issue.repo) << ',' << issue.number << ','
        << csv_field(issue.title) << ',' << csv_field(issue.url) << ','
        << csv_field(issue.state) << ',' << csv_field(join(issue.labels, ";"))
        << '\n';
  }
}

} // namespace

std::string to_string(OutputFormat format) {
  switch (format) {
  case OutputFormat::Json:
    return "json";
  case OutputFormat::Text:
    return "text";
  case OutputFormat::Csv:
    return "csv";
  }
  return "json";
}

OutputFormat output_format_from_string(const std::string &value) {
  std::string key = value;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (key == "json")
    return OutputFormat::Json;
  if (key == "text" || key == "txt" || key == "plain")
    return OutputFormat::Text;
  if (key == "csv")
    return OutputFormat::Csv;
  throw std::invalid_argument("Unknown output format: " + value);
}

void write_issues(std::ostream &out, const std::vector<Issue> &issues,
                  OutputFormat format) {
  switch (format) {
  case OutputFormat::Json:
    write_json(out, issues);
    break;
  case OutputFormat::Text:
    write_text(out, issues);
    break;
  case OutputFormat::Csv:
    write_csv(out, issues);
    break;
  }
}

void export_issues(const std::string &path, const std::vector<Issue> &issues,
                   OutputFormat format) {
  output_log()->debug("Writing {} issue(s) as {} to {}", issues.size(),
                      to_string(format), path);
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open output file " + path);
  }
  write_issues(out, issues, format);
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write output file " + path);
  }
  output_log()->info("Wrote {} issue(s) to {}", issues.size(), path);
}

} // namespace iscan
