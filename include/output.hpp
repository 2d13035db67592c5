/**
 * @file output.hpp
 * @brief Render issue listings as JSON, plain text or CSV.
 */
#ifndef ISSUESCAN_OUTPUT_HPP
#define ISSUESCAN_OUTPUT_HPP

#include "issue.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace iscan {

/// Supported listing formats.
enum class OutputFormat {
  Json, ///< JSON array of issue objects
  Text, ///< One human-readable line per issue
  Csv   ///< `repo,number,title,url,state,labels` with a header row
};

/// Lowercase name of @p format.
std::string to_string(OutputFormat format);

/**
 * Parse a format name (case-insensitive).
 * @throws std::invalid_argument For unknown names.
 */
OutputFormat output_format_from_string(const std::string &value);

/// Write @p issues to @p out in @p format.
void write_issues(std::ostream &out, const std::vector<Issue> &issues,
                  OutputFormat format);

/**
 * Write @p issues to the file at @p path, replacing its contents.
 * @throws std::runtime_error When the file cannot be written.
 */
void export_issues(const std::string &path, const std::vector<Issue> &issues,
                   OutputFormat format);

} // namespace iscan

#endif // ISSUESCAN_OUTPUT_HPP
