#include "output.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<iscan::Issue> sample_issues() {
  iscan::Issue first{"octo/widgets", 12, "Crash, then \"hang\"",
                     "https://github.com/octo/widgets/issues/12", "open",
                     {"bug", "p1"}};
  iscan::Issue second{"octo/api", 3, "Docs",
                      "https://github.com/octo/api/issues/3", "closed", {}};
  return {first, second};
}

std::string render(iscan::OutputFormat format) {
  std::ostringstream out;
  iscan::write_issues(out, sample_issues(), format);
  return out.str();
}

} // namespace

TEST_CASE("format names", "[output]") {
  REQUIRE(iscan::output_format_from_string("json") == iscan::OutputFormat::Json);
  REQUIRE(iscan::output_format_from_string("CSV") == iscan::OutputFormat::Csv);
  REQUIRE(iscan::output_format_from_string("txt") == iscan::OutputFormat::Text);
  REQUIRE(iscan::to_string(iscan::OutputFormat::Text) == "text");
  REQUIRE_THROWS_AS(iscan::output_format_from_string("xml"),
                    std::invalid_argument);
}

TEST_CASE("json output is an array of issue objects", "[output]") {
  auto parsed = nlohmann::json::parse(render(iscan::OutputFormat::Json));
  REQUIRE(parsed.is_array());
  REQUIRE(parsed.size() == 2);
  REQUIRE(parsed[0]["repo"] == "octo/widgets");
  REQUIRE(parsed[0]["number"] == 12);
  REQUIRE(parsed[0]["labels"] == nlohmann::json::array({"bug", "p1"}));
  REQUIRE(parsed[1]["state"] == "closed");
  REQUIRE(parsed.get<std::vector<iscan::Issue>>() == sample_issues());

  std::ostringstream empty;
  iscan::write_issues(empty, {}, iscan::OutputFormat::Json);
  REQUIRE(nlohmann::json::parse(empty.str()) == nlohmann::json::array());
}

TEST_CASE("text output has one line per issue", "[output]") {
  REQUIRE(render(iscan::OutputFormat::Text) ==
          "#12 [open] octo/widgets: Crash, then \"hang\" (bug, p1) "
          "https://github.com/octo/widgets/issues/12\n"
          "#3 [closed] octo/api: Docs https://github.com/octo/api/issues/3\n");
}

TEST_CASE("csv output quotes fields that need it", "[output]") {
  REQUIRE(render(iscan::OutputFormat::Csv) ==
          "repo,number,title,url,state,labels\n"
          "octo/widgets,12,\"Crash, then \"\"hang\"\"\","
          "https://github.com/octo/widgets/issues/12,open,bug;p1\n"
          "octo/api,3,Docs,https://github.com/octo/api/issues/3,closed,\n");
}

TEST_CASE("export writes the listing to a file", "[output]") {
  auto path = std::filesystem::temp_directory_path() / "issuescan_export.csv";
  iscan::export_issues(path.string(), sample_issues(),
                       iscan::OutputFormat::Csv);
  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content == render(iscan::OutputFormat::Csv));
  std::filesystem::remove(path);

  auto bad = std::filesystem::temp_directory_path() / "issuescan_no_dir" /
             "out.json";
  REQUIRE_THROWS_AS(iscan::export_issues(bad.string(), sample_issues(),
                                         iscan::OutputFormat::Json),
                    std::runtime_error);
}
