#include "issue.hpp"

namespace iscan {

bool operator==(const Issue &a, const Issue &b) {
  return a.repo == b.repo && a.number == b.number && a.title == b.title &&
         a.url == b.url && a.state == b.state && a.labels == b.labels;
}

bool operator!=(const Issue &a, const Issue &b) { return !(a == b); }

void to_json(nlohmann::json &j, const Issue &issue) {
  j = nlohmann::json{{"repo", issue.repo},   {"number", issue.number},
                     {"title", issue.title}, {"url", issue.url},
                     {"state", issue.state}, {"labels", issue.labels}};
}

void from_json(const nlohmann::json &j, Issue &issue) {
  j.at("repo").get_to(issue.repo);
  j.at("number").get_to(issue.number);
  j.at("title").get_to(issue.title);
  j.at("url").get_to(issue.url);
  j.at("state").get_to(issue.state);
  issue.labels = j.value("labels", std::vector<std::string>{});
}

} // namespace iscan
