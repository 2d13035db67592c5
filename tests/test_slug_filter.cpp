#include "slug_filter.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

TEST_CASE("an empty filter allows every slug", "[filter]") {
  iscan::SlugFilter filter;
  REQUIRE(filter.empty());
  REQUIRE(filter.allows("octo/widgets"));
  REQUIRE(filter.allows(""));
}

TEST_CASE("exact, glob and regex include patterns", "[filter]") {
  iscan::SlugFilter filter({"octo/widgets", "tools/*", "regex:^lab/.+-api$"},
                           {});
  REQUIRE_FALSE(filter.empty());
  REQUIRE(filter.allows("octo/widgets"));
  REQUIRE_FALSE(filter.allows("octo/widgets-2"));
  REQUIRE(filter.allows("tools/cli"));
  REQUIRE_FALSE(filter.allows("tools"));
  REQUIRE(filter.allows("lab/users-api"));
  REQUIRE_FALSE(filter.allows("lab/users-web"));
  REQUIRE_FALSE(filter.allows("other/repo"));
}

TEST_CASE("glob metacharacters are literal", "[filter]") {
  iscan::SlugFilter filter({"octo/site.io", "octo/v?"}, {});
  REQUIRE(filter.allows("octo/site.io"));
  REQUIRE_FALSE(filter.allows("octo/siteXio"));
  REQUIRE(filter.allows("octo/v2"));
  REQUIRE_FALSE(filter.allows("octo/v10"));
}

TEST_CASE("excludes win over includes", "[filter]") {
  iscan::SlugFilter filter({"octo/*"}, {"octo/archive-*", "regex:legacy"});
  REQUIRE(filter.allows("octo/app"));
  REQUIRE_FALSE(filter.allows("octo/archive-2019"));
  REQUIRE_FALSE(filter.allows("octo/legacy-tool"));

  iscan::SlugFilter exclude_only({}, {"octo/private"});
  REQUIRE(exclude_only.allows("octo/public"));
  REQUIRE_FALSE(exclude_only.allows("octo/private"));
}

TEST_CASE("invalid patterns are rejected", "[filter]") {
  REQUIRE_THROWS_AS(iscan::SlugFilter({""}, {}), std::invalid_argument);
  REQUIRE_THROWS_AS(iscan::SlugFilter({}, {"regex:("}), std::invalid_argument);
}
