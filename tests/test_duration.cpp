#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

using namespace iscan;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("1h30m") == minutes{90});
  CHECK(parse_duration("2m15s") == seconds{135});
  CHECK(parse_duration("1s500ms") == milliseconds{1500});
  CHECK(parse_duration("90S") == seconds{90});
}

TEST_CASE("parse_duration treats bare numbers as seconds") {
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration("0") == milliseconds{0});
  CHECK(parse_duration("") == milliseconds{0});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("abc"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("5d"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("-5s"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("5 s"), std::invalid_argument);
}

TEST_CASE("parse_duration rejects values that do not fit") {
  CHECK_THROWS_AS(parse_duration("99999999999999999999"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("9223372036854775807s"),
                  std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("3000000000000000h"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("9223372036854775807ms1ms"),
                  std::invalid_argument);
  CHECK(parse_duration("9223372036854775807ms") ==
        milliseconds{9223372036854775807LL});
}
