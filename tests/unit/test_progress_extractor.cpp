#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "BuildDeck/runner/progress_extractor.hpp"

using namespace BuildDeck;
using namespace BuildDeck::runner;
using Catch::Approx;

TEST_CASE("ProgressExtractor finds bracketed pairs", "[progress]") {
  SECTION("Unreal compile line") {
    auto marker = ProgressExtractor::extract("[1/2743] Compiling Foo.cpp");
    REQUIRE(marker.has_value());
    CHECK(marker->current == 1);
    CHECK(marker->total == 2743);
  }

  SECTION("Marker in the middle of the line") {
    auto marker = ProgressExtractor::extract("LogCook: Display: Cooked packages [12/40] so far");
    REQUIRE(marker.has_value());
    CHECK(*marker == ProgressMarker{12, 40});
  }

  SECTION("Whitespace inside the brackets") {
    auto marker = ProgressExtractor::extract("[ 7 / 9 ] Link");
    REQUIRE(marker.has_value());
    CHECK(*marker == ProgressMarker{7, 9});
  }
}

TEST_CASE("ProgressExtractor ignores lines without a pair", "[progress]") {
  CHECK_FALSE(ProgressExtractor::extract("Linking...").has_value());
  CHECK_FALSE(ProgressExtractor::extract("").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[Warning] something").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[1/]").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[/5]").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[1/5").has_value());
  CHECK_FALSE(ProgressExtractor::extract("1/5]").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[-1/5]").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[1.5/3]").has_value());
}

TEST_CASE("ProgressExtractor treats a zero total as no marker", "[progress]") {
  CHECK_FALSE(ProgressExtractor::extract("[5/0]").has_value());
  CHECK_FALSE(ProgressExtractor::extract("[0/0] then [1/2]").has_value());
}

TEST_CASE("ProgressExtractor uses the first complete pair", "[progress]") {
  auto marker = ProgressExtractor::extract("[Shader] [3/10] and [9/10]");
  REQUIRE(marker.has_value());
  CHECK(*marker == ProgressMarker{3, 10});
}

TEST_CASE("ProgressExtractor skips numbers that overflow", "[progress]") {
  auto marker = ProgressExtractor::extract("[99999999999999999999999/1] [2/4]");
  REQUIRE(marker.has_value());
  CHECK(*marker == ProgressMarker{2, 4});
}

TEST_CASE("ProgressExtractor is a pure function of the line", "[progress]") {
  const char *line = "[4/8] Compiling Bar.cpp";
  auto first = ProgressExtractor::extract(line);
  auto second = ProgressExtractor::extract(line);
  CHECK(first == second);
}

TEST_CASE("ProgressMarker fraction", "[progress]") {
  CHECK(ProgressMarker{1, 4}.fraction() == Approx(0.25));
  CHECK(ProgressMarker{10, 10}.fraction() == Approx(1.0));
  CHECK(ProgressMarker{12, 10}.fraction() == Approx(1.0));
  CHECK(ProgressMarker{3, 0}.fraction() == Approx(0.0));
}
