#include "generation/generators.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace gen = fourree::generation;

TEST_CASE("Leap years follow the Gregorian rules", "[generation][date]") {
  REQUIRE(gen::IsLeapYear(2000));
  REQUIRE(gen::IsLeapYear(2016));
  REQUIRE_FALSE(gen::IsLeapYear(1900));
  REQUIRE_FALSE(gen::IsLeapYear(2015));

  REQUIRE(gen::DaysInMonth(2016, 2) == 29);
  REQUIRE(gen::DaysInMonth(1900, 2) == 28);
  REQUIRE(gen::DaysInMonth(2015, 4) == 30);
  REQUIRE(gen::DaysInMonth(2015, 12) == 31);
}

TEST_CASE("Dates render as M/D/YYYY without padding", "[generation][date]") {
  REQUIRE(gen::Date{.year = 1984, .month = 3, .day = 7}.ToString() == "3/7/1984");
  REQUIRE(gen::Date{.year = 2016, .month = 12, .day = 31}.ToString() == "12/31/2016");
}

TEST_CASE("Generated dates are calendar-valid and inside the year range", "[generation][date]") {
  gen::Rng rng(7);
  bool saw_leap_day = false;
  for (int i = 0; i < 20000; ++i) {
    const gen::Date date = gen::GenerateDate(rng, 1996, 2000);
    REQUIRE(date.year >= 1996);
    REQUIRE(date.year <= 2000);
    REQUIRE(date.month >= 1);
    REQUIRE(date.month <= 12);
    REQUIRE(date.day >= 1);
    REQUIRE(date.day <= gen::DaysInMonth(date.year, date.month));
    if (date.month == 2 && date.day == 29) {
      REQUIRE(gen::IsLeapYear(date.year));
      saw_leap_day = true;
    }
  }
  REQUIRE(saw_leap_day);
}

TEST_CASE("Integers cover the inclusive range", "[generation][integer]") {
  gen::Rng rng(11);
  std::set<std::int64_t> seen;
  for (int i = 0; i < 2000; ++i) {
    const std::int64_t value = gen::GenerateInteger(rng, -2, 2);
    REQUIRE(value >= -2);
    REQUIRE(value <= 2);
    seen.insert(value);
  }
  REQUIRE(seen.size() == 5U);

  REQUIRE(gen::GenerateInteger(rng, 42, 42) == 42);
  REQUIRE(gen::GenerateInteger(rng, INT64_MAX, INT64_MAX) == INT64_MAX);
}

TEST_CASE("Gauss samples center on the mean", "[generation][gauss]") {
  gen::Rng rng(3);
  constexpr int kSamples = 20000;
  double total = 0.0;
  for (int i = 0; i < kSamples; ++i) {
    total += gen::GenerateGaussFloat(rng, 100.0, 10.0);
  }
  REQUIRE(std::fabs(total / kSamples - 100.0) < 1.0);

  REQUIRE(gen::GenerateGaussFloat(rng, 2.5, 0.0) == 2.5);
  REQUIRE(gen::GenerateGauss(rng, 2.9, 0.0) == 2);
  REQUIRE(gen::GenerateGauss(rng, -2.9, 0.0) == -2);
  REQUIRE(gen::GenerateGauss(rng, 1e300, 0.0) == INT64_MAX);
}

TEST_CASE("Strings use only the requested alphabet", "[generation][string]") {
  gen::Rng rng(5);
  const std::string value = gen::GenerateString(rng, 64, "xyz");
  REQUIRE(value.size() == 64U);
  REQUIRE(value.find_first_not_of("xyz") == std::string::npos);

  REQUIRE(gen::GenerateString(rng, 0, "ABC").empty());
  REQUIRE(gen::GenerateString(rng, 5, "").empty());
}

TEST_CASE("Choices are picked from the list", "[generation][choice]") {
  gen::Rng rng(9);
  const std::vector<std::string> choices = {"A", "B", "C"};
  std::set<std::string> seen;
  for (int i = 0; i < 300; ++i) {
    seen.insert(gen::GenerateChoice(rng, choices));
  }
  REQUIRE(seen == std::set<std::string>{"A", "B", "C"});
}

TEST_CASE("Derived seeds are stable and distinct per stream", "[generation][seed]") {
  REQUIRE(gen::DeriveSeed(42, 0) == gen::DeriveSeed(42, 0));
  REQUIRE(gen::DeriveSeed(42, 0) != gen::DeriveSeed(42, 1));
  REQUIRE(gen::DeriveSeed(42, 1) != gen::DeriveSeed(43, 1));

  std::set<std::uint64_t> seeds;
  for (std::uint64_t i = 0; i < 1000; ++i) {
    seeds.insert(gen::DeriveSeed(0, i));
  }
  REQUIRE(seeds.size() == 1000U);
}
