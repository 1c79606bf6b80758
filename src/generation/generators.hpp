#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace fourree::generation {

// PRNG used by every value generator. One instance per batch, seeded through
// DeriveSeed, keeps output reproducible for a given base seed.
using Rng = std::mt19937_64;

// Calendar date produced by GenerateDate.
struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;

  // Renders `M/D/YYYY` without zero padding, e.g. `3/7/1984`.
  std::string ToString() const;
};

bool IsLeapYear(int year);
int DaysInMonth(int year, int month);

// Mixes a base seed with a stream index (batch number) into an independent
// seed. Consecutive indexes give statistically unrelated streams.
std::uint64_t DeriveSeed(std::uint64_t base_seed, std::uint64_t stream_index);

// Uniform integer in the inclusive range [min, max]. Requires min <= max.
std::int64_t GenerateInteger(Rng& rng, std::int64_t min, std::int64_t max);

// Normal sample truncated toward zero. A zero std_dev yields `mean`.
std::int64_t GenerateGauss(Rng& rng, double mean, double std_dev);

double GenerateGaussFloat(Rng& rng, double mean, double std_dev);

// `length` characters drawn uniformly from `alphabet` (must not be empty).
std::string GenerateString(Rng& rng, std::size_t length, std::string_view alphabet);

// Uniform year in [min_year, max_year], uniform month, then a day that is
// valid for that month and year.
Date GenerateDate(Rng& rng, int min_year, int max_year);

// Uniform pick. `choices` must not be empty.
const std::string& GenerateChoice(Rng& rng, const std::vector<std::string>& choices);

} // namespace fourree::generation
