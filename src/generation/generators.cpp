#include "generation/generators.hpp"

#include <cmath>
#include <limits>

namespace fourree::generation {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kStreamSalt = 0xa0761d6478bd642fULL;

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

std::int64_t TruncateToInt64(double value) {
  // Saturate rather than invoke undefined behaviour on wild tails.
  constexpr double kMax = 9223372036854775807.0;
  constexpr double kMin = -9223372036854775808.0;
  if (std::isnan(value)) {
    return 0;
  }
  if (value >= kMax) {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (value <= kMin) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return static_cast<std::int64_t>(std::trunc(value));
}

} // namespace

std::string Date::ToString() const {
  return std::to_string(month) + "/" + std::to_string(day) + "/" + std::to_string(year);
}

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  switch (month) {
  case 1:
  case 3:
  case 5:
  case 7:
  case 8:
  case 10:
  case 12:
    return 31;
  case 2:
    return IsLeapYear(year) ? 29 : 28;
  default:
    return 30;
  }
}

std::uint64_t DeriveSeed(std::uint64_t base_seed, std::uint64_t stream_index) {
  return SplitMix64((base_seed ^ kStreamSalt) + stream_index * kSplitMixIncrement);
}

std::int64_t GenerateInteger(Rng& rng, std::int64_t min, std::int64_t max) {
  std::uniform_int_distribution<std::int64_t> dist(min, max);
  return dist(rng);
}

std::int64_t GenerateGauss(Rng& rng, double mean, double std_dev) {
  return TruncateToInt64(GenerateGaussFloat(rng, mean, std_dev));
}

double GenerateGaussFloat(Rng& rng, double mean, double std_dev) {
  if (std_dev <= 0.0) {
    return mean;
  }
  std::normal_distribution<double> dist(mean, std_dev);
  return dist(rng);
}

std::string GenerateString(Rng& rng, std::size_t length, std::string_view alphabet) {
  std::string result;
  if (alphabet.empty()) {
    return result;
  }

  std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
  result.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    result.push_back(alphabet[dist(rng)]);
  }
  return result;
}

Date GenerateDate(Rng& rng, int min_year, int max_year) {
  Date date;
  date.year = std::uniform_int_distribution<int>(min_year, max_year)(rng);
  date.month = std::uniform_int_distribution<int>(1, 12)(rng);
  date.day = std::uniform_int_distribution<int>(1, DaysInMonth(date.year, date.month))(rng);
  return date;
}

const std::string& GenerateChoice(Rng& rng, const std::vector<std::string>& choices) {
  std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
  return choices[dist(rng)];
}

} // namespace fourree::generation
