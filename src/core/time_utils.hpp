#ifndef FOURREE_CORE_TIME_UTILS_HPP_
#define FOURREE_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <string>

namespace fourree::core {

// `YYYY-MM-DDTHH:MM:SS.mmmZ`, shared by log lines and the run summary.
// Returns an empty string if the time cannot be broken down.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - seconds).count();

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(seconds);
  std::tm utc{};
  if (gmtime_r(&epoch_seconds, &utc) == nullptr) {
    return "";
  }

  char buffer[32];
  const std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  std::snprintf(buffer + length, sizeof(buffer) - length, ".%03dZ", static_cast<int>(millis));
  return buffer;
}

} // namespace fourree::core

#endif // FOURREE_CORE_TIME_UTILS_HPP_
