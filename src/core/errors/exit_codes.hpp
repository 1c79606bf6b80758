#pragma once

namespace fourree::core::errors {

// Process-exit contract for scripts and container orchestration.
//
// - 0 success (including help/version output)
// - 1 generation or I/O failure after a valid invocation
// - 2 usage/argument failure
// - 10 table schema failed validation
// - 20 requested output mode is recognized but not available
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kSchemaInvalid = 10,
  kOutputUnsupported = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace fourree::core::errors
