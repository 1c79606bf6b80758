#pragma once

#include "core/logging/logger.hpp"
#include "generation/pipeline.hpp"
#include "generation/row_generator.hpp"
#include "output/output_mode.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fourree::cli {

constexpr std::string_view kVersion = "0.1.0";

// Everything one `fourree FILE [options]` invocation asks for.
struct RunOptions {
  std::string schema_path;
  std::uint64_t num_rows = generation::kDefaultNumRows;
  std::uint64_t batch_size = generation::kDefaultBatchSize;
  std::uint32_t num_threads = generation::kDefaultThreads;
  output::OutputMode output_mode = output::OutputMode::kStdout;
  std::string output_file;
  std::filesystem::path log_file;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::string delimiter = std::string(generation::kDefaultDelimiter);
  bool header = false;
  std::optional<std::uint64_t> seed;
  std::filesystem::path summary_path;
  bool validate_only = false;
  bool show_help = false;
  bool show_version = false;
};

// Parses the arguments after the program name.
//
// Contract:
// - `-h`/`--help` anywhere sets `show_help` and short-circuits every other
//   check, including unknown options.
// - Long options take `--name value` or `--name=value`; `_` and `-` are
//   interchangeable inside the name.
// - Adjusted-but-accepted values (thread clamp, ignored options) are reported
//   through `warnings`.
// - Returns false with `error` set for anything that is a usage error.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::vector<std::string>& warnings, std::string& error);

void PrintUsage(std::ostream& out);

// Runs validation or generation for already parsed options and returns the
// process exit code.
int ExecuteRun(const RunOptions& options, const std::vector<std::string>& warnings);

// Process entry contract for scripts and containers:
//   0  => success, including help and version output
//   1  => generation or I/O failure after a valid invocation
//   2  => usage error
//   10 => table schema failed validation
//   20 => output mode recognized but not available in this build
// Invoked with no arguments it behaves exactly like `-h`.
int Dispatch(int argc, char** argv);

} // namespace fourree::cli
