#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fourree::artifacts {

// Everything a finished generation run reports about itself.
struct GenerationSummary {
  std::string table_name;
  std::string output_mode;
  std::string output_target;
  std::uint64_t num_rows = 0;
  std::uint64_t batch_size = 0;
  std::uint32_t num_threads = 0;
  std::uint64_t seed = 0;
  std::uint64_t rows_written = 0;
  std::uint64_t batches_written = 0;
  std::uint64_t bytes_written = 0;
  bool header_written = false;
  std::chrono::milliseconds elapsed{0};
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

std::string ToJson(const GenerationSummary& summary);

// Writes the run summary JSON.
//
// Contract:
// - creates the parent directory of `output_path` when missing.
// - content lands under a temp name first and is renamed into place, so a
//   reader never sees a partial summary.
// - returns false and sets `error` on failure.
bool WriteGenerationSummaryJson(const GenerationSummary& summary,
                                const std::filesystem::path& output_path, std::string& error);

} // namespace fourree::artifacts
