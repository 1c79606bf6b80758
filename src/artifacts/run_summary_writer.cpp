#include "artifacts/run_summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <cstdio>
#include <sstream>
#include <string_view>

namespace fourree::artifacts {

namespace {

// JSON string literal; control characters become \uXXXX escapes.
std::string Quote(std::string_view text) {
  std::string quoted;
  quoted.reserve(text.size() + 2U);
  quoted.push_back('"');
  for (const char ch : text) {
    switch (ch) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\r':
      quoted += "\\r";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char escaped[7];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(ch)));
        quoted += escaped;
      } else {
        quoted.push_back(ch);
      }
      break;
    }
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace

std::string ToJson(const GenerationSummary& summary) {
  std::ostringstream out;
  out << "{\n"
      << "  \"table_name\":" << Quote(summary.table_name) << ",\n"
      << "  \"output_mode\":" << Quote(summary.output_mode) << ",\n"
      << "  \"output_target\":" << Quote(summary.output_target) << ",\n"
      << "  \"num_rows\":" << summary.num_rows << ",\n"
      << "  \"batch_size\":" << summary.batch_size << ",\n"
      << "  \"num_threads\":" << summary.num_threads << ",\n"
      << "  \"seed\":" << summary.seed << ",\n"
      << "  \"rows_written\":" << summary.rows_written << ",\n"
      << "  \"batches_written\":" << summary.batches_written << ",\n"
      << "  \"bytes_written\":" << summary.bytes_written << ",\n"
      << "  \"header_written\":" << (summary.header_written ? "true" : "false") << ",\n"
      << "  \"elapsed_ms\":" << summary.elapsed.count() << ",\n"
      << "  \"started_at_utc\":" << Quote(core::FormatUtcTimestamp(summary.started_at))
      << ",\n"
      << "  \"finished_at_utc\":"
      << Quote(core::FormatUtcTimestamp(summary.finished_at)) << "\n"
      << "}";
  return out.str();
}

bool WriteGenerationSummaryJson(const GenerationSummary& summary,
                                const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "summary path cannot be empty";
    return false;
  }

  // Trailing newline keeps the file friendly to `cat` and diffs.
  return core::WriteTextFileAtomic(output_path, ToJson(summary) + "\n", error);
}

} // namespace fourree::artifacts
