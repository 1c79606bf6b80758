#pragma once

#include "output/output_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fourree::output {

// Writes rows to `path` through a temporary sibling file.
//
// Contract:
// - Open creates missing parent directories and the temp file.
// - Close flushes and renames the temp file onto `path`.
// - Destruction without a successful Close removes the temp file, so a failed
//   run never publishes a truncated data file.
class FileSink final : public IOutputSink {
public:
  explicit FileSink(std::filesystem::path path);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  bool Open(std::string& error) override;
  bool Write(std::string_view chunk, std::string& error) override;
  bool Close(std::string& error) override;
  std::string Describe() const override;

  const std::filesystem::path& path() const {
    return path_;
  }

  // Empty until Open succeeds; cleared once the file is published.
  const std::filesystem::path& temp_path() const {
    return temp_path_;
  }

  std::uint64_t bytes_written() const {
    return bytes_written_;
  }

private:
  void DiscardTempFile();

  std::filesystem::path path_;
  std::filesystem::path temp_path_;
  std::ofstream out_;
  std::uint64_t bytes_written_ = 0;
};

} // namespace fourree::output
