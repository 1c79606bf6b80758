#include "output/file_sink.hpp"

#include "core/fs_utils.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fourree::output {

FileSink::FileSink(fs::path path) : path_(std::move(path)) {}

FileSink::~FileSink() {
  DiscardTempFile();
}

bool FileSink::Open(std::string& error) {
  if (out_.is_open()) {
    error = "file sink is already open: " + path_.string();
    return false;
  }
  if (!core::EnsureParentDirectory(path_, error)) {
    return false;
  }

  std::error_code ec;
  if (fs::is_directory(path_, ec) && !ec) {
    error = "output file path is a directory: " + path_.string();
    return false;
  }

  temp_path_ = core::BuildAtomicTempPath(path_);
  out_.open(temp_path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    error = "failed to open output file '" + temp_path_.string() + "' for writing";
    temp_path_.clear();
    return false;
  }

  bytes_written_ = 0;
  return true;
}

bool FileSink::Write(std::string_view chunk, std::string& error) {
  if (!out_.is_open()) {
    error = "file sink must be opened before write";
    return false;
  }

  out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  if (!out_) {
    error = "failed while writing output file '" + temp_path_.string() + "'";
    return false;
  }
  bytes_written_ += chunk.size();
  return true;
}

bool FileSink::Close(std::string& error) {
  if (!out_.is_open()) {
    error = "file sink is not open";
    return false;
  }

  out_.flush();
  const bool write_ok = static_cast<bool>(out_);
  out_.close();
  if (!write_ok || out_.fail()) {
    error = "failed to flush output file '" + temp_path_.string() + "'";
    DiscardTempFile();
    return false;
  }

  if (!core::PublishTempFile(temp_path_, path_, error)) {
    temp_path_.clear();
    return false;
  }
  temp_path_.clear();
  return true;
}

std::string FileSink::Describe() const {
  return path_.string();
}

void FileSink::DiscardTempFile() {
  if (out_.is_open()) {
    out_.close();
  }
  if (temp_path_.empty()) {
    return;
  }

  std::error_code ec;
  (void)fs::remove(temp_path_, ec);
  temp_path_.clear();
}

} // namespace fourree::output
