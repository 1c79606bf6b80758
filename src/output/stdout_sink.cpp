#include "output/stdout_sink.hpp"

namespace fourree::output {

bool StdoutSink::Open(std::string& error) {
  if (open_) {
    error = "stdout sink is already open";
    return false;
  }
  open_ = true;
  return true;
}

bool StdoutSink::Write(std::string_view chunk, std::string& error) {
  if (!open_) {
    error = "stdout sink must be opened before write";
    return false;
  }

  out_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  if (!*out_) {
    error = "failed while writing to stdout";
    return false;
  }
  return true;
}

bool StdoutSink::Close(std::string& error) {
  if (!open_) {
    error = "stdout sink is not open";
    return false;
  }

  open_ = false;
  out_->flush();
  if (!*out_) {
    error = "failed to flush stdout";
    return false;
  }
  return true;
}

std::string StdoutSink::Describe() const {
  return "stdout";
}

} // namespace fourree::output
