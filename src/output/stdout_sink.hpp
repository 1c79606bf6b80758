#pragma once

#include "output/output_sink.hpp"

#include <iostream>
#include <ostream>

namespace fourree::output {

// Streams rows to stdout (or any injected stream, for tests).
class StdoutSink final : public IOutputSink {
public:
  explicit StdoutSink(std::ostream& out = std::cout) : out_(&out) {}

  bool Open(std::string& error) override;
  bool Write(std::string_view chunk, std::string& error) override;
  bool Close(std::string& error) override;
  std::string Describe() const override;

private:
  std::ostream* out_;
  bool open_ = false;
};

} // namespace fourree::output
