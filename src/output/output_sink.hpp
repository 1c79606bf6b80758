#pragma once

#include <string>
#include <string_view>

namespace fourree::output {

// Destination for generated rows. The writer thread is the only caller, so
// implementations need no internal locking.
//
// Lifecycle: Open -> Write* -> Close. A sink destroyed without a successful
// Close must not leave partial output behind where that is possible.
class IOutputSink {
public:
  virtual ~IOutputSink() = default;

  virtual bool Open(std::string& error) = 0;

  // Appends one chunk (a header or a batch of rows).
  virtual bool Write(std::string_view chunk, std::string& error) = 0;

  // Flushes and publishes everything written so far.
  virtual bool Close(std::string& error) = 0;

  // Human-readable target used in logs and the run summary.
  virtual std::string Describe() const = 0;
};

} // namespace fourree::output
