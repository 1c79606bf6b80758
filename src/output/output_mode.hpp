#pragma once

#include "output/output_sink.hpp"
#include "output/s3_sink.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace fourree::output {

enum class OutputMode {
  kStdout,
  kFile,
  kPostgreSql,
  kS3,
};

std::string ExpectedOutputModeList();

bool ParseOutputMode(std::string_view raw, OutputMode& mode, std::string& error);
const char* ToString(OutputMode mode);

// True when the S3 sink was compiled in (aws-sdk-cpp found at configure time).
bool IsS3EnabledAtBuild();

// "enabled", "disabled (aws-sdk-cpp not found)" or "disabled (build option OFF)".
std::string_view S3AvailabilityStatusText();

// Recognized modes that this build cannot write to (PostgreSQL, and S3 without
// the SDK) return false so callers can report them separately from usage
// errors.
bool IsOutputModeImplemented(OutputMode mode);

// Splits `bucket:key`. Both parts must be non-empty; the key may itself
// contain ':'.
bool ParseS3Location(std::string_view raw, S3Location& location, std::string& error);

// Builds the sink for an implemented mode. `target` is the output file path
// for kFile, `bucket:key` for kS3 and ignored for kStdout. Returns nullptr with `error` set when the
// mode is not implemented or its target is missing.
std::unique_ptr<IOutputSink> CreateOutputSink(OutputMode mode, const std::string& target,
                                              std::string& error);

} // namespace fourree::output
