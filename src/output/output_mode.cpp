#include "output/output_mode.hpp"

#include "output/file_sink.hpp"
#include "output/s3_sink.hpp"
#include "output/stdout_sink.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#ifndef FOURREE_ENABLE_S3
#define FOURREE_ENABLE_S3 0
#endif

#ifndef FOURREE_S3_REQUESTED
#define FOURREE_S3_REQUESTED 0
#endif

#if FOURREE_ENABLE_S3
#include "output/aws_s3_uploader.hpp"
#endif

namespace fourree::output {

std::string ExpectedOutputModeList() {
  return "stdout|file|postgresql|s3";
}

bool ParseOutputMode(std::string_view raw, OutputMode& mode, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "stdout") {
    mode = OutputMode::kStdout;
    return true;
  }
  if (normalized == "file") {
    mode = OutputMode::kFile;
    return true;
  }
  if (normalized == "postgresql") {
    mode = OutputMode::kPostgreSql;
    return true;
  }
  if (normalized == "s3") {
    mode = OutputMode::kS3;
    return true;
  }

  error = "unsupported output '" + std::string(raw) + "' (expected " + ExpectedOutputModeList() +
          ")";
  return false;
}

const char* ToString(OutputMode mode) {
  switch (mode) {
  case OutputMode::kStdout:
    return "stdout";
  case OutputMode::kFile:
    return "file";
  case OutputMode::kPostgreSql:
    return "postgresql";
  case OutputMode::kS3:
    return "s3";
  }
  return "stdout";
}

bool IsS3EnabledAtBuild() {
#if FOURREE_ENABLE_S3
  return true;
#else
  return false;
#endif
}

std::string_view S3AvailabilityStatusText() {
#if FOURREE_ENABLE_S3
  return "enabled";
#elif FOURREE_S3_REQUESTED
  return "disabled (aws-sdk-cpp not found)";
#else
  return "disabled (build option OFF)";
#endif
}

bool IsOutputModeImplemented(OutputMode mode) {
  switch (mode) {
  case OutputMode::kStdout:
  case OutputMode::kFile:
    return true;
  case OutputMode::kS3:
    return IsS3EnabledAtBuild();
  case OutputMode::kPostgreSql:
    return false;
  }
  return false;
}

bool ParseS3Location(std::string_view raw, S3Location& location, std::string& error) {
  const std::size_t colon = raw.find(':');
  if (colon == std::string_view::npos) {
    error = "output_file must follow the format bucket:path when output is s3";
    return false;
  }

  S3Location parsed;
  parsed.bucket = std::string(raw.substr(0, colon));
  parsed.key = std::string(raw.substr(colon + 1));
  if (parsed.bucket.empty()) {
    error = "s3 bucket name cannot be empty";
    return false;
  }
  if (parsed.key.empty()) {
    error = "s3 object key cannot be empty";
    return false;
  }

  location = std::move(parsed);
  return true;
}

std::unique_ptr<IOutputSink> CreateOutputSink(OutputMode mode, const std::string& target,
                                              std::string& error) {
  switch (mode) {
  case OutputMode::kStdout:
    return std::make_unique<StdoutSink>();
  case OutputMode::kFile:
    if (target.empty()) {
      error = "output_file is required when output is file";
      return nullptr;
    }
    return std::make_unique<FileSink>(target);
  case OutputMode::kPostgreSql:
    error = "postgresql output is not implemented";
    return nullptr;
  case OutputMode::kS3: {
    S3Location location;
    if (!ParseS3Location(target, location, error)) {
      return nullptr;
    }
#if FOURREE_ENABLE_S3
    return std::make_unique<S3Sink>(std::move(location), std::make_unique<AwsS3Uploader>());
#else
    error = "s3 output is not available in this build: " + std::string(S3AvailabilityStatusText());
    return nullptr;
#endif
  }
  }

  error = "an invalid output mode was specified";
  return nullptr;
}

} // namespace fourree::output
