#pragma once

#include "output/output_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fourree::output {

// S3 rejects non-final multipart parts smaller than 5 MiB.
constexpr std::size_t kS3MinPartBytes = 5U * 1024U * 1024U;

struct S3Location {
  std::string bucket;
  std::string key;
};

struct S3CompletedPart {
  int part_number = 0;
  std::string etag;
};

// The four multipart-upload calls S3Sink needs. The production
// implementation talks to S3; tests substitute a recorder.
class IMultipartUploader {
public:
  virtual ~IMultipartUploader() = default;

  virtual bool Begin(const S3Location& location, std::string& upload_id, std::string& error) = 0;
  virtual bool UploadPart(const S3Location& location, const std::string& upload_id,
                          int part_number, std::string_view data, std::string& etag,
                          std::string& error) = 0;
  virtual bool Complete(const S3Location& location, const std::string& upload_id,
                        const std::vector<S3CompletedPart>& parts, std::string& error) = 0;
  virtual bool Abort(const S3Location& location, const std::string& upload_id,
                     std::string& error) = 0;
};

// Streams rows into one S3 object through a multipart upload.
//
// Contract:
// - Open starts the upload.
// - Write buffers chunks and uploads a part once more than `part_threshold`
//   bytes are pending.
// - Close uploads the remainder (or one empty part when nothing was written)
//   and completes the upload.
// - Any failed upload, failed completion or destruction without Close aborts
//   the upload so no partial object is published.
class S3Sink final : public IOutputSink {
public:
  S3Sink(S3Location location, std::unique_ptr<IMultipartUploader> uploader,
         std::size_t part_threshold = kS3MinPartBytes);
  ~S3Sink() override;

  S3Sink(const S3Sink&) = delete;
  S3Sink& operator=(const S3Sink&) = delete;

  bool Open(std::string& error) override;
  bool Write(std::string_view chunk, std::string& error) override;
  bool Close(std::string& error) override;
  std::string Describe() const override;

  const std::vector<S3CompletedPart>& completed_parts() const {
    return parts_;
  }

  std::size_t pending_bytes() const {
    return buffer_.size();
  }

  std::uint64_t bytes_written() const {
    return bytes_written_;
  }

private:
  bool UploadPendingPart(std::string& error);
  // Aborts the in-flight upload; an abort failure is appended to `error`.
  void AbortUpload(std::string& error);

  S3Location location_;
  std::unique_ptr<IMultipartUploader> uploader_;
  std::size_t part_threshold_ = kS3MinPartBytes;
  std::string upload_id_;
  std::string buffer_;
  std::vector<S3CompletedPart> parts_;
  std::uint64_t bytes_written_ = 0;
  bool uploading_ = false;
};

} // namespace fourree::output
