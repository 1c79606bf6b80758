#include "output/s3_sink.hpp"

#include <utility>

namespace fourree::output {

S3Sink::S3Sink(S3Location location, std::unique_ptr<IMultipartUploader> uploader,
               std::size_t part_threshold)
    : location_(std::move(location)), uploader_(std::move(uploader)),
      part_threshold_(part_threshold) {}

S3Sink::~S3Sink() {
  if (uploading_) {
    std::string abort_error;
    AbortUpload(abort_error);
  }
}

bool S3Sink::Open(std::string& error) {
  if (uploader_ == nullptr) {
    error = "s3 sink has no uploader";
    return false;
  }
  if (uploading_) {
    error = "s3 upload already started for " + Describe();
    return false;
  }

  std::string upload_id;
  std::string begin_error;
  if (!uploader_->Begin(location_, upload_id, begin_error)) {
    error = "failed to start multipart upload to " + Describe() + ": " + begin_error;
    return false;
  }
  if (upload_id.empty()) {
    error = "no upload id returned for " + Describe();
    return false;
  }

  upload_id_ = std::move(upload_id);
  buffer_.clear();
  parts_.clear();
  bytes_written_ = 0;
  uploading_ = true;
  return true;
}

bool S3Sink::Write(std::string_view chunk, std::string& error) {
  if (!uploading_) {
    error = "s3 sink is not open";
    return false;
  }

  buffer_.append(chunk);
  bytes_written_ += chunk.size();
  if (buffer_.size() <= part_threshold_) {
    return true;
  }

  if (!UploadPendingPart(error)) {
    AbortUpload(error);
    return false;
  }
  return true;
}

bool S3Sink::Close(std::string& error) {
  if (!uploading_) {
    error = "s3 sink is not open";
    return false;
  }

  // A multipart upload needs at least one part, even for empty output.
  if (!buffer_.empty() || parts_.empty()) {
    if (!UploadPendingPart(error)) {
      AbortUpload(error);
      return false;
    }
  }

  std::string complete_error;
  if (!uploader_->Complete(location_, upload_id_, parts_, complete_error)) {
    error = "failed to complete multipart upload to " + Describe() + ": " + complete_error;
    AbortUpload(error);
    return false;
  }

  uploading_ = false;
  return true;
}

std::string S3Sink::Describe() const {
  return "s3://" + location_.bucket + "/" + location_.key;
}

bool S3Sink::UploadPendingPart(std::string& error) {
  const int part_number = static_cast<int>(parts_.size()) + 1;
  std::string etag;
  std::string part_error;
  if (!uploader_->UploadPart(location_, upload_id_, part_number, buffer_, etag, part_error)) {
    error = "failed to upload part " + std::to_string(part_number) + " to " + Describe() + ": " +
            part_error;
    return false;
  }

  parts_.push_back({.part_number = part_number, .etag = std::move(etag)});
  buffer_.clear();
  return true;
}

void S3Sink::AbortUpload(std::string& error) {
  uploading_ = false;
  buffer_.clear();

  std::string abort_error;
  if (!uploader_->Abort(location_, upload_id_, abort_error)) {
    error += "; abort also failed (" + abort_error + "), abort upload " + upload_id_ +
             " through the S3 API";
  }
}

} // namespace fourree::output
