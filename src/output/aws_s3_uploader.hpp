#pragma once

#include "output/s3_sink.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Aws::S3 {
class S3Client;
} // namespace Aws::S3

namespace fourree::output {

// IMultipartUploader on aws-sdk-cpp. Only built when the SDK is found at
// configure time (see IsS3EnabledAtBuild).
//
// Credentials and region come from the SDK's default chain (environment,
// profile, instance metadata); without a configured region us-east-1 is used.
// The SDK is initialized on first construction and shut down when the last
// uploader is destroyed.
class AwsS3Uploader final : public IMultipartUploader {
public:
  AwsS3Uploader();
  ~AwsS3Uploader() override;

  AwsS3Uploader(const AwsS3Uploader&) = delete;
  AwsS3Uploader& operator=(const AwsS3Uploader&) = delete;

  bool Begin(const S3Location& location, std::string& upload_id, std::string& error) override;
  bool UploadPart(const S3Location& location, const std::string& upload_id, int part_number,
                  std::string_view data, std::string& etag, std::string& error) override;
  bool Complete(const S3Location& location, const std::string& upload_id,
                const std::vector<S3CompletedPart>& parts, std::string& error) override;
  bool Abort(const S3Location& location, const std::string& upload_id,
             std::string& error) override;

private:
  std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace fourree::output
