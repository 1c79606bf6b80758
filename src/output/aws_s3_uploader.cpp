#include "output/aws_s3_uploader.hpp"

#include <aws/core/Aws.h>
#include <aws/core/Region.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdint>
#include <exception>
#include <ios>
#include <mutex>

namespace fourree::output {

namespace {

constexpr const char* kAllocationTag = "fourree";

// Aws::InitAPI / ShutdownAPI must be balanced once per process.
std::mutex g_api_mu;
std::uint32_t g_api_users = 0;
Aws::SDKOptions g_api_options;

void AcquireAwsApi() {
  std::lock_guard<std::mutex> lock(g_api_mu);
  if (g_api_users == 0U) {
    Aws::InitAPI(g_api_options);
  }
  ++g_api_users;
}

void ReleaseAwsApi() {
  std::lock_guard<std::mutex> lock(g_api_mu);
  if (g_api_users == 0U) {
    return;
  }
  --g_api_users;
  if (g_api_users == 0U) {
    Aws::ShutdownAPI(g_api_options);
  }
}

Aws::String ToAws(std::string_view text) {
  return Aws::String(text.data(), text.size());
}

std::string FromAws(const Aws::String& text) {
  return std::string(text.c_str(), text.size());
}

template <typename Outcome>
std::string DescribeFailure(const Outcome& outcome) {
  const auto& failure = outcome.GetError();
  return FromAws(failure.GetExceptionName()) + ": " + FromAws(failure.GetMessage());
}

} // namespace

AwsS3Uploader::AwsS3Uploader() {
  AcquireAwsApi();
  try {
    Aws::Client::ClientConfiguration config;
    if (config.region.empty()) {
      config.region = Aws::Region::US_EAST_1;
    }
    client_ = std::make_unique<Aws::S3::S3Client>(config);
  } catch (const std::exception&) {
    ReleaseAwsApi();
    throw;
  }
}

AwsS3Uploader::~AwsS3Uploader() {
  // The client must go before the SDK shuts down.
  client_.reset();
  ReleaseAwsApi();
}

bool AwsS3Uploader::Begin(const S3Location& location, std::string& upload_id,
                          std::string& error) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(ToAws(location.bucket));
  request.SetKey(ToAws(location.key));

  const auto outcome = client_->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    error = DescribeFailure(outcome);
    return false;
  }
  upload_id = FromAws(outcome.GetResult().GetUploadId());
  return true;
}

bool AwsS3Uploader::UploadPart(const S3Location& location, const std::string& upload_id,
                               int part_number, std::string_view data, std::string& etag,
                               std::string& error) {
  auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
  body->write(data.data(), static_cast<std::streamsize>(data.size()));

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(ToAws(location.bucket));
  request.SetKey(ToAws(location.key));
  request.SetUploadId(ToAws(upload_id));
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(data.size()));
  request.SetBody(body);

  const auto outcome = client_->UploadPart(request);
  if (!outcome.IsSuccess()) {
    error = DescribeFailure(outcome);
    return false;
  }
  etag = FromAws(outcome.GetResult().GetETag());
  return true;
}

bool AwsS3Uploader::Complete(const S3Location& location, const std::string& upload_id,
                             const std::vector<S3CompletedPart>& parts, std::string& error) {
  Aws::S3::Model::CompletedMultipartUpload upload;
  for (const S3CompletedPart& part : parts) {
    Aws::S3::Model::CompletedPart completed;
    completed.SetPartNumber(part.part_number);
    completed.SetETag(ToAws(part.etag));
    upload.AddParts(completed);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(ToAws(location.bucket));
  request.SetKey(ToAws(location.key));
  request.SetUploadId(ToAws(upload_id));
  request.SetMultipartUpload(upload);

  const auto outcome = client_->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    error = DescribeFailure(outcome);
    return false;
  }
  return true;
}

bool AwsS3Uploader::Abort(const S3Location& location, const std::string& upload_id,
                          std::string& error) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(ToAws(location.bucket));
  request.SetKey(ToAws(location.key));
  request.SetUploadId(ToAws(upload_id));

  const auto outcome = client_->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    error = DescribeFailure(outcome);
    return false;
  }
  return true;
}

} // namespace fourree::output
