/*
 * Copyright 2022 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


#include "aws_s3_operations.h"

#include <memory>
#include <string>
#include <utility>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/utils/Outcome.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/ChecksumAlgorithm.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include "absl/functional/bind_front.h"
#include "absl/strings/match.h"
#include "src/core/async_executor/aws/aws_async_executor.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/meta_request/aws/aws_s3_operations_utils.h"
#include "src/s3_client/meta_request/error_codes.h"

using Aws::String;
using Aws::Client::AsyncCallerContext;
using Aws::Client::ClientConfiguration;
using Aws::S3::S3Client;
using Aws::S3::Model::AbortMultipartUploadOutcome;
using Aws::S3::Model::AbortMultipartUploadRequest;
using Aws::S3::Model::CompletedMultipartUpload;
using Aws::S3::Model::CompleteMultipartUploadOutcome;
using Aws::S3::Model::CompleteMultipartUploadRequest;
using Aws::S3::Model::CreateMultipartUploadOutcome;
using Aws::S3::Model::CreateMultipartUploadRequest;
using Aws::S3::Model::PutObjectOutcome;
using Aws::S3::Model::PutObjectRequest;
using Aws::S3::Model::UploadPartOutcome;
using Aws::S3::Model::UploadPartRequest;
using AwsChecksumAlgorithm = Aws::S3::Model::ChecksumAlgorithm;
using s3upload::core::AsyncContext;
using s3upload::core::AsyncExecutorInterface;
using s3upload::core::AsyncPriority;
using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::async_executor::aws::AwsAsyncExecutor;
using s3upload::core::errors::SC_S3_META_REQUEST_EMPTY_ETAG;

namespace {
constexpr char kAwsS3Operations[] = "AwsS3Operations";
constexpr size_t kMaxConcurrentConnections = 1000;
constexpr char kContentLengthHeader[] = "Content-Length";

bool IsContentLength(const std::string& name) {
  return absl::EqualsIgnoreCase(name, kContentLengthHeader);
}

bool IsChecksumHeader(const std::string& name) {
  return absl::EqualsIgnoreCase(name,
                                s3upload::s3_client::kChecksumCrc32cHeader);
}

// Copies headers onto request. Content-Length follows the body and the
// checksum header goes through the typed setter of PutObjectRequest.
template <typename AwsRequest>
void SetRequestHeaders(
    const google::protobuf::RepeatedPtrField<s3upload::s3_client::v1::Header>&
        headers,
    AwsRequest& request) {
  for (const auto& header : headers) {
    if (IsContentLength(header.name()) || IsChecksumHeader(header.name())) {
      continue;
    }
    request.SetAdditionalCustomHeaderValue(header.name().c_str(),
                                           header.value().c_str());
  }
}

std::shared_ptr<Aws::IOStream> MakeBody(const std::string& data) {
  auto body = Aws::MakeShared<Aws::StringStream>(
      kAwsS3Operations, std::stringstream::in | std::stringstream::out |
                            std::stringstream::binary);
  body->write(data.data(), data.size());
  return body;
}

template <typename Context, typename Outcome>
bool FailIfUnsuccessful(
    Context& context, const Outcome& outcome, const char* operation,
    const std::shared_ptr<AsyncExecutorInterface>& callback_executor) {
  if (outcome.IsSuccess()) {
    return false;
  }
  context.result =
      s3upload::s3_client::AwsS3OperationsUtils::ConvertS3ErrorToExecutionResult(
          outcome.GetError());
  S3U_ERROR_CONTEXT(kAwsS3Operations, context, context.result,
                    "%s request failed. Error code: %d, message: %s",
                    operation,
                    static_cast<int>(outcome.GetError().GetResponseCode()),
                    outcome.GetError().GetMessage().c_str());
  FinishContext(context.result, context, callback_executor,
                AsyncPriority::High);
  return true;
}
}  // namespace

namespace s3upload::s3_client {

ExecutionResult AwsS3Operations::CreateMultipartUpload(
    AsyncContext<v1::CreateMultipartUploadRequest,
                 v1::CreateMultipartUploadResponse>& create_context) noexcept {
  const auto& request = *create_context.request;
  CreateMultipartUploadRequest create_request;
  create_request.SetBucket(request.bucket().c_str());
  create_request.SetKey(request.key().c_str());
  SetRequestHeaders(request.headers(), create_request);
  if (request.checksum_algorithm() == v1::CHECKSUM_ALGORITHM_CRC32C) {
    create_request.SetChecksumAlgorithm(AwsChecksumAlgorithm::CRC32C);
  }

  s3_client_->CreateMultipartUploadAsync(
      create_request,
      absl::bind_front(&AwsS3Operations::OnCreateMultipartUploadCallback, this,
                       create_context),
      nullptr);
  return SuccessExecutionResult();
}

void AwsS3Operations::OnCreateMultipartUploadCallback(
    AsyncContext<v1::CreateMultipartUploadRequest,
                 v1::CreateMultipartUploadResponse>& create_context,
    const S3Client* s3_client, const CreateMultipartUploadRequest& request,
    CreateMultipartUploadOutcome outcome,
    const std::shared_ptr<const AsyncCallerContext> async_context) noexcept {
  if (FailIfUnsuccessful(create_context, outcome, "CreateMultipartUpload",
                         callback_executor_)) {
    return;
  }
  const auto& result = outcome.GetResult();
  create_context.response =
      std::make_shared<v1::CreateMultipartUploadResponse>();
  create_context.response->set_upload_id(result.GetUploadId().c_str());
  AwsS3OperationsUtils::AppendResultHeaders(
      /*etag=*/"", result.GetServerSideEncryption(), result.GetSSEKMSKeyId(),
      *create_context.response->mutable_headers());
  FinishContext(SuccessExecutionResult(), create_context, callback_executor_,
                AsyncPriority::High);
}

ExecutionResult AwsS3Operations::UploadPart(
    AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
        upload_part_context) noexcept {
  const auto& request = *upload_part_context.request;
  UploadPartRequest part_request;
  part_request.SetBucket(request.bucket().c_str());
  part_request.SetKey(request.key().c_str());
  part_request.SetUploadId(request.upload_id().c_str());
  part_request.SetPartNumber(request.part_number());
  part_request.SetContentLength(request.data().size());
  part_request.SetBody(MakeBody(request.data()));
  if (request.has_checksum_crc32c()) {
    part_request.SetChecksumAlgorithm(AwsChecksumAlgorithm::CRC32C);
    part_request.SetChecksumCRC32C(request.checksum_crc32c().c_str());
  }

  s3_client_->UploadPartAsync(
      part_request,
      absl::bind_front(&AwsS3Operations::OnUploadPartCallback, this,
                       upload_part_context),
      nullptr);
  return SuccessExecutionResult();
}

void AwsS3Operations::OnUploadPartCallback(
    AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
        upload_part_context,
    const S3Client* s3_client, const UploadPartRequest& request,
    UploadPartOutcome outcome,
    const std::shared_ptr<const AsyncCallerContext> async_context) noexcept {
  if (FailIfUnsuccessful(upload_part_context, outcome, "UploadPart",
                         callback_executor_)) {
    return;
  }
  const String& etag = outcome.GetResult().GetETag();
  if (etag.empty()) {
    upload_part_context.result =
        FailureExecutionResult(SC_S3_META_REQUEST_EMPTY_ETAG);
    S3U_ERROR_CONTEXT(kAwsS3Operations, upload_part_context,
                      upload_part_context.result,
                      "UploadPart response for part %d has no ETag",
                      request.GetPartNumber());
    FinishContext(upload_part_context.result, upload_part_context,
                  callback_executor_, AsyncPriority::High);
    return;
  }
  upload_part_context.response = std::make_shared<v1::UploadPartResponse>();
  upload_part_context.response->set_etag(etag.c_str(), etag.size());
  FinishContext(SuccessExecutionResult(), upload_part_context,
                callback_executor_, AsyncPriority::High);
}

ExecutionResult AwsS3Operations::CompleteMultipartUpload(
    AsyncContext<v1::CompleteMultipartUploadRequest,
                 v1::CompleteMultipartUploadResponse>&
        complete_context) noexcept {
  const auto& request = *complete_context.request;
  CompletedMultipartUpload completed_upload;
  for (const auto& part : request.parts()) {
    Aws::S3::Model::CompletedPart completed_part;
    completed_part.SetPartNumber(part.part_number());
    completed_part.SetETag(part.etag().c_str());
    if (part.has_checksum_crc32c()) {
      completed_part.SetChecksumCRC32C(part.checksum_crc32c().c_str());
    }
    completed_upload.AddParts(std::move(completed_part));
  }

  CompleteMultipartUploadRequest complete_request;
  complete_request.SetBucket(request.bucket().c_str());
  complete_request.SetKey(request.key().c_str());
  complete_request.SetUploadId(request.upload_id().c_str());
  complete_request.SetMultipartUpload(std::move(completed_upload));

  s3_client_->CompleteMultipartUploadAsync(
      complete_request,
      absl::bind_front(&AwsS3Operations::OnCompleteMultipartUploadCallback,
                       this, complete_context),
      nullptr);
  return SuccessExecutionResult();
}

void AwsS3Operations::OnCompleteMultipartUploadCallback(
    AsyncContext<v1::CompleteMultipartUploadRequest,
                 v1::CompleteMultipartUploadResponse>& complete_context,
    const S3Client* s3_client, const CompleteMultipartUploadRequest& request,
    CompleteMultipartUploadOutcome outcome,
    const std::shared_ptr<const AsyncCallerContext> async_context) noexcept {
  if (FailIfUnsuccessful(complete_context, outcome, "CompleteMultipartUpload",
                         callback_executor_)) {
    return;
  }
  const auto& result = outcome.GetResult();
  complete_context.response =
      std::make_shared<v1::CompleteMultipartUploadResponse>();
  AwsS3OperationsUtils::AppendResultHeaders(
      result.GetETag(), result.GetServerSideEncryption(),
      result.GetSSEKMSKeyId(), *complete_context.response->mutable_headers());
  FinishContext(SuccessExecutionResult(), complete_context, callback_executor_,
                AsyncPriority::High);
}

ExecutionResult AwsS3Operations::AbortMultipartUpload(
    AsyncContext<v1::AbortMultipartUploadRequest,
                 v1::AbortMultipartUploadResponse>& abort_context) noexcept {
  const auto& request = *abort_context.request;
  AbortMultipartUploadRequest abort_request;
  abort_request.SetBucket(request.bucket().c_str());
  abort_request.SetKey(request.key().c_str());
  abort_request.SetUploadId(request.upload_id().c_str());

  s3_client_->AbortMultipartUploadAsync(
      abort_request,
      absl::bind_front(&AwsS3Operations::OnAbortMultipartUploadCallback, this,
                       abort_context),
      nullptr);
  return SuccessExecutionResult();
}

void AwsS3Operations::OnAbortMultipartUploadCallback(
    AsyncContext<v1::AbortMultipartUploadRequest,
                 v1::AbortMultipartUploadResponse>& abort_context,
    const S3Client* s3_client, const AbortMultipartUploadRequest& request,
    AbortMultipartUploadOutcome outcome,
    const std::shared_ptr<const AsyncCallerContext> async_context) noexcept {
  if (FailIfUnsuccessful(abort_context, outcome, "AbortMultipartUpload",
                         callback_executor_)) {
    return;
  }
  abort_context.response =
      std::make_shared<v1::AbortMultipartUploadResponse>();
  FinishContext(SuccessExecutionResult(), abort_context, callback_executor_,
                AsyncPriority::High);
}

ExecutionResult AwsS3Operations::PutObject(
    AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
        put_object_context) noexcept {
  const auto& request = *put_object_context.request;
  PutObjectRequest put_object_request;
  put_object_request.SetBucket(request.bucket().c_str());
  put_object_request.SetKey(request.key().c_str());
  SetRequestHeaders(request.headers(), put_object_request);
  for (const auto& header : request.headers()) {
    if (IsChecksumHeader(header.name())) {
      put_object_request.SetChecksumAlgorithm(AwsChecksumAlgorithm::CRC32C);
      put_object_request.SetChecksumCRC32C(header.value().c_str());
    }
  }
  put_object_request.SetContentLength(request.data().size());
  put_object_request.SetBody(MakeBody(request.data()));

  s3_client_->PutObjectAsync(
      put_object_request,
      absl::bind_front(&AwsS3Operations::OnPutObjectCallback, this,
                       put_object_context),
      nullptr);
  return SuccessExecutionResult();
}

void AwsS3Operations::OnPutObjectCallback(
    AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
        put_object_context,
    const S3Client* s3_client, const PutObjectRequest& request,
    PutObjectOutcome outcome,
    const std::shared_ptr<const AsyncCallerContext> async_context) noexcept {
  if (FailIfUnsuccessful(put_object_context, outcome, "PutObject",
                         callback_executor_)) {
    return;
  }
  const auto& result = outcome.GetResult();
  put_object_context.response = std::make_shared<v1::PutObjectResponse>();
  AwsS3OperationsUtils::AppendResultHeaders(
      result.GetETag(), result.GetServerSideEncryption(),
      result.GetSSEKMSKeyId(), *put_object_context.response->mutable_headers());
  FinishContext(SuccessExecutionResult(), put_object_context,
                callback_executor_, AsyncPriority::High);
}

ExecutionResultOr<std::shared_ptr<S3Client>> AwsS3ClientFactory::CreateClient(
    const S3ObjectClientOptions& options,
    std::shared_ptr<AsyncExecutorInterface> io_async_executor) noexcept {
  ClientConfiguration client_config;
  if (!options.region.empty()) {
    client_config.region = options.region.c_str();
  }
  if (!options.endpoint_url.empty()) {
    client_config.endpointOverride = options.endpoint_url.c_str();
  }
  client_config.maxConnections = kMaxConcurrentConnections;
  client_config.executor =
      std::make_shared<AwsAsyncExecutor>(std::move(io_async_executor));
  // Custom endpoints are addressed path style.
  return std::make_shared<S3Client>(
      client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      /*useVirtualAddressing=*/options.endpoint_url.empty());
}

}  // namespace s3upload::s3_client
