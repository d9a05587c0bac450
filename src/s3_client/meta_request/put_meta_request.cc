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


#include "put_meta_request.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/bind_front.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/meta_request/error_codes.h"

using s3upload::core::AsyncContext;
using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpHeaders;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::common::Uuid;
using s3upload::core::errors::SC_S3_META_REQUEST_CANCELED;
using s3upload::core::errors::SC_S3_META_REQUEST_EMPTY_ETAG;
using s3upload::core::errors::SC_S3_META_REQUEST_INVALID_OPERATION;
using s3upload::core::errors::SC_S3_META_REQUEST_MISSING_UPLOAD_ID;
using s3upload::core::errors::SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED;
using s3upload::core::errors::SC_S3_META_REQUEST_WRITE_AFTER_EOF;
using s3upload::core::errors::SC_S3_META_REQUEST_WRITE_AFTER_FINISH;
using s3upload::s3_client::v1::AbortMultipartUploadRequest;
using s3upload::s3_client::v1::AbortMultipartUploadResponse;
using s3upload::s3_client::v1::CompleteMultipartUploadRequest;
using s3upload::s3_client::v1::CompleteMultipartUploadResponse;
using s3upload::s3_client::v1::CreateMultipartUploadRequest;
using s3upload::s3_client::v1::CreateMultipartUploadResponse;
using s3upload::s3_client::v1::PutObjectRequest;
using s3upload::s3_client::v1::PutObjectResponse;
using s3upload::s3_client::v1::UploadPartRequest;
using s3upload::s3_client::v1::UploadPartResponse;
using s3upload::s3_client::v1::UploadReview;

namespace {
constexpr char kPutMetaRequest[] = "PutMetaRequest";
constexpr int kHttpOk = 200;
}  // namespace

namespace s3upload::s3_client {

PutMetaRequest::PutMetaRequest(
    MetaRequestOptions options,
    std::shared_ptr<S3OperationsInterface> s3_operations)
    : options_(std::move(options)),
      s3_operations_(std::move(s3_operations)),
      activity_id_(Uuid::GenerateUuid()) {}

ExecutionResult PutMetaRequest::Start() noexcept {
  if (options_.operation == S3Operation::kPutObjectSingle) {
    auto request = std::make_shared<PutObjectRequest>();
    request->set_bucket(options_.message.bucket());
    request->set_key(options_.message.key());
    options_.message.CopyHeadersTo(*request->mutable_headers());
    request->set_data(std::move(options_.message.mutable_body()));
    AsyncContext<PutObjectRequest, PutObjectResponse> context(
        std::move(request),
        absl::bind_front(&PutMetaRequest::OnPutObjectCallback,
                         shared_from_this()),
        activity_id_, activity_id_);
    RETURN_AND_LOG_IF_FAILURE(s3_operations_->PutObject(context),
                              kPutMetaRequest, activity_id_,
                              "Failed to issue PutObject for %s",
                              options_.message.key().c_str());
    return SuccessExecutionResult();
  }

  auto request = std::make_shared<CreateMultipartUploadRequest>();
  request->set_bucket(options_.message.bucket());
  request->set_key(options_.message.key());
  options_.message.CopyHeadersTo(*request->mutable_headers());
  if (options_.checksum_config.has_value() &&
      options_.checksum_config->algorithm == ChecksumAlgorithm::kCrc32c &&
      options_.checksum_config->location == ChecksumLocation::kTrailer) {
    request->set_checksum_algorithm(v1::CHECKSUM_ALGORITHM_CRC32C);
  }
  AsyncContext<CreateMultipartUploadRequest, CreateMultipartUploadResponse>
      context(std::move(request),
              absl::bind_front(&PutMetaRequest::OnCreateMultipartUploadCallback,
                               shared_from_this()),
              activity_id_, activity_id_);
  RETURN_AND_LOG_IF_FAILURE(s3_operations_->CreateMultipartUpload(context),
                            kPutMetaRequest, activity_id_,
                            "Failed to issue CreateMultipartUpload for %s",
                            options_.message.key().c_str());
  return SuccessExecutionResult();
}

bool PutMetaRequest::CanAcceptData() const {
  return failed_ || finish_started_ ||
         pending_parts_.size() + in_flight_parts_ <
             options_.max_buffered_parts;
}

ExecutionResultOr<std::string_view> PutMetaRequest::Write(
    std::string_view data, bool is_final) noexcept {
  if (options_.operation != S3Operation::kPutObject) {
    return FailureExecutionResult(SC_S3_META_REQUEST_INVALID_OPERATION);
  }
  ExecutionResult seal_result = SuccessExecutionResult();
  {
    absl::MutexLock lock(&mutex_);
    if (failed_ || finish_started_) {
      return FailureExecutionResult(SC_S3_META_REQUEST_WRITE_AFTER_FINISH);
    }
    if (eof_) {
      return FailureExecutionResult(SC_S3_META_REQUEST_WRITE_AFTER_EOF);
    }
    if (!data.empty()) {
      mutex_.Await(absl::Condition(this, &PutMetaRequest::CanAcceptData));
    }
    if (failed_ || finish_started_) {
      return FailureExecutionResult(SC_S3_META_REQUEST_WRITE_AFTER_FINISH);
    }

    const size_t room = options_.part_size - current_part_.size();
    const size_t accepted = std::min(room, data.size());
    current_part_.append(data.data(), accepted);
    data.remove_prefix(accepted);

    if (current_part_.size() == options_.part_size) {
      seal_result = SealCurrentPart();
    }
    if (seal_result.Successful() && is_final && data.empty()) {
      eof_ = true;
      // An empty object is still uploaded as one empty part.
      if (!current_part_.empty() || next_part_number_ == 1) {
        seal_result = SealCurrentPart();
      }
    }
  }
  if (!seal_result.Successful()) {
    Fail(seal_result);
    return seal_result;
  }
  Pump();
  return data;
}

ExecutionResult PutMetaRequest::SealCurrentPart() {
  Part part;
  part.part_number = next_part_number_;
  if (options_.checksum_config.has_value() &&
      options_.checksum_config->algorithm == ChecksumAlgorithm::kCrc32c) {
    ASSIGN_OR_RETURN(part.checksum, ComputeEncodedCrc32c(current_part_));
  }
  part.data = std::move(current_part_);
  current_part_.clear();
  next_part_number_++;
  pending_parts_.push_back(std::move(part));
  return SuccessExecutionResult();
}

void PutMetaRequest::Pump() noexcept {
  std::vector<Part> parts_to_upload;
  bool complete_upload = false;
  {
    absl::MutexLock lock(&mutex_);
    if (failed_ || finish_started_ || !upload_id_.has_value()) {
      return;
    }
    while (!pending_parts_.empty() &&
           in_flight_parts_ < options_.max_concurrent_part_uploads) {
      parts_to_upload.push_back(std::move(pending_parts_.front()));
      pending_parts_.pop_front();
      in_flight_parts_++;
    }
    if (eof_ && pending_parts_.empty() && in_flight_parts_ == 0 &&
        !completing_) {
      completing_ = true;
      complete_upload = true;
    }
  }
  for (auto& part : parts_to_upload) {
    UploadPart(std::move(part));
  }
  if (complete_upload) {
    ReviewAndComplete();
  }
}

void PutMetaRequest::UploadPart(Part part) noexcept {
  auto request = std::make_shared<UploadPartRequest>();
  request->set_bucket(options_.message.bucket());
  request->set_key(options_.message.key());
  {
    absl::MutexLock lock(&mutex_);
    request->set_upload_id(*upload_id_);
  }
  request->set_part_number(part.part_number);
  const uint64_t part_size = part.data.size();
  request->set_data(std::move(part.data));
  if (part.checksum.has_value() &&
      options_.checksum_config->location == ChecksumLocation::kTrailer) {
    request->set_checksum_crc32c(*part.checksum);
  }

  AsyncContext<UploadPartRequest, UploadPartResponse> context(
      std::move(request),
      absl::bind_front(&PutMetaRequest::OnUploadPartCallback,
                       shared_from_this(), part_size, part.checksum),
      activity_id_, activity_id_);
  if (auto result = s3_operations_->UploadPart(context); !result.Successful()) {
    S3U_ERROR(kPutMetaRequest, activity_id_, result,
              "Failed to issue UploadPart %d",
              context.request->part_number());
    Fail(result);
  }
}

void PutMetaRequest::OnUploadPartCallback(
    uint64_t part_size, std::optional<std::string> checksum,
    AsyncContext<UploadPartRequest, UploadPartResponse>& context) noexcept {
  ExecutionResult result = context.result;
  if (result.Successful() &&
      (context.response == nullptr || context.response->etag().empty())) {
    result = FailureExecutionResult(SC_S3_META_REQUEST_EMPTY_ETAG);
  }
  ReportRequestFinished(RequestType::kUploadPart, result);
  const int32_t part_number = context.request->part_number();
  if (!result.Successful()) {
    S3U_ERROR_CONTEXT(kPutMetaRequest, context, result,
                      "UploadPart %d failed", part_number);
    {
      absl::MutexLock lock(&mutex_);
      in_flight_parts_--;
    }
    Fail(result);
    return;
  }

  {
    absl::MutexLock lock(&mutex_);
    in_flight_parts_--;
    v1::CompletedPart completed_part;
    completed_part.set_part_number(part_number);
    completed_part.set_etag(context.response->etag());
    if (context.request->has_checksum_crc32c()) {
      completed_part.set_checksum_crc32c(context.request->checksum_crc32c());
    }
    completed_parts_[part_number] = std::move(completed_part);

    v1::UploadReviewPart review_part;
    review_part.set_size(part_size);
    if (checksum.has_value()) {
      review_part.set_checksum(*checksum);
    }
    review_parts_[part_number] = std::move(review_part);
  }
  Pump();
}

void PutMetaRequest::ReviewAndComplete() noexcept {
  UploadReview review;
  auto request = std::make_shared<CompleteMultipartUploadRequest>();
  request->set_bucket(options_.message.bucket());
  request->set_key(options_.message.key());
  {
    absl::MutexLock lock(&mutex_);
    request->set_upload_id(*upload_id_);
    for (const auto& [part_number, completed_part] : completed_parts_) {
      *request->add_parts() = completed_part;
    }
    for (const auto& [part_number, review_part] : review_parts_) {
      *review.add_parts() = review_part;
    }
  }
  review.set_checksum_algorithm(
      options_.checksum_config.has_value() &&
              options_.checksum_config->algorithm == ChecksumAlgorithm::kCrc32c
          ? v1::CHECKSUM_ALGORITHM_CRC32C
          : v1::CHECKSUM_ALGORITHM_UNSPECIFIED);

  if (options_.on_upload_review && !options_.on_upload_review(review)) {
    auto result =
        FailureExecutionResult(SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED);
    S3U_INFO(kPutMetaRequest, activity_id_,
             "Upload review rejected %s, aborting",
             options_.message.key().c_str());
    Fail(result);
    return;
  }

  AsyncContext<CompleteMultipartUploadRequest,
               CompleteMultipartUploadResponse>
      context(std::move(request),
              absl::bind_front(
                  &PutMetaRequest::OnCompleteMultipartUploadCallback,
                  shared_from_this()),
              activity_id_, activity_id_);
  if (auto result = s3_operations_->CompleteMultipartUpload(context);
      !result.Successful()) {
    S3U_ERROR(kPutMetaRequest, activity_id_, result,
              "Failed to issue CompleteMultipartUpload");
    Fail(result);
  }
}

void PutMetaRequest::OnCompleteMultipartUploadCallback(
    AsyncContext<CompleteMultipartUploadRequest,
                 CompleteMultipartUploadResponse>& context) noexcept {
  ReportRequestFinished(RequestType::kCompleteMultipartUpload, context.result);
  if (!context.result.Successful()) {
    S3U_ERROR_CONTEXT(kPutMetaRequest, context, context.result,
                      "CompleteMultipartUpload failed");
    Fail(context.result);
    return;
  }
  if (context.response != nullptr) {
    DeliverResponseHeaders(context.response->headers());
  }
  Finish(SuccessExecutionResult());
}

void PutMetaRequest::OnCreateMultipartUploadCallback(
    AsyncContext<CreateMultipartUploadRequest, CreateMultipartUploadResponse>&
        context) noexcept {
  ExecutionResult result = context.result;
  if (result.Successful() &&
      (context.response == nullptr || context.response->upload_id().empty())) {
    result = FailureExecutionResult(SC_S3_META_REQUEST_MISSING_UPLOAD_ID);
  }
  ReportRequestFinished(RequestType::kCreateMultipartUpload, result);
  if (!result.Successful()) {
    S3U_ERROR_CONTEXT(kPutMetaRequest, context, result,
                      "CreateMultipartUpload failed for %s",
                      context.request->key().c_str());
  }

  bool already_failed = false;
  ExecutionResult failure;
  {
    absl::MutexLock lock(&mutex_);
    create_done_ = true;
    if (result.Successful()) {
      upload_id_ = context.response->upload_id();
    }
    already_failed = failed_;
    failure = failure_;
  }

  if (already_failed) {
    // The meta request failed while the upload was being created.
    if (result.Successful()) {
      AbortUpload(context.response->upload_id());
    } else {
      Finish(failure);
    }
    return;
  }
  if (!result.Successful()) {
    Fail(result);
    return;
  }
  Pump();
}

void PutMetaRequest::AbortUpload(const std::string& upload_id) noexcept {
  auto request = std::make_shared<AbortMultipartUploadRequest>();
  request->set_bucket(options_.message.bucket());
  request->set_key(options_.message.key());
  request->set_upload_id(upload_id);
  AsyncContext<AbortMultipartUploadRequest, AbortMultipartUploadResponse>
      context(std::move(request),
              absl::bind_front(&PutMetaRequest::OnAbortMultipartUploadCallback,
                               shared_from_this()),
              activity_id_, activity_id_);
  if (auto result = s3_operations_->AbortMultipartUpload(context);
      !result.Successful()) {
    S3U_ERROR(kPutMetaRequest, activity_id_, result,
              "Failed to issue AbortMultipartUpload for upload %s",
              upload_id.c_str());
    ExecutionResult failure;
    {
      absl::MutexLock lock(&mutex_);
      failure = failure_;
    }
    Finish(failure);
  }
}

void PutMetaRequest::OnAbortMultipartUploadCallback(
    AsyncContext<AbortMultipartUploadRequest, AbortMultipartUploadResponse>&
        context) noexcept {
  ReportRequestFinished(RequestType::kAbortMultipartUpload, context.result);
  if (!context.result.Successful()) {
    S3U_ERROR_CONTEXT(kPutMetaRequest, context, context.result,
                      "AbortMultipartUpload failed for upload %s",
                      context.request->upload_id().c_str());
  }
  ExecutionResult failure;
  {
    absl::MutexLock lock(&mutex_);
    failure = failure_;
  }
  Finish(failure);
}

void PutMetaRequest::OnPutObjectCallback(
    AsyncContext<PutObjectRequest, PutObjectResponse>& context) noexcept {
  ReportRequestFinished(RequestType::kPutObject, context.result);
  if (!context.result.Successful()) {
    S3U_ERROR_CONTEXT(kPutMetaRequest, context, context.result,
                      "PutObject failed for %s",
                      context.request->key().c_str());
    Fail(context.result);
    return;
  }
  if (context.response != nullptr) {
    DeliverResponseHeaders(context.response->headers());
  }
  Finish(SuccessExecutionResult());
}

void PutMetaRequest::Fail(const ExecutionResult& result) noexcept {
  std::optional<std::string> upload_id;
  {
    absl::MutexLock lock(&mutex_);
    if (failed_ || finish_started_) {
      return;
    }
    failed_ = true;
    failure_ = result;
    if (options_.operation == S3Operation::kPutObject && !create_done_) {
      // Finished by OnCreateMultipartUploadCallback.
      return;
    }
    upload_id = upload_id_;
  }
  if (upload_id.has_value()) {
    AbortUpload(*upload_id);
  } else {
    Finish(result);
  }
}

void PutMetaRequest::Finish(const ExecutionResult& result) noexcept {
  {
    absl::MutexLock lock(&mutex_);
    if (finish_started_) {
      return;
    }
    finish_started_ = true;
  }
  if (!result.Successful() && options_.on_meta_request_failed) {
    options_.on_meta_request_failed(result);
  }
  absl::MutexLock lock(&mutex_);
  final_result_ = result;
  finished_ = true;
}

ExecutionResult PutMetaRequest::AwaitCompletion() noexcept {
  absl::MutexLock lock(&mutex_);
  mutex_.Await(absl::Condition(this, &PutMetaRequest::IsFinished));
  return final_result_;
}

void PutMetaRequest::Cancel() noexcept {
  Fail(FailureExecutionResult(SC_S3_META_REQUEST_CANCELED));
}

void PutMetaRequest::ReportRequestFinished(
    RequestType request_type, const ExecutionResult& result) noexcept {
  if (options_.on_request_finished) {
    options_.on_request_finished(RequestMetrics{request_type, result});
  }
}

void PutMetaRequest::DeliverResponseHeaders(
    const google::protobuf::RepeatedPtrField<v1::Header>& headers) noexcept {
  if (!options_.on_response_headers) {
    return;
  }
  HttpHeaders http_headers;
  for (const auto& header : headers) {
    http_headers.emplace(header.name(), header.value());
  }
  options_.on_response_headers(http_headers, kHttpOk);
}

}  // namespace s3upload::s3_client
