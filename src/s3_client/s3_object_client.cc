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


#include "s3_object_client.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "src/core/common/global_logger/global_logger.h"
#include "src/core/common/set_once/set_once.h"
#include "src/core/common/time_provider/time_provider.h"
#include "src/core/common/uuid/uuid.h"
#include "src/s3_client/error_codes.h"
#include "src/s3_client/put_object_result.h"
#include "src/s3_client/put_request_builder.h"

using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpHeaders;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::common::SetOnce;
using s3upload::core::common::TimeProvider;
using s3upload::core::common::Uuid;
using s3upload::core::errors::SC_S3_CLIENT_MISSING_RESPONSE_HEADERS;

namespace {
constexpr char kS3ObjectClient[] = "S3ObjectClient";
}  // namespace

namespace s3upload::s3_client {

ExecutionResultOr<std::unique_ptr<UploadSession>> S3ObjectClient::PutObject(
    std::string bucket, std::string key,
    const v1::PutObjectParams& params) noexcept {
  const Uuid activity_id = Uuid::GenerateUuid();
  auto message_or =
      BuildPutObjectMessage(std::move(bucket), std::move(key), params);
  if (!message_or.Successful()) {
    S3U_ERROR(kS3ObjectClient, activity_id, message_or.result(),
              "Cannot build the upload request");
    return message_or.result();
  }

  MetaRequestOptions meta_request_options(std::move(*message_or),
                                          S3Operation::kPutObject);
  meta_request_options.checksum_config =
      ChecksumConfigForPolicy(params.trailing_checksums());
  meta_request_options.part_size = options_.write_part_size;
  meta_request_options.max_buffered_parts = options_.max_buffered_parts;
  meta_request_options.max_concurrent_part_uploads =
      options_.max_concurrent_part_uploads;

  auto signals = std::make_shared<UploadSignals>();
  meta_request_options.on_upload_review =
      [signals](const v1::UploadReview& review) {
        return signals->review_gate.Invoke(review);
      };
  meta_request_options.on_request_finished =
      [signals](const RequestMetrics& metrics) {
        if (metrics.request_type == RequestType::kCreateMultipartUpload &&
            metrics.result.Successful()) {
          signals->readiness.Set(SuccessExecutionResult());
        }
      };
  meta_request_options.on_meta_request_failed =
      [signals](const ExecutionResult& result) {
        signals->readiness.Set(result);
      };
  meta_request_options.on_response_headers =
      [signals](const HttpHeaders& headers, int) {
        signals->response_headers.Set(headers);
      };

  auto meta_request_or =
      meta_request_client_->MakeMetaRequest(std::move(meta_request_options));
  if (!meta_request_or.Successful()) {
    S3U_ERROR(kS3ObjectClient, activity_id, meta_request_or.result(),
              "Cannot start the upload");
    return meta_request_or.result();
  }
  return std::make_unique<UploadSession>(std::move(*meta_request_or),
                                         std::move(signals), metric_recorder_);
}

ExecutionResultOr<v1::PutObjectResult> S3ObjectClient::PutObjectSingle(
    std::string bucket, std::string key,
    const v1::PutObjectSingleParams& params,
    std::string_view contents) noexcept {
  const Uuid activity_id = Uuid::GenerateUuid();
  const std::chrono::nanoseconds start_time =
      TimeProvider::GetSteadyTimestampInNanoseconds();

  auto message_or = BuildPutObjectSingleMessage(
      std::move(bucket), std::move(key), params, std::string(contents));
  if (!message_or.Successful()) {
    S3U_ERROR(kS3ObjectClient, activity_id, message_or.result(),
              "Cannot build the upload request");
    return message_or.result();
  }

  MetaRequestOptions meta_request_options(std::move(*message_or),
                                          S3Operation::kPutObjectSingle);
  auto response_headers = std::make_shared<SetOnce<HttpHeaders>>();
  meta_request_options.on_response_headers =
      [response_headers](const HttpHeaders& headers, int) {
        response_headers->Set(headers);
      };

  auto meta_request_or =
      meta_request_client_->MakeMetaRequest(std::move(meta_request_options));
  if (!meta_request_or.Successful()) {
    S3U_ERROR(kS3ObjectClient, activity_id, meta_request_or.result(),
              "Cannot start the upload");
    return meta_request_or.result();
  }
  RETURN_AND_LOG_IF_FAILURE((*meta_request_or)->AwaitCompletion(),
                            kS3ObjectClient, activity_id,
                            "The upload failed");

  metric_recorder_->RecordThroughput(
      kPutObjectSingleOperation, contents.size(),
      TimeProvider::SteadyElapsedSince(start_time));

  std::optional<HttpHeaders> headers = response_headers->TryGet();
  if (!headers.has_value()) {
    auto result = FailureExecutionResult(SC_S3_CLIENT_MISSING_RESPONSE_HEADERS);
    S3U_ERROR(kS3ObjectClient, activity_id, result,
              "The upload completed without response headers");
    return result;
  }
  return ExtractPutObjectResult(*headers);
}

}  // namespace s3upload::s3_client
