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


#include "upload_session.h"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "src/core/common/global_logger/global_logger.h"
#include "src/core/common/time_provider/time_provider.h"
#include "src/s3_client/error_codes.h"
#include "src/s3_client/put_object_result.h"

using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpHeaders;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::common::TimeProvider;
using s3upload::core::common::Uuid;
using s3upload::core::errors::SC_S3_CLIENT_MISSING_RESPONSE_HEADERS;
using s3upload::core::errors::SC_S3_CLIENT_REQUEST_CANCELED;

namespace {
constexpr char kUploadSession[] = "UploadSession";
}  // namespace

namespace s3upload::s3_client {

UploadSession::UploadSession(
    std::shared_ptr<MetaRequestInterface> meta_request,
    std::shared_ptr<UploadSignals> signals,
    std::shared_ptr<ThroughputMetricRecorderInterface> metric_recorder)
    : meta_request_(std::move(meta_request)),
      signals_(std::move(signals)),
      metric_recorder_(std::move(metric_recorder)),
      activity_id_(Uuid::GenerateUuid()),
      start_time_(TimeProvider::GetSteadyTimestampInNanoseconds()),
      bytes_written_(0),
      state_(State::kAwaitingReadiness),
      completed_(false) {}

UploadSession::~UploadSession() {
  bool completed;
  {
    absl::MutexLock lock(&mutex_);
    completed = completed_;
  }
  if (!completed) {
    meta_request_->Cancel();
  }
}

ExecutionResult UploadSession::Write(std::string_view data) noexcept {
  State previous_state;
  {
    absl::MutexLock lock(&mutex_);
    previous_state = state_;
    if (completed_ || previous_state == State::kWriteInFlight) {
      auto result = FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED);
      S3U_WARNING(kUploadSession, activity_id_,
                  "Write rejected: %s",
                  completed_ ? "the session is completed"
                             : "a previous write is outstanding");
      return result;
    }
    state_ = State::kWriteInFlight;
  }

  if (previous_state == State::kAwaitingReadiness) {
    const ExecutionResult readiness = signals_->readiness.Wait();
    if (!readiness.Successful()) {
      S3U_ERROR(kUploadSession, activity_id_, readiness,
                "The upload failed before the first write");
      return readiness;
    }
  }

  while (!data.empty()) {
    auto remaining = meta_request_->Write(data, /*is_final=*/false);
    if (!remaining.Successful()) {
      return remaining.result();
    }
    bytes_written_ += data.size() - remaining->size();
    data = *remaining;
  }

  absl::MutexLock lock(&mutex_);
  state_ = State::kIdle;
  return SuccessExecutionResult();
}

ExecutionResultOr<v1::PutObjectResult> UploadSession::Complete() noexcept {
  return ReviewAndComplete([](const v1::UploadReview&) { return true; });
}

ExecutionResultOr<v1::PutObjectResult> UploadSession::ReviewAndComplete(
    UploadReviewCallback callback) noexcept {
  {
    absl::MutexLock lock(&mutex_);
    if (completed_ || state_ == State::kWriteInFlight) {
      return FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED);
    }
    completed_ = true;
  }

  signals_->review_gate.Set(std::move(callback));

  if (auto remaining = meta_request_->Write({}, /*is_final=*/true);
      !remaining.Successful()) {
    // A finished meta request rejects the write; its own result is the
    // cause.
    const ExecutionResult completion = meta_request_->AwaitCompletion();
    return completion.Successful() ? remaining.result() : completion;
  }

  RETURN_AND_LOG_IF_FAILURE(meta_request_->AwaitCompletion(), kUploadSession,
                            activity_id_, "The upload failed");

  metric_recorder_->RecordThroughput(
      kPutObjectOperation, bytes_written_.load(),
      TimeProvider::SteadyElapsedSince(start_time_));

  std::optional<HttpHeaders> headers = signals_->response_headers.TryGet();
  if (!headers.has_value()) {
    auto result = FailureExecutionResult(SC_S3_CLIENT_MISSING_RESPONSE_HEADERS);
    S3U_ERROR(kUploadSession, activity_id_, result,
              "The upload completed without response headers");
    return result;
  }
  return ExtractPutObjectResult(*headers);
}

}  // namespace s3upload::s3_client
