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


#ifndef S3_CLIENT_UPLOAD_SESSION_H_
#define S3_CLIENT_UPLOAD_SESSION_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include "absl/synchronization/mutex.h"
#include "src/core/common/set_once/set_once.h"
#include "src/core/common/uuid/uuid.h"
#include "src/core/interface/http_types.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/proto/s3_client.pb.h"
#include "src/s3_client/throughput_metric.h"
#include "src/s3_client/upload_review_gate.h"

namespace s3upload::s3_client {
/// Slots shared between an UploadSession and the callbacks of its meta
/// request.
struct UploadSignals {
  /// Success once the multipart upload exists, or the failure of the meta
  /// request if it failed first.
  core::common::SetOnce<core::ExecutionResult> readiness;
  /// Headers of the response that completed the upload.
  core::common::SetOnce<core::HttpHeaders> response_headers;
  UploadReviewGate review_gate;
};

/**
 * @brief A streaming upload of one object. Write() is called any number of
 * times, one call at a time, followed by one Complete() or
 * ReviewAndComplete(). Destroying the session before completing it cancels
 * the upload.
 */
class UploadSession {
 public:
  UploadSession(
      std::shared_ptr<MetaRequestInterface> meta_request,
      std::shared_ptr<UploadSignals> signals,
      std::shared_ptr<ThroughputMetricRecorderInterface> metric_recorder);

  ~UploadSession();

  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  /**
   * @brief Uploads data. The first call waits until the upload is created
   * and returns the failure of the upload if creating it failed.
   *
   * @return SC_S3_CLIENT_REQUEST_CANCELED if another Write is in flight, a
   * previous Write failed, or the session is completed.
   */
  core::ExecutionResult Write(std::string_view data) noexcept;

  /// ReviewAndComplete with a callback accepting every upload.
  core::ExecutionResultOr<v1::PutObjectResult> Complete() noexcept;

  /**
   * @brief Ends the stream and completes the upload once callback accepts
   * the upload review. A rejected review aborts the upload and surfaces as
   * the failure of the upload. The session cannot be used afterwards.
   *
   * @return SC_S3_CLIENT_REQUEST_CANCELED if a Write is in flight or the
   * session is already completed.
   */
  core::ExecutionResultOr<v1::PutObjectResult> ReviewAndComplete(
      UploadReviewCallback callback) noexcept;

  /// Bytes accepted by the transport so far.
  uint64_t BytesWritten() const noexcept { return bytes_written_.load(); }

 private:
  enum class State {
    /// No Write has been issued and the upload may not exist yet.
    kAwaitingReadiness = 0,
    kWriteInFlight = 1,
    kIdle = 2,
  };

  std::shared_ptr<MetaRequestInterface> meta_request_;
  std::shared_ptr<UploadSignals> signals_;
  std::shared_ptr<ThroughputMetricRecorderInterface> metric_recorder_;
  core::common::Uuid activity_id_;
  std::chrono::nanoseconds start_time_;
  std::atomic<uint64_t> bytes_written_;

  absl::Mutex mutex_;
  State state_ ABSL_GUARDED_BY(mutex_);
  bool completed_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_UPLOAD_SESSION_H_
