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


#ifndef S3_CLIENT_META_REQUEST_PUT_META_REQUEST_H_
#define S3_CLIENT_META_REQUEST_PUT_META_REQUEST_H_

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/synchronization/mutex.h"
#include "src/core/common/uuid/uuid.h"
#include "src/core/interface/async_context.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/meta_request/s3_operations_interface.h"
#include "src/s3_client/proto/s3_operations.pb.h"

namespace s3upload::s3_client {
/**
 * @copydoc MetaRequestInterface
 *
 * For S3Operation::kPutObject the object is uploaded with a multipart
 * upload: CreateMultipartUpload is issued by Start(), Write() cuts the stream
 * into parts of options.part_size bytes which are uploaded as soon as the
 * upload id is known, and the final write leads to the upload review and
 * CompleteMultipartUpload. Any failure aborts the upload.
 *
 * For S3Operation::kPutObjectSingle Start() issues one PutObject with the
 * message body and Write() is rejected.
 */
class PutMetaRequest : public MetaRequestInterface,
                       public std::enable_shared_from_this<PutMetaRequest> {
 public:
  PutMetaRequest(MetaRequestOptions options,
                 std::shared_ptr<S3OperationsInterface> s3_operations);

  /// Issues the first object store request.
  core::ExecutionResult Start() noexcept;

  core::ExecutionResultOr<std::string_view> Write(
      std::string_view data, bool is_final) noexcept override;

  core::ExecutionResult AwaitCompletion() noexcept override;

  void Cancel() noexcept override;

 private:
  /// A part sealed by Write and not yet uploaded.
  struct Part {
    int32_t part_number = 0;
    std::string data;
    /// Encoded CRC32C, present when a checksum config is set.
    std::optional<std::string> checksum;
  };

  void OnCreateMultipartUploadCallback(
      core::AsyncContext<v1::CreateMultipartUploadRequest,
                         v1::CreateMultipartUploadResponse>& context) noexcept;

  void OnUploadPartCallback(
      uint64_t part_size, std::optional<std::string> checksum,
      core::AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
          context) noexcept;

  void OnCompleteMultipartUploadCallback(
      core::AsyncContext<v1::CompleteMultipartUploadRequest,
                         v1::CompleteMultipartUploadResponse>&
          context) noexcept;

  void OnAbortMultipartUploadCallback(
      core::AsyncContext<v1::AbortMultipartUploadRequest,
                         v1::AbortMultipartUploadResponse>& context) noexcept;

  void OnPutObjectCallback(
      core::AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
          context) noexcept;

  /// Moves the current part into the pending parts. Requires mutex_.
  core::ExecutionResult SealCurrentPart() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  /// Dispatches pending parts and, once everything is uploaded after the
  /// final write, reviews and completes the upload.
  void Pump() noexcept;

  void UploadPart(Part part) noexcept;

  void ReviewAndComplete() noexcept;

  void AbortUpload(const std::string& upload_id) noexcept;

  /// Records the first failure and starts the abort.
  void Fail(const core::ExecutionResult& result) noexcept;

  /// Runs the terminal callbacks and releases AwaitCompletion.
  void Finish(const core::ExecutionResult& result) noexcept;

  void ReportRequestFinished(RequestType request_type,
                             const core::ExecutionResult& result) noexcept;

  void DeliverResponseHeaders(
      const google::protobuf::RepeatedPtrField<v1::Header>& headers) noexcept;

  bool CanAcceptData() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  bool IsFinished() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return finished_;
  }

  MetaRequestOptions options_;
  std::shared_ptr<S3OperationsInterface> s3_operations_;
  /// Parent activity of every sub request context.
  core::common::Uuid activity_id_;

  mutable absl::Mutex mutex_;
  std::optional<std::string> upload_id_ ABSL_GUARDED_BY(mutex_);
  bool create_done_ ABSL_GUARDED_BY(mutex_) = false;
  std::string current_part_ ABSL_GUARDED_BY(mutex_);
  int32_t next_part_number_ ABSL_GUARDED_BY(mutex_) = 1;
  std::deque<Part> pending_parts_ ABSL_GUARDED_BY(mutex_);
  size_t in_flight_parts_ ABSL_GUARDED_BY(mutex_) = 0;
  std::map<int32_t, v1::CompletedPart> completed_parts_
      ABSL_GUARDED_BY(mutex_);
  std::map<int32_t, v1::UploadReviewPart> review_parts_
      ABSL_GUARDED_BY(mutex_);
  bool eof_ ABSL_GUARDED_BY(mutex_) = false;
  bool completing_ ABSL_GUARDED_BY(mutex_) = false;
  bool failed_ ABSL_GUARDED_BY(mutex_) = false;
  core::ExecutionResult failure_ ABSL_GUARDED_BY(mutex_);
  bool finish_started_ ABSL_GUARDED_BY(mutex_) = false;
  bool finished_ ABSL_GUARDED_BY(mutex_) = false;
  core::ExecutionResult final_result_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_PUT_META_REQUEST_H_
