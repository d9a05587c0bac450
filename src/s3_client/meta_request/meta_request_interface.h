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


#ifndef S3_CLIENT_META_REQUEST_META_REQUEST_INTERFACE_H_
#define S3_CLIENT_META_REQUEST_META_REQUEST_INTERFACE_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "src/core/interface/http_types.h"
#include "src/core/interface/type_def.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/proto/s3_client.pb.h"
#include "src/s3_client/s3_message.h"

namespace s3upload::s3_client {
/// Kind of an individual object store request issued by a meta request.
enum class RequestType {
  kDefault = 0,
  kCreateMultipartUpload = 1,
  kUploadPart = 2,
  kCompleteMultipartUpload = 3,
  kAbortMultipartUpload = 4,
  kPutObject = 5,
};

/// Reported once per finished sub request.
struct RequestMetrics {
  RequestType request_type = RequestType::kDefault;
  core::ExecutionResult result;
};

/// The logical operation a meta request performs.
enum class S3Operation {
  /// Streaming multipart upload fed by Write calls.
  kPutObject = 0,
  /// One PutObject request carrying the message body.
  kPutObjectSingle = 1,
};

using UploadReviewCallback = std::function<bool(const v1::UploadReview&)>;
using RequestFinishedCallback = std::function<void(const RequestMetrics&)>;
using MetaRequestFailedCallback =
    std::function<void(const core::ExecutionResult&)>;
using ResponseHeadersCallback =
    std::function<void(const core::HttpHeaders& headers, int response_status)>;

/// Everything needed to start one meta request.
struct MetaRequestOptions {
  MetaRequestOptions(S3Message message, S3Operation operation)
      : message(std::move(message)), operation(operation) {}

  S3Message message;
  S3Operation operation;
  std::optional<ChecksumConfig> checksum_config;
  size_t part_size = core::kDefaultPartSizeInBytes;
  /// Sealed parts that may wait in memory before Write blocks.
  size_t max_buffered_parts = 4;
  size_t max_concurrent_part_uploads = 4;

  /// Called once, after every part is uploaded and before the upload is
  /// completed. Returning false aborts the upload.
  UploadReviewCallback on_upload_review;
  RequestFinishedCallback on_request_finished;
  /// Called at most once, when the meta request finishes with a failure.
  MetaRequestFailedCallback on_meta_request_failed;
  /// Called with the headers of the response that completes the upload.
  ResponseHeadersCallback on_response_headers;
};

/**
 * @brief One logical upload executed as a series of object store requests.
 * Callbacks in MetaRequestOptions run on the threads that finish those
 * requests.
 */
class MetaRequestInterface {
 public:
  virtual ~MetaRequestInterface() = default;

  /**
   * @brief Buffers a prefix of data, blocking while the buffered part limit
   * is reached.
   *
   * @param data bytes to upload.
   * @param is_final marks the end of the stream once data is fully consumed.
   * @return ExecutionResultOr<std::string_view> the unconsumed suffix of
   * data.
   */
  virtual core::ExecutionResultOr<std::string_view> Write(
      std::string_view data, bool is_final) noexcept = 0;

  /// Blocks until the meta request finished and returns its result.
  virtual core::ExecutionResult AwaitCompletion() noexcept = 0;

  /// Fails the meta request with SC_S3_META_REQUEST_CANCELED and aborts the
  /// upload. No-op once finished.
  virtual void Cancel() noexcept = 0;
};

/// Creates and starts meta requests.
class MetaRequestClientInterface {
 public:
  virtual ~MetaRequestClientInterface() = default;

  /**
   * @brief Starts a meta request. The first object store request is issued
   * before this returns.
   */
  virtual core::ExecutionResultOr<std::shared_ptr<MetaRequestInterface>>
  MakeMetaRequest(MetaRequestOptions options) noexcept = 0;
};

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_META_REQUEST_INTERFACE_H_
