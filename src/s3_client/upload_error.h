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


#ifndef S3_CLIENT_UPLOAD_ERROR_H_
#define S3_CLIENT_UPLOAD_ERROR_H_

#include "src/public/core/interface/execution_result.h"

namespace s3upload::s3_client {
/// Classes of failures surfaced by the object client.
enum class UploadErrorKind {
  kNone = 0,
  /// Malformed request parameters, detected before any network activity.
  kConstructionFailure = 1,
  /// Failure of the transport or of an object store request.
  kTransportFailure = 2,
  /// Caller protocol violation such as overlapping writes.
  kRequestCanceled = 3,
  /// A successful response that misses expected data.
  kInternalError = 4,
};

/// Returns the class of a result returned by the object client.
UploadErrorKind ClassifyUploadError(const core::ExecutionResult& result);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_UPLOAD_ERROR_H_
