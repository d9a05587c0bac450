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


#include "upload_error.h"

#include "src/s3_client/error_codes.h"

namespace s3upload::s3_client {

UploadErrorKind ClassifyUploadError(const core::ExecutionResult& result) {
  using namespace core::errors;  // NOLINT
  if (result.Successful()) {
    return UploadErrorKind::kNone;
  }
  switch (result.status_code) {
    case SC_S3_CLIENT_CONSTRUCTION_FAILURE:
    case SC_S3_CLIENT_INVALID_BUCKET_NAME:
    case SC_S3_CLIENT_INVALID_OBJECT_KEY:
    case SC_S3_CLIENT_INVALID_HEADER_NAME:
    case SC_S3_CLIENT_INVALID_HEADER_VALUE:
    case SC_S3_CLIENT_INVALID_CONFIG:
      return UploadErrorKind::kConstructionFailure;
    case SC_S3_CLIENT_REQUEST_CANCELED:
      return UploadErrorKind::kRequestCanceled;
    case SC_S3_CLIENT_MISSING_ETAG:
    case SC_S3_CLIENT_MISSING_RESPONSE_HEADERS:
      return UploadErrorKind::kInternalError;
    default:
      return UploadErrorKind::kTransportFailure;
  }
}

}  // namespace s3upload::s3_client
