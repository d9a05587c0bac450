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


#ifndef S3_CLIENT_META_REQUEST_ERROR_CODES_H_
#define S3_CLIENT_META_REQUEST_ERROR_CODES_H_

#include "src/core/interface/errors.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::errors {

/// Registers component code as 0x0302 for the meta request engine.
REGISTER_COMPONENT_CODE(SC_S3_META_REQUEST, 0x0302)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_WRITE_AFTER_FINISH, SC_S3_META_REQUEST,
                  0x0001, "The meta request has already finished",
                  HttpStatusCode::CONFLICT)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_WRITE_AFTER_EOF, SC_S3_META_REQUEST,
                  0x0002, "Write after the final write",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED,
                  SC_S3_META_REQUEST, 0x0003,
                  "The upload review rejected the upload; it was aborted",
                  HttpStatusCode::PRECONDITION_FAILED)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_CANCELED, SC_S3_META_REQUEST, 0x0004,
                  "The meta request was canceled", HttpStatusCode::CANCELLED)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_INVALID_OPERATION, SC_S3_META_REQUEST,
                  0x0005, "The operation is not supported by this meta request",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_SUB_REQUEST_FAILED, SC_S3_META_REQUEST,
                  0x0006, "A sub request could not be scheduled",
                  HttpStatusCode::INTERNAL_SERVER_ERROR)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_EMPTY_ETAG, SC_S3_META_REQUEST, 0x0007,
                  "The uploaded part has no ETag",
                  HttpStatusCode::INTERNAL_SERVER_ERROR)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_MISSING_UPLOAD_ID, SC_S3_META_REQUEST,
                  0x0008, "CreateMultipartUpload returned no upload id",
                  HttpStatusCode::INTERNAL_SERVER_ERROR)

DEFINE_ERROR_CODE(SC_S3_META_REQUEST_INVALID_OPTIONS, SC_S3_META_REQUEST,
                  0x0009, "The meta request options are invalid",
                  HttpStatusCode::BAD_REQUEST)

/// Registers component code as 0x0303 for object store sub requests.
REGISTER_COMPONENT_CODE(SC_S3_OPERATIONS, 0x0303)

DEFINE_ERROR_CODE(SC_S3_OPERATIONS_RETRIABLE_ERROR, SC_S3_OPERATIONS, 0x0001,
                  "Object store request failed with a retriable error",
                  HttpStatusCode::SERVICE_UNAVAILABLE)

DEFINE_ERROR_CODE(SC_S3_OPERATIONS_UNRETRIABLE_ERROR, SC_S3_OPERATIONS,
                  0x0002, "Object store request failed",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_OPERATIONS_NOT_FOUND, SC_S3_OPERATIONS, 0x0003,
                  "Bucket, object or upload not found",
                  HttpStatusCode::NOT_FOUND)

DEFINE_ERROR_CODE(SC_S3_OPERATIONS_ACCESS_DENIED, SC_S3_OPERATIONS, 0x0004,
                  "Access to the object store was denied",
                  HttpStatusCode::FORBIDDEN)

DEFINE_ERROR_CODE(SC_S3_OPERATIONS_BAD_REQUEST, SC_S3_OPERATIONS, 0x0005,
                  "The object store rejected the request",
                  HttpStatusCode::BAD_REQUEST)

}  // namespace s3upload::core::errors

#endif  // S3_CLIENT_META_REQUEST_ERROR_CODES_H_
