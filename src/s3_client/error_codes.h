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


#ifndef S3_CLIENT_ERROR_CODES_H_
#define S3_CLIENT_ERROR_CODES_H_

#include "src/core/interface/errors.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::errors {

/// Registers component code as 0x0301 for the object client.
REGISTER_COMPONENT_CODE(SC_S3_CLIENT, 0x0301)

DEFINE_ERROR_CODE(SC_S3_CLIENT_CONSTRUCTION_FAILURE, SC_S3_CLIENT, 0x0001,
                  "The request could not be constructed",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_CLIENT_INVALID_BUCKET_NAME, SC_S3_CLIENT, 0x0002,
                  "The bucket name is empty", HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_CLIENT_INVALID_OBJECT_KEY, SC_S3_CLIENT, 0x0003,
                  "The object key is empty", HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_CLIENT_INVALID_HEADER_NAME, SC_S3_CLIENT, 0x0004,
                  "The header name is not a valid token",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_CLIENT_INVALID_HEADER_VALUE, SC_S3_CLIENT, 0x0005,
                  "The header value contains a forbidden character",
                  HttpStatusCode::BAD_REQUEST)

DEFINE_ERROR_CODE(SC_S3_CLIENT_REQUEST_CANCELED, SC_S3_CLIENT, 0x0006,
                  "The request was canceled because another operation is "
                  "outstanding or the upload is finished",
                  HttpStatusCode::CONFLICT)

DEFINE_ERROR_CODE(SC_S3_CLIENT_MISSING_ETAG, SC_S3_CLIENT, 0x0007,
                  "The response does not carry an ETag header",
                  HttpStatusCode::INTERNAL_SERVER_ERROR)

DEFINE_ERROR_CODE(SC_S3_CLIENT_MISSING_RESPONSE_HEADERS, SC_S3_CLIENT, 0x0008,
                  "The upload finished without delivering response headers",
                  HttpStatusCode::INTERNAL_SERVER_ERROR)

DEFINE_ERROR_CODE(SC_S3_CLIENT_INVALID_CONFIG, SC_S3_CLIENT, 0x0009,
                  "The client configuration is invalid",
                  HttpStatusCode::BAD_REQUEST)

}  // namespace s3upload::core::errors

#endif  // S3_CLIENT_ERROR_CODES_H_
