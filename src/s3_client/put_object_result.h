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


#ifndef S3_CLIENT_PUT_OBJECT_RESULT_H_
#define S3_CLIENT_PUT_OBJECT_RESULT_H_

#include <optional>
#include <string>
#include <string_view>

#include "src/core/interface/http_types.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/proto/s3_client.pb.h"

namespace s3upload::s3_client {
inline constexpr std::string_view kEtagHeader = "ETag";

/// Value of the first header named name, compared case-insensitively.
std::optional<std::string> FindHeader(const core::HttpHeaders& headers,
                                      std::string_view name);

/**
 * @brief Builds the result of an upload from the headers of its final
 * response.
 *
 * @return SC_S3_CLIENT_MISSING_ETAG when there is no ETag header.
 */
core::ExecutionResultOr<v1::PutObjectResult> ExtractPutObjectResult(
    const core::HttpHeaders& response_headers);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_PUT_OBJECT_RESULT_H_
