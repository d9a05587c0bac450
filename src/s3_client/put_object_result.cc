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


#include "put_object_result.h"

#include <optional>
#include <string>

#include "absl/strings/match.h"
#include "src/s3_client/error_codes.h"
#include "src/s3_client/put_request_builder.h"

using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpHeaders;
using s3upload::core::errors::SC_S3_CLIENT_MISSING_ETAG;

namespace s3upload::s3_client {

std::optional<std::string> FindHeader(const HttpHeaders& headers,
                                      std::string_view name) {
  for (const auto& [header_name, header_value] : headers) {
    if (absl::EqualsIgnoreCase(header_name, name)) {
      return header_value;
    }
  }
  return std::nullopt;
}

ExecutionResultOr<v1::PutObjectResult> ExtractPutObjectResult(
    const HttpHeaders& response_headers) {
  auto etag = FindHeader(response_headers, kEtagHeader);
  if (!etag.has_value()) {
    return FailureExecutionResult(SC_S3_CLIENT_MISSING_ETAG);
  }
  v1::PutObjectResult result;
  result.set_etag(*std::move(etag));
  if (auto sse_type = FindHeader(response_headers, kSseTypeHeader);
      sse_type.has_value()) {
    result.set_sse_type(*std::move(sse_type));
  }
  if (auto key_id = FindHeader(response_headers, kSseKeyIdHeader);
      key_id.has_value()) {
    result.set_sse_kms_key_id(*std::move(key_id));
  }
  return result;
}

}  // namespace s3upload::s3_client
