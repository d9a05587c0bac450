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


#include "s3_message.h"

#include <string>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/error_codes.h"

using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpMethod;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_BUCKET_NAME;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_HEADER_NAME;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_HEADER_VALUE;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_OBJECT_KEY;

namespace {
constexpr std::string_view kContentLengthHeader = "Content-Length";

bool IsTokenChar(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

ExecutionResult ValidateHeader(std::string_view name, std::string_view value) {
  if (!s3upload::s3_client::IsValidHeaderName(name)) {
    return FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_NAME);
  }
  if (!s3upload::s3_client::IsValidHeaderValue(value)) {
    return FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_VALUE);
  }
  return SuccessExecutionResult();
}
}  // namespace

namespace s3upload::s3_client {

bool IsValidHeaderName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    if (!IsTokenChar(c)) {
      return false;
    }
  }
  return true;
}

bool IsValidHeaderValue(std::string_view value) {
  return value.find_first_of(std::string_view("\r\n\0", 3)) ==
         std::string_view::npos;
}

ExecutionResultOr<S3Message> S3Message::New(HttpMethod method,
                                            std::string bucket,
                                            std::string key) {
  if (bucket.empty()) {
    return FailureExecutionResult(SC_S3_CLIENT_INVALID_BUCKET_NAME);
  }
  if (key.empty()) {
    return FailureExecutionResult(SC_S3_CLIENT_INVALID_OBJECT_KEY);
  }
  return S3Message(method, std::move(bucket), std::move(key));
}

ExecutionResult S3Message::SetHeader(std::string_view name,
                                     std::string_view value) {
  RETURN_IF_FAILURE(ValidateHeader(name, value));
  ReplaceHeader(name, value);
  return SuccessExecutionResult();
}

void S3Message::ReplaceHeader(std::string_view name, std::string_view value) {
  auto it = headers_.begin();
  while (it != headers_.end()) {
    if (absl::EqualsIgnoreCase(it->first, name)) {
      it = headers_.erase(it);
    } else {
      ++it;
    }
  }
  headers_.emplace_back(std::string(name), std::string(value));
}

ExecutionResult S3Message::AddHeader(std::string_view name,
                                     std::string_view value) {
  RETURN_IF_FAILURE(ValidateHeader(name, value));
  headers_.emplace_back(std::string(name), std::string(value));
  return SuccessExecutionResult();
}

std::optional<std::string> S3Message::GetHeader(std::string_view name) const {
  for (const auto& [header_name, header_value] : headers_) {
    if (absl::EqualsIgnoreCase(header_name, name)) {
      return header_value;
    }
  }
  return std::nullopt;
}

void S3Message::SetContentLength(size_t content_length) {
  ReplaceHeader(kContentLengthHeader, absl::StrCat(content_length));
}

ExecutionResult S3Message::SetChecksumHeader(uint32_t crc32c) {
  ASSIGN_OR_RETURN(std::string encoded, EncodeCrc32c(crc32c));
  return SetHeader(kChecksumCrc32cHeader, encoded);
}

void S3Message::CopyHeadersTo(
    google::protobuf::RepeatedPtrField<v1::Header>& headers) const {
  for (const auto& [name, value] : headers_) {
    auto* header = headers.Add();
    header->set_name(name);
    header->set_value(value);
  }
}

}  // namespace s3upload::s3_client
