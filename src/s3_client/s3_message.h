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


#ifndef S3_CLIENT_S3_MESSAGE_H_
#define S3_CLIENT_S3_MESSAGE_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "src/core/interface/http_types.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/proto/s3_client.pb.h"

namespace s3upload::s3_client {
/// Request headers in the order they are sent.
using OrderedHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Template of an object store request: method, bucket, object path and
 * headers, plus the body for single request uploads. Header names and values
 * are validated when set.
 */
class S3Message {
 public:
  /**
   * @brief Builds an empty message for bucket/key.
   *
   * @return SC_S3_CLIENT_INVALID_BUCKET_NAME or SC_S3_CLIENT_INVALID_OBJECT_KEY
   * when either is empty.
   */
  static core::ExecutionResultOr<S3Message> New(core::HttpMethod method,
                                                std::string bucket,
                                                std::string key);

  /// Replaces every header with this name (case-insensitive).
  core::ExecutionResult SetHeader(std::string_view name,
                                  std::string_view value);

  /// Appends a header, keeping any existing header with the same name.
  core::ExecutionResult AddHeader(std::string_view name,
                                  std::string_view value);

  /// Returns the first header with this name (case-insensitive).
  std::optional<std::string> GetHeader(std::string_view name) const;

  void SetContentLength(size_t content_length);

  /// Sets x-amz-checksum-crc32c from a precomputed CRC32C.
  core::ExecutionResult SetChecksumHeader(uint32_t crc32c);

  void SetBody(std::string body) { body_ = std::move(body); }

  /// Copies the headers into a repeated proto field.
  void CopyHeadersTo(
      google::protobuf::RepeatedPtrField<v1::Header>& headers) const;

  core::HttpMethod method() const { return method_; }

  const std::string& bucket() const { return bucket_; }

  const std::string& key() const { return key_; }

  /// "/" followed by the object key.
  std::string path() const { return "/" + key_; }

  const OrderedHeaders& headers() const { return headers_; }

  const std::string& body() const { return body_; }

  std::string& mutable_body() { return body_; }

 private:
  S3Message(core::HttpMethod method, std::string bucket, std::string key)
      : method_(method), bucket_(std::move(bucket)), key_(std::move(key)) {}

  /// SetHeader without validation.
  void ReplaceHeader(std::string_view name, std::string_view value);

  core::HttpMethod method_;
  std::string bucket_;
  std::string key_;
  OrderedHeaders headers_;
  std::string body_;
};

/// Returns true when name is a non-empty HTTP token.
bool IsValidHeaderName(std::string_view name);

/// Returns true when value has no CR, LF or NUL.
bool IsValidHeaderValue(std::string_view value);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_S3_MESSAGE_H_
