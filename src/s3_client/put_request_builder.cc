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


#include "put_request_builder.h"

#include <optional>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"

using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::HttpMethod;
using s3upload::core::SuccessExecutionResult;
using s3upload::s3_client::v1::PutObjectTrailingChecksums;

namespace {
template <typename T>
std::optional<std::string> OptionalField(bool has_field, const T& value) {
  if (!has_field) {
    return std::nullopt;
  }
  return std::string(value);
}
}  // namespace

namespace s3upload::s3_client {

ExecutionResultOr<S3Message> NewPutRequest(
    std::string bucket, std::string key,
    const std::optional<std::string>& storage_class,
    const std::optional<std::string>& server_side_encryption,
    const std::optional<std::string>& ssekms_key_id) {
  ASSIGN_OR_RETURN(
      S3Message message,
      S3Message::New(HttpMethod::PUT, std::move(bucket), std::move(key)));
  if (storage_class.has_value()) {
    RETURN_IF_FAILURE(message.SetHeader(kStorageClassHeader, *storage_class));
  }
  if (server_side_encryption.has_value()) {
    RETURN_IF_FAILURE(
        message.SetHeader(kSseTypeHeader, *server_side_encryption));
  }
  if (ssekms_key_id.has_value()) {
    RETURN_IF_FAILURE(message.SetHeader(kSseKeyIdHeader, *ssekms_key_id));
  }
  return message;
}

ExecutionResult ApplyObjectMetadata(
    const google::protobuf::Map<std::string, std::string>& object_metadata,
    S3Message& message) {
  for (const auto& entry : object_metadata) {
    RETURN_IF_FAILURE(message.SetHeader(
        absl::StrCat(kObjectMetadataHeaderPrefix, entry.first), entry.second));
  }
  return SuccessExecutionResult();
}

ExecutionResult ApplyCustomHeaders(
    const google::protobuf::RepeatedPtrField<v1::Header>& custom_headers,
    S3Message& message) {
  for (const auto& header : custom_headers) {
    RETURN_IF_FAILURE(message.AddHeader(header.name(), header.value()));
  }
  return SuccessExecutionResult();
}

std::optional<ChecksumConfig> ChecksumConfigForPolicy(
    PutObjectTrailingChecksums policy) {
  switch (policy) {
    case v1::PUT_OBJECT_TRAILING_CHECKSUMS_ENABLED:
      return ChecksumConfig::TrailingCrc32c();
    case v1::PUT_OBJECT_TRAILING_CHECKSUMS_REVIEW_ONLY:
      return ChecksumConfig::UploadReviewCrc32c();
    default:
      return std::nullopt;
  }
}

ExecutionResultOr<S3Message> BuildPutObjectMessage(
    std::string bucket, std::string key, const v1::PutObjectParams& params) {
  ASSIGN_OR_RETURN(
      S3Message message,
      NewPutRequest(
          std::move(bucket), std::move(key),
          OptionalField(params.has_storage_class(), params.storage_class()),
          OptionalField(params.has_server_side_encryption(),
                        params.server_side_encryption()),
          OptionalField(params.has_ssekms_key_id(), params.ssekms_key_id())));
  RETURN_IF_FAILURE(ApplyObjectMetadata(params.object_metadata(), message));
  RETURN_IF_FAILURE(ApplyCustomHeaders(params.custom_headers(), message));
  return message;
}

ExecutionResultOr<S3Message> BuildPutObjectSingleMessage(
    std::string bucket, std::string key,
    const v1::PutObjectSingleParams& params, std::string contents) {
  ASSIGN_OR_RETURN(
      S3Message message,
      NewPutRequest(
          std::move(bucket), std::move(key),
          OptionalField(params.has_storage_class(), params.storage_class()),
          OptionalField(params.has_server_side_encryption(),
                        params.server_side_encryption()),
          OptionalField(params.has_ssekms_key_id(), params.ssekms_key_id())));
  message.SetContentLength(contents.size());
  if (params.has_crc32c()) {
    RETURN_IF_FAILURE(message.SetChecksumHeader(params.crc32c()));
  }
  RETURN_IF_FAILURE(ApplyObjectMetadata(params.object_metadata(), message));
  RETURN_IF_FAILURE(ApplyCustomHeaders(params.custom_headers(), message));
  message.SetBody(std::move(contents));
  return message;
}

}  // namespace s3upload::s3_client
