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


#ifndef S3_CLIENT_PUT_REQUEST_BUILDER_H_
#define S3_CLIENT_PUT_REQUEST_BUILDER_H_

#include <optional>
#include <string>

#include "google/protobuf/map.h"
#include "google/protobuf/repeated_ptr_field.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/proto/s3_client.pb.h"
#include "src/s3_client/s3_message.h"

namespace s3upload::s3_client {

inline constexpr std::string_view kStorageClassHeader = "x-amz-storage-class";
inline constexpr std::string_view kSseTypeHeader =
    "x-amz-server-side-encryption";
inline constexpr std::string_view kSseKeyIdHeader =
    "x-amz-server-side-encryption-aws-kms-key-id";
inline constexpr std::string_view kObjectMetadataHeaderPrefix = "x-amz-meta-";

/**
 * @brief Builds a PUT message for bucket/key with the optional storage class
 * and server side encryption headers set.
 *
 * @return ExecutionResultOr<S3Message> a failure with an SC_S3_CLIENT code when
 * a value cannot be carried in a request.
 */
core::ExecutionResultOr<S3Message> NewPutRequest(
    std::string bucket, std::string key,
    const std::optional<std::string>& storage_class,
    const std::optional<std::string>& server_side_encryption,
    const std::optional<std::string>& ssekms_key_id);

/// Sets one x-amz-meta-<name> header per entry.
core::ExecutionResult ApplyObjectMetadata(
    const google::protobuf::Map<std::string, std::string>& object_metadata,
    S3Message& message);

/// Appends the custom headers in order, after every header already set.
core::ExecutionResult ApplyCustomHeaders(
    const google::protobuf::RepeatedPtrField<v1::Header>& custom_headers,
    S3Message& message);

/// Maps the checksum policy of an upload to its checksum settings.
std::optional<ChecksumConfig> ChecksumConfigForPolicy(
    v1::PutObjectTrailingChecksums policy);

/**
 * @brief Builds the complete message of a streaming upload: request headers,
 * object metadata, then custom headers.
 */
core::ExecutionResultOr<S3Message> BuildPutObjectMessage(
    std::string bucket, std::string key, const v1::PutObjectParams& params);

/**
 * @brief Builds the complete message of a single request upload, including
 * Content-Length, the optional checksum header and the body.
 */
core::ExecutionResultOr<S3Message> BuildPutObjectSingleMessage(
    std::string bucket, std::string key,
    const v1::PutObjectSingleParams& params, std::string contents);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_PUT_REQUEST_BUILDER_H_
