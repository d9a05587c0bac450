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


#ifndef S3_CLIENT_CONFIGURATION_KEYS_H_
#define S3_CLIENT_CONFIGURATION_KEYS_H_

#include <string_view>

namespace s3upload::s3_client {
// Size of each part of a streaming upload, in bytes
inline constexpr std::string_view kWritePartSize = "s3upload_write_part_size";
// Sealed parts kept in memory before Write blocks
inline constexpr std::string_view kMaxBufferedParts =
    "s3upload_max_buffered_parts";
inline constexpr std::string_view kMaxConcurrentPartUploads =
    "s3upload_max_concurrent_part_uploads";
// AWS region name
inline constexpr std::string_view kRegion = "s3upload_region";
// Overrides the object store endpoint
inline constexpr std::string_view kEndpointUrl = "s3upload_endpoint_url";
// Threads finishing object store requests
inline constexpr std::string_view kExecutorThreadCount =
    "s3upload_executor_thread_count";
inline constexpr std::string_view kExecutorQueueCap =
    "s3upload_executor_queue_cap";
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_CONFIGURATION_KEYS_H_
