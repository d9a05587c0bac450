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


#include "s3_object_client_options.h"

#include <string>
#include <string_view>

#include "src/core/common/global_logger/global_logger.h"
#include "src/core/config_provider/error_codes.h"
#include "src/s3_client/configuration_keys.h"
#include "src/s3_client/error_codes.h"

using s3upload::core::ConfigProviderInterface;
using s3upload::core::ExecutionResult;
using s3upload::core::FailureExecutionResult;
using s3upload::core::kMinimumPartSizeInBytes;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::common::kZeroUuid;
using s3upload::core::errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_CONFIG;

namespace {
constexpr char kS3ObjectClientOptions[] = "S3ObjectClientOptions";

template <typename T>
ExecutionResult ReadOptional(ConfigProviderInterface& config_provider,
                             std::string_view key, T& out) {
  T value;
  const ExecutionResult result =
      config_provider.Get(std::string(key), value);
  if (result.Successful()) {
    out = value;
    return SuccessExecutionResult();
  }
  if (result == FailureExecutionResult(SC_CONFIG_PROVIDER_KEY_NOT_FOUND)) {
    return SuccessExecutionResult();
  }
  auto invalid = FailureExecutionResult(SC_S3_CLIENT_INVALID_CONFIG);
  S3U_ERROR(kS3ObjectClientOptions, kZeroUuid, result,
            "Cannot read configuration key %s", std::string(key).c_str());
  return invalid;
}

ExecutionResult RequireAtLeast(std::string_view key, size_t value,
                               size_t minimum) {
  if (value >= minimum) {
    return SuccessExecutionResult();
  }
  auto result = FailureExecutionResult(SC_S3_CLIENT_INVALID_CONFIG);
  S3U_ERROR(kS3ObjectClientOptions, kZeroUuid, result,
            "Configuration key %s is %zu, below the minimum of %zu",
            std::string(key).c_str(), value, minimum);
  return result;
}
}  // namespace

namespace s3upload::s3_client {

ExecutionResult LoadS3ObjectClientOptions(
    ConfigProviderInterface& config_provider, S3ObjectClientOptions& options) {
  RETURN_IF_FAILURE(
      ReadOptional(config_provider, kWritePartSize, options.write_part_size));
  RETURN_IF_FAILURE(ReadOptional(config_provider, kMaxBufferedParts,
                                 options.max_buffered_parts));
  RETURN_IF_FAILURE(ReadOptional(config_provider, kMaxConcurrentPartUploads,
                                 options.max_concurrent_part_uploads));
  RETURN_IF_FAILURE(ReadOptional(config_provider, kRegion, options.region));
  RETURN_IF_FAILURE(
      ReadOptional(config_provider, kEndpointUrl, options.endpoint_url));
  RETURN_IF_FAILURE(ReadOptional(config_provider, kExecutorThreadCount,
                                 options.executor_thread_count));
  RETURN_IF_FAILURE(ReadOptional(config_provider, kExecutorQueueCap,
                                 options.executor_queue_cap));

  RETURN_IF_FAILURE(RequireAtLeast(kWritePartSize, options.write_part_size,
                                   kMinimumPartSizeInBytes));
  RETURN_IF_FAILURE(
      RequireAtLeast(kMaxBufferedParts, options.max_buffered_parts, 1));
  RETURN_IF_FAILURE(RequireAtLeast(kMaxConcurrentPartUploads,
                                   options.max_concurrent_part_uploads, 1));
  RETURN_IF_FAILURE(
      RequireAtLeast(kExecutorThreadCount, options.executor_thread_count, 1));
  RETURN_IF_FAILURE(
      RequireAtLeast(kExecutorQueueCap, options.executor_queue_cap, 1));
  return SuccessExecutionResult();
}

}  // namespace s3upload::s3_client
