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


#ifndef S3_CLIENT_S3_OBJECT_CLIENT_OPTIONS_H_
#define S3_CLIENT_S3_OBJECT_CLIENT_OPTIONS_H_

#include <cstddef>
#include <string>

#include "src/core/interface/config_provider_interface.h"
#include "src/core/interface/type_def.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::s3_client {
/// Tuning of S3ObjectClient and of the transport it creates.
struct S3ObjectClientOptions {
  size_t write_part_size = core::kDefaultPartSizeInBytes;
  size_t max_buffered_parts = 4;
  size_t max_concurrent_part_uploads = 4;
  /// Empty selects the default region of the SDK.
  std::string region;
  std::string endpoint_url;
  size_t executor_thread_count = 2;
  size_t executor_queue_cap = 10000;
};

/**
 * @brief Reads the options from config_provider. Missing keys keep the value
 * already in options.
 *
 * @return SC_S3_CLIENT_INVALID_CONFIG when a value is malformed or out of
 * range.
 */
core::ExecutionResult LoadS3ObjectClientOptions(
    core::ConfigProviderInterface& config_provider,
    S3ObjectClientOptions& options);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_S3_OBJECT_CLIENT_OPTIONS_H_
