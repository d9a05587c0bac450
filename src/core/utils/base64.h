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

#ifndef CORE_UTILS_BASE64_H_
#define CORE_UTILS_BASE64_H_

#include <string>
#include <string_view>

#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::utils {
/**
 * @brief Base64 encodes decoded. Empty input is rejected.
 */
ExecutionResult Base64Encode(std::string_view decoded, std::string& encoded);

/**
 * @brief Decodes padded base64. The length of encoded must be a multiple of 4.
 */
ExecutionResult Base64Decode(std::string_view encoded, std::string& decoded);
}  // namespace s3upload::core::utils

#endif  // CORE_UTILS_BASE64_H_
