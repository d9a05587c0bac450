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

#include "base64.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"

namespace s3upload::core::utils {
ExecutionResult Base64Decode(std::string_view encoded, std::string& decoded) {
  if ((encoded.length() % 4) != 0) {
    return FailureExecutionResult(
        errors::SC_CORE_UTILS_INVALID_BASE64_ENCODING_LENGTH);
  }
  if (encoded.empty()) {
    decoded.clear();
    return SuccessExecutionResult();
  }
  const size_t required_len = encoded.length() / 4 * 3;
  auto buffer = std::make_unique<uint8_t[]>(required_len);

  const int ret =
      EVP_DecodeBlock(buffer.get(),
                      reinterpret_cast<const uint8_t*>(encoded.data()),
                      static_cast<int>(encoded.length()));
  if (ret < 0) {
    return FailureExecutionResult(errors::SC_CORE_UTILS_INVALID_INPUT);
  }
  // EVP_DecodeBlock counts the padding as zero bytes.
  size_t padding = 0;
  if (encoded.back() == '=') {
    padding = encoded[encoded.length() - 2] == '=' ? 2 : 1;
  }
  decoded = std::string(reinterpret_cast<char*>(buffer.get()), ret - padding);
  return SuccessExecutionResult();
}

ExecutionResult Base64Encode(std::string_view decoded, std::string& encoded) {
  if (decoded.empty()) {
    return FailureExecutionResult(errors::SC_CORE_UTILS_INVALID_INPUT);
  }
  // Four output characters per three input bytes, plus the terminator.
  const size_t required_len = (decoded.length() + 2) / 3 * 4 + 1;
  auto buffer = std::make_unique<uint8_t[]>(required_len);

  const int ret =
      EVP_EncodeBlock(buffer.get(),
                      reinterpret_cast<const uint8_t*>(decoded.data()),
                      static_cast<int>(decoded.length()));
  if (ret <= 0) {
    return FailureExecutionResult(errors::SC_CORE_UTILS_INVALID_INPUT);
  }
  encoded = std::string(reinterpret_cast<char*>(buffer.get()), ret);
  return SuccessExecutionResult();
}

}  // namespace s3upload::core::utils
