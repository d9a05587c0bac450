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


#include "checksum.h"

#include <string>

#include "absl/crc/crc32c.h"
#include "src/core/utils/base64.h"

using s3upload::core::ExecutionResultOr;

namespace s3upload::s3_client {

ExecutionResultOr<std::string> EncodeCrc32c(uint32_t crc32c) {
  const char big_endian[4] = {
      static_cast<char>((crc32c >> 24) & 0xFF),
      static_cast<char>((crc32c >> 16) & 0xFF),
      static_cast<char>((crc32c >> 8) & 0xFF),
      static_cast<char>(crc32c & 0xFF),
  };
  std::string encoded;
  RETURN_IF_FAILURE(core::utils::Base64Encode(
      std::string_view(big_endian, sizeof(big_endian)), encoded));
  return encoded;
}

ExecutionResultOr<std::string> ComputeEncodedCrc32c(std::string_view data) {
  return EncodeCrc32c(static_cast<uint32_t>(absl::ComputeCrc32c(data)));
}

}  // namespace s3upload::s3_client
