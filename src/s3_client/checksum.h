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


#ifndef S3_CLIENT_CHECKSUM_H_
#define S3_CLIENT_CHECKSUM_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "src/public/core/interface/execution_result.h"

namespace s3upload::s3_client {

enum class ChecksumAlgorithm {
  kNone = 0,
  kCrc32c = 1,
};

enum class ChecksumLocation {
  /// Computed but only exposed to the upload review.
  kNone = 0,
  /// Sent with every part.
  kTrailer = 1,
};

/// Checksum settings attached to one upload.
struct ChecksumConfig {
  /// CRC32C computed and sent with every part.
  static ChecksumConfig TrailingCrc32c() {
    return ChecksumConfig{ChecksumAlgorithm::kCrc32c,
                          ChecksumLocation::kTrailer};
  }

  /// CRC32C computed for the upload review only.
  static ChecksumConfig UploadReviewCrc32c() {
    return ChecksumConfig{ChecksumAlgorithm::kCrc32c, ChecksumLocation::kNone};
  }

  bool operator==(const ChecksumConfig& other) const {
    return algorithm == other.algorithm && location == other.location;
  }

  ChecksumAlgorithm algorithm = ChecksumAlgorithm::kNone;
  ChecksumLocation location = ChecksumLocation::kNone;
};

/// Name of the header carrying a CRC32C checksum.
inline constexpr std::string_view kChecksumCrc32cHeader =
    "x-amz-checksum-crc32c";

/**
 * @brief Encodes a CRC32C value the way the object store expects it: base64
 * of the four big-endian bytes.
 */
core::ExecutionResultOr<std::string> EncodeCrc32c(uint32_t crc32c);

/// Computes the CRC32C of data and encodes it with EncodeCrc32c.
core::ExecutionResultOr<std::string> ComputeEncodedCrc32c(
    std::string_view data);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_CHECKSUM_H_
