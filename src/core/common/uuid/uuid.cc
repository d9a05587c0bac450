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

#include "uuid.h"

#include <chrono>
#include <cstdint>
#include <string>

#include "absl/random/random.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "src/core/common/time_provider/time_provider.h"

namespace s3upload::core::common {

Uuid Uuid::GenerateUuid() noexcept {
  // absl::BitGen is not thread safe; each thread keeps its own.
  thread_local absl::BitGen bitgen;
  return Uuid{
      .high = static_cast<uint64_t>(
          TimeProvider::GetSteadyTimestampInNanoseconds().count()),
      .low = absl::Uniform<uint64_t>(bitgen),
  };
}

std::string ToString(const Uuid& uuid) noexcept {
  std::string uuid_str;
  uuid_str.reserve(36);
  absl::StrAppend(&uuid_str, absl::Hex(uuid.high, absl::kZeroPad16),
                  absl::Hex(uuid.low, absl::kZeroPad16));
  absl::AsciiStrToUpper(&uuid_str);
  for (int i : {20, 16, 12, 8}) {
    uuid_str.insert(i, 1, '-');
  }
  return uuid_str;
}

}  // namespace s3upload::core::common
