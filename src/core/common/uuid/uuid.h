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

#ifndef CORE_COMMON_UUID_UUID_H_
#define CORE_COMMON_UUID_UUID_H_

#include <cstdint>
#include <string>

namespace s3upload::core::common {
/// 128-bit identifier used for activity and correlation ids.
struct Uuid {
  static Uuid GenerateUuid() noexcept;

  bool operator==(const Uuid& other) const {
    return high == other.high && low == other.low;
  }

  bool operator!=(const Uuid& other) const { return !operator==(other); }

  uint64_t high = 0;
  uint64_t low = 0;
};

inline constexpr Uuid kZeroUuid{0, 0};

/**
 * @brief Formats the uuid as 00000000-0000-0000-0000-000000000000 with
 * uppercase hex digits.
 */
std::string ToString(const Uuid& uuid) noexcept;

}  // namespace s3upload::core::common

#endif  // CORE_COMMON_UUID_UUID_H_
