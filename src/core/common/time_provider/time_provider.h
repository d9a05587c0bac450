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

#ifndef CORE_COMMON_TIME_PROVIDER_TIME_PROVIDER_H_
#define CORE_COMMON_TIME_PROVIDER_TIME_PROVIDER_H_

#include <chrono>

namespace s3upload::core::common {
/// Clock readings for log timestamps and throughput timing.
class TimeProvider {
 public:
  /// Wall-clock time since the epoch.
  static std::chrono::nanoseconds GetWallTimestampInNanoseconds() {
    return std::chrono::system_clock::now().time_since_epoch();
  }

  /// Monotonic time. Only differences between two readings are meaningful.
  static std::chrono::nanoseconds GetSteadyTimestampInNanoseconds() {
    return std::chrono::steady_clock::now().time_since_epoch();
  }

  /**
   * @brief Monotonic time elapsed since start.
   *
   * @param start a value returned by GetSteadyTimestampInNanoseconds.
   */
  static std::chrono::nanoseconds SteadyElapsedSince(
      std::chrono::nanoseconds start) {
    return GetSteadyTimestampInNanoseconds() - start;
  }
};
}  // namespace s3upload::core::common

#endif  // CORE_COMMON_TIME_PROVIDER_TIME_PROVIDER_H_
