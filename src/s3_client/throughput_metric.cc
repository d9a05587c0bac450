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


#include "throughput_metric.h"

#include <chrono>
#include <string>

#include "src/core/common/global_logger/global_logger.h"

using s3upload::core::common::kZeroUuid;

namespace {
constexpr char kThroughputMetric[] = "ThroughputMetric";
constexpr double kBytesPerMib = 1024.0 * 1024.0;
}  // namespace

namespace s3upload::s3_client {

double ThroughputMibPerSecond(uint64_t bytes,
                              std::chrono::nanoseconds elapsed) {
  if (elapsed.count() <= 0) {
    return 0;
  }
  const double seconds = std::chrono::duration<double>(elapsed).count();
  return static_cast<double>(bytes) / kBytesPerMib / seconds;
}

void LogThroughputMetricRecorder::RecordThroughput(
    std::string_view operation, uint64_t bytes,
    std::chrono::nanoseconds elapsed) noexcept {
  S3U_INFO(kThroughputMetric, kZeroUuid,
           "%s throughput: %.3f MiB/s (%lu bytes in %ld ms)",
           std::string(operation).c_str(),
           ThroughputMibPerSecond(bytes, elapsed),
           static_cast<unsigned long>(bytes),  // NOLINT
           static_cast<long>(  // NOLINT
               std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                   .count()));
}

}  // namespace s3upload::s3_client
