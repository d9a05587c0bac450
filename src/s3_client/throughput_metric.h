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


#ifndef S3_CLIENT_THROUGHPUT_METRIC_H_
#define S3_CLIENT_THROUGHPUT_METRIC_H_

#include <chrono>
#include <cstdint>
#include <string_view>

namespace s3upload::s3_client {
inline constexpr std::string_view kPutObjectOperation = "put_object";
inline constexpr std::string_view kPutObjectSingleOperation =
    "put_object_single";

/// Receives one sample per successful upload.
class ThroughputMetricRecorderInterface {
 public:
  virtual ~ThroughputMetricRecorderInterface() = default;

  /**
   * @brief Records the throughput of one upload.
   *
   * @param operation kPutObjectOperation or kPutObjectSingleOperation.
   * @param bytes bytes uploaded.
   * @param elapsed time from the start of the upload to its completion.
   */
  virtual void RecordThroughput(std::string_view operation, uint64_t bytes,
                                std::chrono::nanoseconds elapsed) noexcept = 0;
};

/// Logs every sample in MiB/s at info level.
class LogThroughputMetricRecorder : public ThroughputMetricRecorderInterface {
 public:
  void RecordThroughput(std::string_view operation, uint64_t bytes,
                        std::chrono::nanoseconds elapsed) noexcept override;
};

/// MiB/s for bytes over elapsed, 0 when elapsed is not positive.
double ThroughputMibPerSecond(uint64_t bytes,
                              std::chrono::nanoseconds elapsed);

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_THROUGHPUT_METRIC_H_
