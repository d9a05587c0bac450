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


#ifndef S3_CLIENT_MOCK_MOCK_THROUGHPUT_METRIC_RECORDER_H_
#define S3_CLIENT_MOCK_MOCK_THROUGHPUT_METRIC_RECORDER_H_

#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <string_view>

#include "src/s3_client/throughput_metric.h"

namespace s3upload::s3_client::mock {
class MockThroughputMetricRecorder : public ThroughputMetricRecorderInterface {
 public:
  MOCK_METHOD(void, RecordThroughput,
              (std::string_view operation, uint64_t bytes,
               std::chrono::nanoseconds elapsed),
              (noexcept, override));
};
}  // namespace s3upload::s3_client::mock

#endif  // S3_CLIENT_MOCK_MOCK_THROUGHPUT_METRIC_RECORDER_H_
