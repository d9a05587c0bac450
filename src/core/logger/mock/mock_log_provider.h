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

#ifndef CORE_LOGGER_MOCK_MOCK_LOG_PROVIDER_H_
#define CORE_LOGGER_MOCK_MOCK_LOG_PROVIDER_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "src/core/logger/log_providers/console_log_provider.h"

namespace s3upload::core::logger::mock {
/// Keeps formatted log lines in memory for inspection by tests.
class MockLogProvider final : public ConsoleLogProvider {
 public:
  void Print(std::string_view output) noexcept override {
    absl::MutexLock lock(&mutex_);
    messages_.emplace_back(output);
  }

  std::vector<std::string> GetMessages() const {
    absl::MutexLock lock(&mutex_);
    return messages_;
  }

  void Clear() {
    absl::MutexLock lock(&mutex_);
    messages_.clear();
  }

 private:
  mutable absl::Mutex mutex_;
  std::vector<std::string> messages_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::core::logger::mock

#endif  // CORE_LOGGER_MOCK_MOCK_LOG_PROVIDER_H_
