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

#include "async_executor.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"

namespace s3upload::core {
AsyncExecutor::AsyncExecutor(size_t thread_count, size_t queue_cap)
    : thread_count_(std::clamp<size_t>(thread_count, 0, kMaxThreadCount)),
      queue_cap_(queue_cap),
      task_counter_(0) {
  executor_pool_.reserve(thread_count_);
  for (size_t i = 0; i < thread_count_; ++i) {
    executor_pool_.push_back(
        std::make_unique<SingleThreadAsyncExecutor>(queue_cap_));
  }
}

ExecutionResult AsyncExecutor::Schedule(AsyncOperation work,
                                        AsyncPriority priority) noexcept {
  if (executor_pool_.empty()) {
    return FailureExecutionResult(errors::SC_ASYNC_EXECUTOR_NOT_INITIALIZED);
  }
  const auto picked_index =
      task_counter_.fetch_add(1, std::memory_order_relaxed) %
      executor_pool_.size();
  return executor_pool_.at(picked_index)->Schedule(std::move(work), priority);
}
}  // namespace s3upload::core
