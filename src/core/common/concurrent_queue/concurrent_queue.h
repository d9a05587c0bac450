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

#ifndef CORE_COMMON_CONCURRENT_QUEUE_CONCURRENT_QUEUE_H_
#define CORE_COMMON_CONCURRENT_QUEUE_CONCURRENT_QUEUE_H_

#include <cstddef>
#include <utility>

#include "oneapi/tbb/concurrent_queue.h"
#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"

namespace s3upload::core::common {
/**
 * @brief Bounded multi-producer multi-consumer queue.
 */
template <class T>
class ConcurrentQueue {
 public:
  explicit ConcurrentQueue(size_t max_size) { queue_.set_capacity(max_size); }

  /// Enqueues a copy of element unless the queue is full. Thread-safe.
  ExecutionResult TryEnqueue(const T& element) noexcept {
    if (!queue_.try_push(element)) {
      return FailureExecutionResult(errors::SC_CONCURRENT_QUEUE_CANNOT_ENQUEUE);
    }
    return SuccessExecutionResult();
  }

  /// Enqueues element unless the queue is full. Thread-safe.
  ExecutionResult TryEnqueue(T&& element) noexcept {
    if (!queue_.try_push(std::move(element))) {
      return FailureExecutionResult(errors::SC_CONCURRENT_QUEUE_CANNOT_ENQUEUE);
    }
    return SuccessExecutionResult();
  }

  /// Dequeues into element, or fails if the queue is empty.
  ExecutionResult TryDequeue(T& element) noexcept {
    if (!queue_.try_pop(element)) {
      return FailureExecutionResult(errors::SC_CONCURRENT_QUEUE_CANNOT_DEQUEUE);
    }
    return SuccessExecutionResult();
  }

  /// Approximate number of queued elements.
  size_t Size() noexcept {
    const auto size = queue_.size();
    return size < 0 ? 0 : static_cast<size_t>(size);
  }

 private:
  tbb::concurrent_bounded_queue<T> queue_;
};
}  // namespace s3upload::core::common

#endif  // CORE_COMMON_CONCURRENT_QUEUE_CONCURRENT_QUEUE_H_
