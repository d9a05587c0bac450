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

#ifndef CORE_ASYNC_EXECUTOR_ASYNC_EXECUTOR_H_
#define CORE_ASYNC_EXECUTOR_ASYNC_EXECUTOR_H_

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "src/core/interface/async_executor_interface.h"
#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"
#include "single_thread_async_executor.h"

namespace s3upload::core {

/// Upper bound applied to the requested thread count.
inline constexpr size_t kMaxThreadCount = 10000;

/*! @copydoc AsyncExecutorInterface
 * Work is spread round robin over a pool of single threaded executors.
 */
class AsyncExecutor : public AsyncExecutorInterface {
 public:
  /**
   * @brief Construct a new Async Executor object with given thread_count and
   * queue_cap.
   *
   * @param thread_count the number of threads in the pool.
   * @param queue_cap the maximum size of each work queue. It is not an accurate
   * cap due to the concurrency of the queue.
   */
  AsyncExecutor(size_t thread_count, size_t queue_cap);

  ExecutionResult Schedule(AsyncOperation work,
                           AsyncPriority priority) noexcept override;

 private:
  static constexpr std::string_view kAsyncExecutor = "AsyncExecutor";

  size_t thread_count_;
  size_t queue_cap_;
  std::vector<std::unique_ptr<SingleThreadAsyncExecutor>> executor_pool_;
  std::atomic<uint64_t> task_counter_;
};
}  // namespace s3upload::core

#endif  // CORE_ASYNC_EXECUTOR_ASYNC_EXECUTOR_H_
