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

#ifndef CORE_INTERFACE_ASYNC_EXECUTOR_INTERFACE_H_
#define CORE_INTERFACE_ASYNC_EXECUTOR_INTERFACE_H_

#include "absl/functional/any_invocable.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core {
/// Defines operation type.
using AsyncOperation = absl::AnyInvocable<void()>;

/// Async operation execution priority.
enum class AsyncPriority {
  /**
   * @brief Runs after previously queued work when a thread is available.
   * Suitable for new requests.
   */
  Normal = 0,
  /**
   * @brief Dequeued before any Normal work. Suitable for callbacks.
   */
  High = 1,
};

/// Callbacks originating from the object store are time-sensitive.
inline constexpr AsyncPriority kDefaultAsyncPriorityForCallbackExecution =
    AsyncPriority::High;

/// Blocking work such as sub-request dispatch.
inline constexpr AsyncPriority kDefaultAsyncPriorityForBlockingIOTaskExecution =
    AsyncPriority::Normal;

/**
 * @brief AsyncExecutor is the thread pool driving transport callbacks.
 */
class AsyncExecutorInterface {
 public:
  virtual ~AsyncExecutorInterface() = default;

  /**
   * @brief Schedules a task with certain priority to be executed as soon as a
   * worker is free.
   * @param work the task that needs to be scheduled.
   * @param priority the priority of the task.
   * @return ExecutionResult result of the execution with possible error code.
   */
  virtual ExecutionResult Schedule(AsyncOperation work,
                                   AsyncPriority priority) noexcept = 0;
};
}  // namespace s3upload::core

#endif  // CORE_INTERFACE_ASYNC_EXECUTOR_INTERFACE_H_
