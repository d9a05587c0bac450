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

#ifndef CORE_ASYNC_EXECUTOR_SINGLE_THREAD_ASYNC_EXECUTOR_H_
#define CORE_ASYNC_EXECUTOR_SINGLE_THREAD_ASYNC_EXECUTOR_H_

#include <cstddef>
#include <optional>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "src/core/common/concurrent_queue/concurrent_queue.h"
#include "src/core/interface/async_executor_interface.h"

namespace s3upload::core {
/**
 * @brief A single threaded async executor. One worker thread drains a high
 * priority queue before a normal priority queue.
 */
class SingleThreadAsyncExecutor {
 public:
  explicit SingleThreadAsyncExecutor(size_t queue_cap);

  /// Blocks until the queued work has run and the worker has exited.
  ~SingleThreadAsyncExecutor();

  /**
   * @brief Schedules a task with certain priority.
   * @param work the task that needs to be scheduled.
   * @param priority the priority of the task.
   * @return ExecutionResult Retry when the queue is at its cap.
   */
  ExecutionResult Schedule(AsyncOperation work,
                           AsyncPriority priority) noexcept;

  std::thread::id GetThreadId() const;

 private:
  void StartWorker() noexcept ABSL_LOCKS_EXCLUDED(mutex_);

  /// While false, the worker drains the remaining work and stops.
  bool is_running_ ABSL_GUARDED_BY(mutex_);
  bool worker_thread_started_ ABSL_GUARDED_BY(mutex_);
  bool worker_thread_stopped_ ABSL_GUARDED_BY(mutex_);
  size_t queue_cap_;
  common::ConcurrentQueue<AsyncOperation> normal_pri_queue_
      ABSL_GUARDED_BY(mutex_);
  common::ConcurrentQueue<AsyncOperation> high_pri_queue_
      ABSL_GUARDED_BY(mutex_);
  std::optional<std::thread> working_thread_;
  std::thread::id working_thread_id_;
  mutable absl::Mutex mutex_;
};
}  // namespace s3upload::core

#endif  // CORE_ASYNC_EXECUTOR_SINGLE_THREAD_ASYNC_EXECUTOR_H_
