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

#include "single_thread_async_executor.h"

#include <utility>

#include "absl/time/time.h"
#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"

namespace {
constexpr absl::Duration kLockWaitTime = absl::Milliseconds(5);
}  // namespace

namespace s3upload::core {
SingleThreadAsyncExecutor::SingleThreadAsyncExecutor(size_t queue_cap)
    : is_running_(true),
      worker_thread_started_(false),
      worker_thread_stopped_(false),
      queue_cap_(queue_cap),
      normal_pri_queue_(queue_cap_),
      high_pri_queue_(queue_cap_) {
  working_thread_.emplace(
      [](SingleThreadAsyncExecutor* ptr) {
        {
          absl::MutexLock lock(&ptr->mutex_);
          ptr->worker_thread_started_ = true;
        }
        ptr->StartWorker();
        {
          absl::MutexLock lock(&ptr->mutex_);
          ptr->worker_thread_stopped_ = true;
        }
      },
      this);
  working_thread_id_ = working_thread_->get_id();
  working_thread_->detach();
}

void SingleThreadAsyncExecutor::StartWorker() noexcept {
  while (true) {
    AsyncOperation work;
    {
      absl::MutexLock lock(&mutex_);
      auto fn = [this] {
        mutex_.AssertReaderHeld();
        return !is_running_ || high_pri_queue_.Size() > 0 ||
               normal_pri_queue_.Size() > 0;
      };
      mutex_.AwaitWithTimeout(absl::Condition(&fn), kLockWaitTime);

      if (normal_pri_queue_.Size() == 0 && high_pri_queue_.Size() == 0) {
        if (!is_running_) {
          break;
        }
        continue;
      }

      if (!high_pri_queue_.TryDequeue(work).Successful() &&
          !normal_pri_queue_.TryDequeue(work).Successful()) {
        continue;
      }
    }
    if (work) {
      work();
    }
  }
}

SingleThreadAsyncExecutor::~SingleThreadAsyncExecutor() {
  absl::MutexLock lock(&mutex_);
  is_running_ = false;

  // The worker may not have started yet; wait for it to start and exit.
  auto fn = [this] {
    mutex_.AssertReaderHeld();
    return worker_thread_started_ && worker_thread_stopped_;
  };
  mutex_.Await(absl::Condition(&fn));
}

ExecutionResult SingleThreadAsyncExecutor::Schedule(
    AsyncOperation work, AsyncPriority priority) noexcept {
  absl::MutexLock lock(&mutex_);
  if (priority != AsyncPriority::Normal && priority != AsyncPriority::High) {
    return FailureExecutionResult(
        errors::SC_ASYNC_EXECUTOR_INVALID_PRIORITY_TYPE);
  }

  ExecutionResult execution_result;
  if (priority == AsyncPriority::Normal) {
    execution_result = normal_pri_queue_.TryEnqueue(std::move(work));
  } else {
    execution_result = high_pri_queue_.TryEnqueue(std::move(work));
  }
  if (!execution_result.Successful()) {
    return RetryExecutionResult(errors::SC_ASYNC_EXECUTOR_EXCEEDING_QUEUE_CAP);
  }
  return SuccessExecutionResult();
}

std::thread::id SingleThreadAsyncExecutor::GetThreadId() const {
  return working_thread_id_;
}

}  // namespace s3upload::core
