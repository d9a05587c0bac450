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


#ifndef CORE_ASYNC_EXECUTOR_AWS_AWS_ASYNC_EXECUTOR_H_
#define CORE_ASYNC_EXECUTOR_AWS_AWS_ASYNC_EXECUTOR_H_

#include <functional>
#include <memory>
#include <utility>

#include <aws/core/utils/threading/Executor.h>

#include "src/core/interface/async_executor_interface.h"

namespace s3upload::core::async_executor::aws {
/**
 * @brief Runs the IO tasks of the AWS SDK on an AsyncExecutorInterface
 * instead of the SDK's default thread pool.
 */
class AwsAsyncExecutor : public Aws::Utils::Threading::Executor {
 public:
  explicit AwsAsyncExecutor(
      std::shared_ptr<core::AsyncExecutorInterface> io_async_executor,
      AsyncPriority io_async_execution_priority =
          kDefaultAsyncPriorityForBlockingIOTaskExecution)
      : io_async_executor_(std::move(io_async_executor)),
        io_async_execution_priority_(io_async_execution_priority) {}

 protected:
  bool SubmitToThread(std::function<void()>&& task) override {
    return io_async_executor_
        ->Schedule([task = std::move(task)]() { task(); },
                   io_async_execution_priority_)
        .Successful();
  }

 private:
  std::shared_ptr<core::AsyncExecutorInterface> io_async_executor_;
  AsyncPriority io_async_execution_priority_;
};
}  // namespace s3upload::core::async_executor::aws

#endif  // CORE_ASYNC_EXECUTOR_AWS_AWS_ASYNC_EXECUTOR_H_
