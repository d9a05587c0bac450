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

#ifndef CORE_ASYNC_EXECUTOR_MOCK_MOCK_ASYNC_EXECUTOR_H_
#define CORE_ASYNC_EXECUTOR_MOCK_MOCK_ASYNC_EXECUTOR_H_

#include <functional>
#include <utility>

#include "src/core/interface/async_executor_interface.h"

namespace s3upload::core::async_executor::mock {
/// Runs scheduled work inline unless schedule_mock is set.
class MockAsyncExecutor : public core::AsyncExecutorInterface {
 public:
  MockAsyncExecutor() {}

  ExecutionResult Schedule(AsyncOperation work,
                           AsyncPriority priority) noexcept override {
    if (schedule_mock) {
      return schedule_mock(std::move(work));
    }

    work();
    return SuccessExecutionResult();
  }

  std::function<ExecutionResult(AsyncOperation work)> schedule_mock;
};
}  // namespace s3upload::core::async_executor::mock

#endif  // CORE_ASYNC_EXECUTOR_MOCK_MOCK_ASYNC_EXECUTOR_H_
