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

#include "src/core/async_executor/single_thread_async_executor.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "absl/synchronization/blocking_counter.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "src/core/async_executor/error_codes.h"
#include "src/core/interface/async_executor_interface.h"
#include "src/public/core/interface/execution_result.h"
#include "src/public/core/test_execution_result_matchers.h"

namespace s3upload::core::test {
TEST(SingleThreadAsyncExecutorTests, ExceedingQueueCapSchedule) {
  constexpr int kQueueCap = 1;
  SingleThreadAsyncExecutor executor(kQueueCap);
  absl::Notification release;
  // Occupies the worker until the end of the test.
  ASSERT_SUCCESS(
      executor.Schedule([&] { release.WaitForNotification(); },
                        AsyncPriority::Normal));

  auto start_time = std::chrono::steady_clock::now();
  while (true) {
    auto result = executor.Schedule([] {}, AsyncPriority::Normal);
    if (result ==
        RetryExecutionResult(errors::SC_ASYNC_EXECUTOR_EXCEEDING_QUEUE_CAP)) {
      break;
    }
    if (std::chrono::steady_clock::now() - start_time >
        std::chrono::seconds(5)) {
      FAIL() << "Queue cap schedule was never exceeded.";
    }
  }
  release.Notify();
}

TEST(SingleThreadAsyncExecutorTests, CountWork) {
  constexpr int kQueueCap = 10;
  SingleThreadAsyncExecutor executor(kQueueCap);
  absl::BlockingCounter count(kQueueCap);
  for (int i = 0; i < kQueueCap / 2; i++) {
    EXPECT_SUCCESS(executor.Schedule([&] { count.DecrementCount(); },
                                     AsyncPriority::Normal));
    EXPECT_SUCCESS(
        executor.Schedule([&] { count.DecrementCount(); }, AsyncPriority::High));
  }
  count.Wait();
}

TEST(SingleThreadAsyncExecutorTests, RunsOnWorkerThread) {
  SingleThreadAsyncExecutor executor(10);
  absl::Notification done;
  std::thread::id ran_on;
  ASSERT_SUCCESS(executor.Schedule(
      [&] {
        ran_on = std::this_thread::get_id();
        done.Notify();
      },
      AsyncPriority::High));
  done.WaitForNotification();
  EXPECT_EQ(ran_on, executor.GetThreadId());
}

TEST(SingleThreadAsyncExecutorTests, HighPriorityRunsFirst) {
  constexpr int kQueueCap = 10;
  SingleThreadAsyncExecutor executor(kQueueCap);
  absl::Notification release;
  ASSERT_SUCCESS(executor.Schedule([&] { release.WaitForNotification(); },
                                   AsyncPriority::Normal));

  absl::Mutex mutex;
  std::vector<int> order;
  absl::BlockingCounter count(2);
  ASSERT_SUCCESS(executor.Schedule(
      [&] {
        absl::MutexLock lock(&mutex);
        order.push_back(1);
        count.DecrementCount();
      },
      AsyncPriority::Normal));
  ASSERT_SUCCESS(executor.Schedule(
      [&] {
        absl::MutexLock lock(&mutex);
        order.push_back(2);
        count.DecrementCount();
      },
      AsyncPriority::High));
  release.Notify();
  count.Wait();

  absl::MutexLock lock(&mutex);
  EXPECT_EQ(order, (std::vector<int>{2, 1}));
}
}  // namespace s3upload::core::test
