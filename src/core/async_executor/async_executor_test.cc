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

#include "src/core/async_executor/async_executor.h"

#include <gtest/gtest.h>

#include <thread>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/blocking_counter.h"
#include "absl/synchronization/mutex.h"
#include "src/core/async_executor/error_codes.h"
#include "src/core/interface/async_executor_interface.h"
#include "src/public/core/interface/execution_result.h"
#include "src/public/core/test_execution_result_matchers.h"

namespace s3upload::core::test {

TEST(AsyncExecutorTests, EmptyWorkQueue) { AsyncExecutor executor(1, 10); }

TEST(AsyncExecutorTests, ZeroThreadsCannotSchedule) {
  AsyncExecutor executor(0, 10);
  EXPECT_THAT(executor.Schedule([] {}, AsyncPriority::Normal),
              ResultIs(FailureExecutionResult(
                  errors::SC_ASYNC_EXECUTOR_NOT_INITIALIZED)));
}

TEST(AsyncExecutorTests, CountWorkMultipleThread) {
  constexpr int kQueueCap = 50;
  AsyncExecutor executor(4, kQueueCap);
  absl::BlockingCounter count(kQueueCap);
  for (int i = 0; i < kQueueCap / 2; i++) {
    EXPECT_SUCCESS(executor.Schedule([&] { count.DecrementCount(); },
                                     AsyncPriority::Normal));
    EXPECT_SUCCESS(
        executor.Schedule([&] { count.DecrementCount(); }, AsyncPriority::High));
  }
  count.Wait();
}

TEST(AsyncExecutorTests, SpreadsWorkOverThreads) {
  constexpr int kThreads = 3;
  AsyncExecutor executor(kThreads, 10);
  absl::Mutex mutex;
  absl::flat_hash_set<std::thread::id> thread_ids;
  absl::BlockingCounter count(kThreads);
  for (int i = 0; i < kThreads; i++) {
    EXPECT_SUCCESS(executor.Schedule(
        [&] {
          {
            absl::MutexLock lock(&mutex);
            thread_ids.insert(std::this_thread::get_id());
          }
          count.DecrementCount();
        },
        AsyncPriority::Normal));
  }
  count.Wait();

  absl::MutexLock lock(&mutex);
  EXPECT_EQ(thread_ids.size(), kThreads);
}

}  // namespace s3upload::core::test
