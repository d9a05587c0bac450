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


#include "src/core/common/set_once/set_once.h"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace s3upload::core::common::test {

TEST(SetOnceTest, FirstSetWins) {
  SetOnce<std::string> cell;
  EXPECT_FALSE(cell.TryGet().has_value());
  EXPECT_TRUE(cell.Set("first"));
  EXPECT_FALSE(cell.Set("second"));
  EXPECT_EQ(cell.Wait(), "first");
  EXPECT_EQ(*cell.TryGet(), "first");
}

TEST(SetOnceTest, WaitWithTimeoutReturnsEmptyWhenUnresolved) {
  SetOnce<int> cell;
  EXPECT_FALSE(cell.WaitWithTimeout(absl::Milliseconds(10)).has_value());
  cell.Set(3);
  EXPECT_EQ(cell.WaitWithTimeout(absl::Milliseconds(10)), 3);
}

TEST(SetOnceTest, WaitBlocksUntilAnotherThreadSets) {
  SetOnce<int> cell;
  absl::Notification waiting;
  std::thread producer([&] {
    waiting.WaitForNotification();
    cell.Set(42);
  });
  waiting.Notify();
  EXPECT_EQ(cell.Wait(), 42);
  producer.join();
}

TEST(SetOnceTest, ConcurrentProducersResolveExactlyOnce) {
  SetOnce<int> cell;
  std::atomic<int> winners = 0;
  std::vector<std::thread> producers;
  for (int i = 0; i < 8; ++i) {
    producers.emplace_back([&, i] {
      if (cell.Set(i)) {
        winners++;
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_TRUE(cell.TryGet().has_value());
}

}  // namespace s3upload::core::common::test
