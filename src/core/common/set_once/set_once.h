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


#ifndef CORE_COMMON_SET_ONCE_SET_ONCE_H_
#define CORE_COMMON_SET_ONCE_SET_ONCE_H_

#include <optional>
#include <utility>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace s3upload::core::common {
/**
 * @brief A single-assignment cell shared between producers running on
 * arbitrary threads and one or more waiting consumers. Only the first Set is
 * retained; later values are dropped.
 *
 * @tparam T the stored value type.
 */
template <typename T>
class SetOnce {
 public:
  SetOnce() = default;
  SetOnce(const SetOnce&) = delete;
  SetOnce& operator=(const SetOnce&) = delete;

  /**
   * @brief Stores the value if the cell is still empty.
   *
   * @return true when this call resolved the cell.
   */
  bool Set(T value) {
    absl::MutexLock lock(&mutex_);
    if (value_.has_value()) {
      return false;
    }
    value_.emplace(std::move(value));
    return true;
  }

  /// Blocks until the cell is resolved and returns a copy of the value.
  T Wait() {
    absl::MutexLock lock(&mutex_);
    mutex_.Await(absl::Condition(this, &SetOnce::IsResolved));
    return *value_;
  }

  /// Blocks for at most `timeout`. Returns std::nullopt when still empty.
  std::optional<T> WaitWithTimeout(absl::Duration timeout) {
    absl::MutexLock lock(&mutex_);
    mutex_.AwaitWithTimeout(absl::Condition(this, &SetOnce::IsResolved),
                            timeout);
    return value_;
  }

  std::optional<T> TryGet() const {
    absl::MutexLock lock(&mutex_);
    return value_;
  }

 private:
  bool IsResolved() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return value_.has_value();
  }

  mutable absl::Mutex mutex_;
  std::optional<T> value_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::core::common

#endif  // CORE_COMMON_SET_ONCE_SET_ONCE_H_
