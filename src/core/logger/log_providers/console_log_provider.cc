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

#include "console_log_provider.h"

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "src/core/common/time_provider/time_provider.h"
#include "src/core/common/uuid/uuid.h"
#include "src/core/logger/log_utils.h"

using s3upload::core::common::TimeProvider;
using s3upload::core::common::Uuid;

namespace {
constexpr uint64_t kNanoSecondsMultiplier = (1000 * 1000 * 1000);
}  // namespace

namespace s3upload::core::logger {

void ConsoleLogProvider::Log(const LogLevel& level, const Uuid& correlation_id,
                             const Uuid& parent_activity_id,
                             const Uuid& activity_id,
                             std::string_view component_name,
                             std::string_view location,
                             std::string_view message, ...) noexcept {
  const auto current_timestamp =
      TimeProvider::GetWallTimestampInNanoseconds().count();
  std::stringstream output;
  output << current_timestamp / kNanoSecondsMultiplier << "."
         << current_timestamp % kNanoSecondsMultiplier << "|" << component_name
         << "|" << common::ToString(correlation_id) << "|"
         << common::ToString(parent_activity_id) << "|"
         << common::ToString(activity_id) << "|" << location << "|"
         << ToString(level) << ": ";

  va_list args;
  va_start(args, message);
  va_list size_args;
  va_copy(size_args, args);
  const auto size = std::vsnprintf(nullptr, 0U, message.data(), size_args);
  va_end(size_args);
  if (size > 0) {
    // vsnprintf writes a terminator, hence size + 1.
    std::vector<char> output_message(size + 1);
    std::vsnprintf(output_message.data(), size + 1, message.data(), args);
    output << std::string_view(output_message.data(), size);
  }
  va_end(args);

  Print(output.str());
}

void ConsoleLogProvider::Print(std::string_view output) noexcept {
  std::cout << output << std::endl;
}
}  // namespace s3upload::core::logger
