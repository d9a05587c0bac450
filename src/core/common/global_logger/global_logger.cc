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

#include "global_logger.h"

#include <string_view>

#include "src/core/logger/interface/log_provider_interface.h"
#include "src/core/logger/log_providers/console_log_provider.h"
#include "src/core/logger/mock/mock_log_provider.h"
#include "src/public/core/interface/execution_result.h"

using s3upload::core::logger::ConsoleLogProvider;
using s3upload::core::logger::LogProviderInterface;
using s3upload::core::logger::mock::MockLogProvider;

namespace s3upload::core::common {
static LogOption log_option = LogOption::kNoLog;

void InitializeLog(LogOption option) { log_option = option; }

namespace internal::log {
LogProviderInterface* GetLogger() {
  // Providers are heap allocated so that no destructor runs at exit.
  switch (log_option) {
    case LogOption::kMock: {
      static auto& provider = *new MockLogProvider();
      return &provider;
    }
    case LogOption::kConsoleLog: {
      static auto& provider = *new ConsoleLogProvider();
      return &provider;
    }
    default:
      return nullptr;
  }
}

std::string_view GetErrorMessage(const ExecutionResult& result) {
  return errors::GetErrorMessage(result.status_code);
}
}  // namespace internal::log
}  // namespace s3upload::core::common
