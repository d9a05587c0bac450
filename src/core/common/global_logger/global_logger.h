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

#ifndef CORE_COMMON_GLOBAL_LOGGER_GLOBAL_LOGGER_H_
#define CORE_COMMON_GLOBAL_LOGGER_GLOBAL_LOGGER_H_

#include <string_view>

#include "absl/strings/str_cat.h"
#include "src/core/common/uuid/uuid.h"
#include "src/core/interface/errors.h"
#include "src/core/logger/interface/log_provider_interface.h"

namespace s3upload::core::common {
enum class LogOption {
  /// Logs into memory for test purposes.
  kMock = 0,
  /// Doesn't produce logs.
  kNoLog = 1,
  /// Produces logs to console.
  kConsoleLog = 2,
};

/// Selects the process-wide log destination. Not thread safe; call at startup.
void InitializeLog(LogOption option);

namespace internal::log {
/// Returns nullptr when logging is disabled.
logger::LogProviderInterface* GetLogger();
std::string_view GetErrorMessage(const ExecutionResult& result);
}  // namespace internal::log
}  // namespace s3upload::core::common

#define S3U_LOCATION absl::StrCat(__FILE__, ":", __func__, ":", __LINE__)

#define S3U_INFO(component_name, activity_id, message, ...)             \
  __S3U_LOG(s3upload::core::logger::LogLevel::kInfo, component_name, \
            activity_id, message, ##__VA_ARGS__)

#define S3U_INFO_CONTEXT(component_name, async_context, message, ...) \
  __S3U_LOG_CONTEXT(s3upload::core::logger::LogLevel::kInfo,          \
                    component_name, async_context, message, ##__VA_ARGS__)

#define S3U_DEBUG(component_name, activity_id, message, ...)             \
  __S3U_LOG(s3upload::core::logger::LogLevel::kDebug, component_name, \
            activity_id, message, ##__VA_ARGS__)

#define S3U_DEBUG_CONTEXT(component_name, async_context, message, ...) \
  __S3U_LOG_CONTEXT(s3upload::core::logger::LogLevel::kDebug,          \
                    component_name, async_context, message, ##__VA_ARGS__)

#define S3U_WARNING(component_name, activity_id, message, ...)             \
  __S3U_LOG(s3upload::core::logger::LogLevel::kWarning, component_name, \
            activity_id, message, ##__VA_ARGS__)

#define S3U_WARNING_CONTEXT(component_name, async_context, message, ...) \
  __S3U_LOG_CONTEXT(s3upload::core::logger::LogLevel::kWarning,          \
                    component_name, async_context, message, ##__VA_ARGS__)

#define S3U_ERROR(component_name, activity_id, execution_result, message, ...) \
  __S3U_LOG_FAIL(s3upload::core::logger::LogLevel::kError, component_name,     \
                 activity_id, execution_result, message, ##__VA_ARGS__)

#define S3U_ERROR_CONTEXT(component_name, async_context, execution_result, \
                          message, ...)                                    \
  __S3U_LOG_FAIL_CONTEXT(s3upload::core::logger::LogLevel::kError,         \
                         component_name, async_context, execution_result,  \
                         message, ##__VA_ARGS__)

#define S3U_CRITICAL(component_name, activity_id, execution_result, message, \
                     ...)                                                    \
  __S3U_LOG_FAIL(s3upload::core::logger::LogLevel::kCritical,                \
                 component_name, activity_id, execution_result, message,     \
                 ##__VA_ARGS__)

#define S3U_CRITICAL_CONTEXT(component_name, async_context, execution_result, \
                             message, ...)                                    \
  __S3U_LOG_FAIL_CONTEXT(s3upload::core::logger::LogLevel::kCritical,         \
                         component_name, async_context, execution_result,     \
                         message, ##__VA_ARGS__)

#define __S3U_LOG(log_level, component_name, activity_id, message, ...)       \
  __S3U_LOG_IMPL(log_level, component_name, s3upload::core::common::kZeroUuid, \
                 s3upload::core::common::kZeroUuid, activity_id, message,     \
                 ##__VA_ARGS__)

#define __S3U_LOG_CONTEXT(log_level, component_name, async_context, message,  \
                          ...)                                                \
  __S3U_LOG_IMPL(log_level, component_name, async_context.correlation_id,     \
                 async_context.parent_activity_id, async_context.activity_id, \
                 message, ##__VA_ARGS__)

#define __S3U_LOG_FAIL(log_level, component_name, activity_id,              \
                       execution_result, message, ...)                      \
  __S3U_LOG_FAIL_IMPL(log_level, component_name,                            \
                      s3upload::core::common::kZeroUuid,                    \
                      s3upload::core::common::kZeroUuid, activity_id,       \
                      execution_result, message, ##__VA_ARGS__)

#define __S3U_LOG_FAIL_CONTEXT(log_level, component_name, async_context,       \
                               execution_result, message, ...)                 \
  __S3U_LOG_FAIL_IMPL(log_level, component_name, async_context.correlation_id, \
                      async_context.parent_activity_id,                        \
                      async_context.activity_id, execution_result, message,    \
                      ##__VA_ARGS__)

#define __S3U_LOG_FAIL_IMPL(log_level, component_name, correlation_id,         \
                            parent_activity_id, activity_id, execution_result, \
                            message, ...)                                      \
  __S3U_LOG_IMPL(log_level, component_name, correlation_id, parent_activity_id, \
                 activity_id,                                                  \
                 absl::StrCat(message, " Failed with: ",                       \
                              s3upload::core::common::internal::log::          \
                                  GetErrorMessage(execution_result)),          \
                 ##__VA_ARGS__)

#define __S3U_LOG_IMPL(log_level, component_name, correlation_id,           \
                       parent_activity_id, activity_id, message, ...)       \
  if (auto* const logger =                                                  \
          s3upload::core::common::internal::log::GetLogger();               \
      logger != nullptr) {                                                  \
    logger->Log(log_level, correlation_id, parent_activity_id, activity_id, \
                component_name, S3U_LOCATION, message, ##__VA_ARGS__);      \
  }

#endif  // CORE_COMMON_GLOBAL_LOGGER_GLOBAL_LOGGER_H_
