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

#ifndef PUBLIC_CORE_INTERFACE_EXECUTION_RESULT_H_
#define PUBLIC_CORE_INTERFACE_EXECUTION_RESULT_H_

#include <cstdint>
#include <utility>
#include <variant>

#include "absl/log/check.h"

namespace s3upload::core {

// Returns the ExecutionResult from the enclosing function when it is not
// successful.
//
// Example:
// RETURN_IF_FAILURE(session.Write(chunk));
// // Reaching this line means Write succeeded.
#define RETURN_IF_FAILURE(execution_result)                   \
  if (::s3upload::core::ExecutionResult __res = execution_result; \
      !__res.Successful()) {                                  \
    return __res;                                             \
  }

// Same as RETURN_IF_FAILURE but logs with S3U_ERROR before returning. The
// trailing arguments are those of S3U_ERROR without the ExecutionResult.
#define RETURN_AND_LOG_IF_FAILURE(execution_result, component_name,    \
                                  activity_id, message, ...)           \
  __RETURN_IF_FAILURE_LOG(execution_result, S3U_ERROR, component_name, \
                          activity_id, message, ##__VA_ARGS__)

// Same as RETURN_AND_LOG_IF_FAILURE but takes the ids from an AsyncContext.
#define RETURN_AND_LOG_IF_FAILURE_CONTEXT(execution_result, component_name,    \
                                          async_context, message, ...)         \
  __RETURN_IF_FAILURE_LOG(execution_result, S3U_ERROR_CONTEXT, component_name, \
                          async_context, message, ##__VA_ARGS__)

#define __RETURN_IF_FAILURE_LOG(execution_result, error_level, component_name, \
                                activity_id, message, ...)                     \
  if (::s3upload::core::ExecutionResult __res = execution_result;              \
      !__res.Successful()) {                                                   \
    error_level(component_name, activity_id, __res, message, ##__VA_ARGS__);   \
    return __res;                                                              \
  }

// Unwraps an ExecutionResultOr into lhs, or returns its ExecutionResult.
//
// Example:
// ASSIGN_OR_RETURN(auto session, client.PutObject(bucket, key, params));
// // session is a std::unique_ptr<UploadSession> here.
//
// lhs may also be an existing lvalue:
// std::string etag;
// ASSIGN_OR_RETURN(etag, ExtractEtag(headers));
#define ASSIGN_OR_RETURN(lhs, execution_result_or)            \
  __ASSIGN_OR_RETURN_HELPER(lhs, __UNIQUE_VAR_NAME(__LINE__), \
                            execution_result_or, )

// Same as ASSIGN_OR_RETURN but logs with S3U_ERROR upon failure.
#define ASSIGN_OR_LOG_AND_RETURN(lhs, execution_result_or, component_name, \
                                 activity_id, message, ...)                \
  __ASSIGN_OR_RETURN_HELPER(                                               \
      lhs, __UNIQUE_VAR_NAME(__LINE__), execution_result_or,               \
      S3U_ERROR(component_name, activity_id, __res, message, ##__VA_ARGS__))

// Same as ASSIGN_OR_RETURN but logs with S3U_ERROR_CONTEXT upon failure.
#define ASSIGN_OR_LOG_AND_RETURN_CONTEXT(                                    \
    lhs, execution_result_or, component_name, async_context, message, ...)   \
  __ASSIGN_OR_RETURN_HELPER(lhs, __UNIQUE_VAR_NAME(__LINE__),                \
                            execution_result_or,                             \
                            S3U_ERROR_CONTEXT(component_name, async_context, \
                                              __res, message, ##__VA_ARGS__))

#define __UNIQUE_VAR_NAME_HELPER(x, y) x##y
#define __UNIQUE_VAR_NAME(x) __UNIQUE_VAR_NAME_HELPER(__var, x)

#define __ASSIGN_OR_RETURN_HELPER(lhs, result_or_temp_var_name,           \
                                  execution_result_or, failure_statement) \
  auto&& result_or_temp_var_name = execution_result_or;                   \
  if (!result_or_temp_var_name.Successful()) {                            \
    auto __res = result_or_temp_var_name.result();                        \
    failure_statement;                                                    \
    return __res;                                                         \
  }                                                                       \
  lhs = result_or_temp_var_name.release();

/// Operation's execution status.
enum class ExecutionStatus {
  /// Executed successfully.
  Success = 0,
  /// Execution failed.
  Failure = 1,
  /// Did not execute and requires retry.
  Retry = 2,
};

/// Status code returned from operation execution.
using StatusCode = uint64_t;
#define SC_OK 0UL
#define SC_UNKNOWN 1UL

struct ExecutionResult;
constexpr ExecutionResult SuccessExecutionResult();

/// Operation's execution result including status and status code.
struct ExecutionResult {
  constexpr ExecutionResult(ExecutionStatus status, StatusCode status_code)
      : status(status), status_code(status_code) {}

  constexpr ExecutionResult()
      : ExecutionResult(ExecutionStatus::Failure, SC_UNKNOWN) {}

  bool operator==(const ExecutionResult& other) const {
    return status == other.status && status_code == other.status_code;
  }

  bool operator!=(const ExecutionResult& other) const {
    return !operator==(other);
  }

  bool Successful() const { return *this == SuccessExecutionResult(); }

  bool Retryable() const { return this->status == ExecutionStatus::Retry; }

  explicit operator bool() const { return Successful(); }

  ExecutionStatus status = ExecutionStatus::Failure;
  /// Error code when the operation was not successful.
  StatusCode status_code = SC_UNKNOWN;
};

constexpr ExecutionResult SuccessExecutionResult() {
  return ExecutionResult(ExecutionStatus::Success, SC_OK);
}

class FailureExecutionResult : public ExecutionResult {
 public:
  explicit constexpr FailureExecutionResult(StatusCode status_code)
      : ExecutionResult(ExecutionStatus::Failure, status_code) {}
};

class RetryExecutionResult : public ExecutionResult {
 public:
  explicit constexpr RetryExecutionResult(StatusCode status_code)
      : ExecutionResult(ExecutionStatus::Retry, status_code) {}
};

// Holds either a failed ExecutionResult or a value of type T.
//
// ExecutionResultOr<PutObjectResult> Complete() {
//   if (write in flight) {
//     return FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED);
//   }
//   return result;
// }
//
// Moving the value out leaves the holder Successful() with a moved-from T.
template <typename T>
class ExecutionResultOr : public std::variant<ExecutionResult, T> {
 private:
  using base = std::variant<ExecutionResult, T>;

 public:
  using base::base;
  using base::operator=;

  ExecutionResultOr() : base(ExecutionResult()) {}

  bool Successful() const { return result().Successful(); }

  // Returns the held ExecutionResult, or Success when a value is held.
  ExecutionResult result() const {
    if (!HasExecutionResult()) {
      return SuccessExecutionResult();
    }
    return std::get<ExecutionResult>(*this);
  }

  bool has_value() const { return !HasExecutionResult(); }

  // Undefined unless has_value().
  const T& value() const& { return std::get<T>(*this); }

  T& value() & { return std::get<T>(*this); }

  T&& value() && { return std::move(this->value()); }

  const T& operator*() const& { return this->value(); }

  T& operator*() & { return this->value(); }

  T&& operator*() && { return std::move(this->value()); }

  const T* operator->() const {
    CHECK(has_value())
        << "Attempting to access value of failed ExecutionResultOr";
    return std::get_if<T>(this);
  }

  T* operator->() {
    CHECK(has_value())
        << "Attempting to access value of failed ExecutionResultOr";
    return std::get_if<T>(this);
  }

  T&& release() { return std::move(this->value()); }

 private:
  bool HasExecutionResult() const {
    return std::holds_alternative<ExecutionResult>(*this);
  }
};

}  // namespace s3upload::core

#endif  // PUBLIC_CORE_INTERFACE_EXECUTION_RESULT_H_
