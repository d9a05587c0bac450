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

#ifndef PUBLIC_CORE_TEST_EXECUTION_RESULT_MATCHERS_H_
#define PUBLIC_CORE_TEST_EXECUTION_RESULT_MATCHERS_H_

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include "absl/strings/str_cat.h"
#include "src/core/interface/errors.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::test {
namespace internal {
std::string ToString(ExecutionStatus status);
}  // namespace internal

// EXPECT_THAT(execution_result, IsSuccessful())
#define EXPECT_SUCCESS(expression) \
  EXPECT_THAT(expression, ::s3upload::core::test::IsSuccessful())

// ASSERT_THAT(execution_result, IsSuccessful())
#define ASSERT_SUCCESS(expression) \
  ASSERT_THAT(expression, ::s3upload::core::test::IsSuccessful())

// Asserts that execution_result_or is successful and moves its value into
// lhs.
//
// ASSERT_SUCCESS_AND_ASSIGN(auto session, client.PutObject(...));
#define ASSERT_SUCCESS_AND_ASSIGN(lhs, execution_result_or)            \
  __ASSERT_SUCCESS_AND_ASSIGN_HELPER(lhs, __UNIQUE_VAR_NAME(__LINE__), \
                                     execution_result_or)

#define __ASSERT_SUCCESS_AND_ASSIGN_HELPER(lhs, result_or_temp_var_name, \
                                           execution_result_or)          \
  auto&& result_or_temp_var_name = execution_result_or;                  \
  ASSERT_SUCCESS(result_or_temp_var_name);                               \
  lhs = result_or_temp_var_name.release();

// Matches an ExecutionResult, or the result() of an ExecutionResultOr,
// against expected_result.
//
// EXPECT_THAT(session->Write(chunk),
//             ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
MATCHER_P(ResultIs, expected_result, "") {
  auto execution_result_to_str = [](ExecutionResult result) {
    return absl::StrCat("ExecutionStatus: ", internal::ToString(result.status),
                        "\n\tStatusCode: ", result.status_code,
                        "\n\tErrorMessage: \"",
                        errors::GetErrorMessage(result.status_code), "\"\n");
  };
  if constexpr (std::is_base_of_v<
                    ::s3upload::core::ExecutionResult,
                    std::remove_cv_t<std::remove_reference_t<decltype(arg)>>>) {
    if (arg != expected_result) {
      *result_listener << absl::StrCat("\nExpected result to have:\n\t",
                                       execution_result_to_str(expected_result),
                                       "Actual result has:\n\t",
                                       execution_result_to_str(arg));
      return false;
    }
  } else {
    if (arg.result() != expected_result) {
      *result_listener << absl::StrCat("\nExpected result to have:\n\t",
                                       execution_result_to_str(expected_result),
                                       "Actual result has:\n\t",
                                       execution_result_to_str(arg.result()));
      return false;
    }
  }
  return true;
}

// Tuple form for use with Pointwise.
MATCHER(ResultIs, "") {
  const auto& [actual, expected] = arg;
  return ::testing::ExplainMatchResult(ResultIs(expected), actual,
                                       result_listener);
}

MATCHER(IsSuccessful, "") {
  return ::testing::ExplainMatchResult(ResultIs(SuccessExecutionResult()), arg,
                                       result_listener);
}

// EXPECT_THAT(session->BytesWritten(), ...) style check for ExecutionResultOr
// values: EXPECT_THAT(Foo(), IsSuccessfulAndHolds(Eq(5)));
MATCHER_P(IsSuccessfulAndHolds, inner_matcher, "") {
  return ::testing::ExplainMatchResult(IsSuccessful(), arg.result(),
                                       result_listener) &&
         ::testing::ExplainMatchResult(inner_matcher, arg.value(),
                                       result_listener);
}

}  // namespace s3upload::core::test

#endif  // PUBLIC_CORE_TEST_EXECUTION_RESULT_MATCHERS_H_
