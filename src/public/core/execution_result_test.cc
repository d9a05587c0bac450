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


#include "src/public/core/interface/execution_result.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/core/interface/async_context.h"
#include "src/core/interface/errors.h"
#include "src/core/logger/mock/mock_log_provider.h"
#include "src/public/core/test_execution_result_matchers.h"

using s3upload::core::common::InitializeLog;
using s3upload::core::common::LogOption;
using s3upload::core::common::internal::log::GetLogger;
using s3upload::core::logger::mock::MockLogProvider;
using testing::AllOf;
using testing::ElementsAre;
using testing::Eq;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::Not;
using testing::Pointee;
using testing::UnorderedPointwise;

namespace s3upload::core::test {
namespace {
// Stands in for an upload step that either fails or hands out a value.
ExecutionResultOr<std::string> FetchUploadId(bool succeed) {
  if (succeed) {
    return std::string("upload-1");
  }
  return FailureExecutionResult(SC_UNKNOWN);
}

struct MoveOnlyPart {
  explicit MoveOnlyPart(std::unique_ptr<int> number)
      : number(std::move(number)) {}
  MoveOnlyPart(MoveOnlyPart&&) = default;
  MoveOnlyPart& operator=(MoveOnlyPart&&) = default;

  std::unique_ptr<int> number;
};
}  // namespace

TEST(ExecutionResultTest, StatusHelpers) {
  EXPECT_TRUE(SuccessExecutionResult().Successful());
  EXPECT_FALSE(FailureExecutionResult(SC_UNKNOWN).Successful());
  EXPECT_FALSE(RetryExecutionResult(SC_UNKNOWN).Successful());
  EXPECT_TRUE(RetryExecutionResult(SC_UNKNOWN).Retryable());
  EXPECT_FALSE(FailureExecutionResult(SC_UNKNOWN).Retryable());
  EXPECT_NE(FailureExecutionResult(SC_UNKNOWN),
            RetryExecutionResult(SC_UNKNOWN));
  // A default result is an unknown failure.
  EXPECT_THAT(ExecutionResult(),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
}

TEST(MacroTest, ReturnIfFailure) {
  auto step = [](ExecutionResult result, int& steps) -> ExecutionResult {
    RETURN_IF_FAILURE(result);
    ++steps;
    return SuccessExecutionResult();
  };

  int steps = 0;
  EXPECT_THAT(step(FailureExecutionResult(SC_UNKNOWN), steps),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_EQ(steps, 0);
  EXPECT_SUCCESS(step(SuccessExecutionResult(), steps));
  EXPECT_EQ(steps, 1);
}

TEST(MacroTest, ReturnIfFailureEvaluatesOnce) {
  int calls = 0;
  auto step = [&calls]() -> ExecutionResult {
    RETURN_IF_FAILURE([&calls]() {
      ++calls;
      return SuccessExecutionResult();
    }());
    return SuccessExecutionResult();
  };
  EXPECT_SUCCESS(step());
  EXPECT_EQ(calls, 1);
}

TEST(MacroTest, AssignOrReturn) {
  auto read = [](bool succeed, std::string& upload_id) -> ExecutionResult {
    ASSIGN_OR_RETURN(upload_id, FetchUploadId(succeed));
    // A second use in the same scope gets its own temporary.
    ASSIGN_OR_RETURN(auto copy, FetchUploadId(succeed));
    upload_id += "/" + copy;
    return SuccessExecutionResult();
  };

  std::string upload_id;
  EXPECT_SUCCESS(read(true, upload_id));
  EXPECT_EQ(upload_id, "upload-1/upload-1");

  upload_id.clear();
  EXPECT_THAT(read(false, upload_id),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_THAT(upload_id, IsEmpty());
}

TEST(MacroTest, AssignOrReturnMovesValue) {
  auto take = [](ExecutionResultOr<MoveOnlyPart> part_or)
      -> ExecutionResultOr<MoveOnlyPart> {
    ASSIGN_OR_RETURN(auto part, std::move(part_or));
    return part;
  };
  auto part = take(MoveOnlyPart(std::make_unique<int>(7)));
  ASSERT_SUCCESS(part);
  EXPECT_THAT(part->number, Pointee(Eq(7)));
}

class MacroLogTest : public testing::Test {
 protected:
  MacroLogTest() {
    InitializeLog(LogOption::kMock);
    logger_ = dynamic_cast<MockLogProvider*>(GetLogger());
    CHECK(logger_);
    logger_->Clear();
  }

  MockLogProvider* logger_;
};

TEST_F(MacroLogTest, ReturnAndLogIfFailure) {
  auto step = [](ExecutionResult result) -> ExecutionResult {
    RETURN_AND_LOG_IF_FAILURE(result, "Uploader", common::kZeroUuid,
                              "part %d failed", 3);
    return SuccessExecutionResult();
  };
  EXPECT_SUCCESS(step(SuccessExecutionResult()));
  EXPECT_THAT(logger_->GetMessages(), IsEmpty());

  EXPECT_THAT(step(FailureExecutionResult(SC_UNKNOWN)),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_THAT(logger_->GetMessages(),
              ElementsAre(AllOf(HasSubstr("Uploader"),
                                HasSubstr("part 3 failed"))));
}

TEST_F(MacroLogTest, ReturnAndLogIfFailureWithContext) {
  AsyncContext<int, int> context;
  auto step = [&context](ExecutionResult result) -> ExecutionResult {
    RETURN_AND_LOG_IF_FAILURE_CONTEXT(result, "Uploader", context,
                                      "upload %s failed", "upload-1");
    return SuccessExecutionResult();
  };
  EXPECT_THAT(step(FailureExecutionResult(SC_UNKNOWN)),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_THAT(logger_->GetMessages(),
              ElementsAre(AllOf(HasSubstr(common::ToString(context.activity_id)),
                                HasSubstr("upload upload-1 failed"))));
}

TEST_F(MacroLogTest, AssignOrLogAndReturn) {
  auto read = [](bool succeed, std::string& upload_id) -> ExecutionResult {
    ASSIGN_OR_LOG_AND_RETURN(upload_id, FetchUploadId(succeed), "Uploader",
                             common::kZeroUuid, "no upload id");
    return SuccessExecutionResult();
  };
  std::string upload_id;
  EXPECT_SUCCESS(read(true, upload_id));
  EXPECT_THAT(logger_->GetMessages(), IsEmpty());

  EXPECT_THAT(read(false, upload_id),
              ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_THAT(logger_->GetMessages(), ElementsAre(HasSubstr("no upload id")));
}

TEST(ExecutionResultTest, Matchers) {
  const ExecutionResult failure = FailureExecutionResult(SC_UNKNOWN);
  EXPECT_THAT(failure, ResultIs(FailureExecutionResult(SC_UNKNOWN)));
  EXPECT_THAT(failure, Not(IsSuccessful()));

  ExecutionResultOr<int> result_or(failure);
  EXPECT_THAT(result_or, ResultIs(failure));
  result_or = 4;
  EXPECT_THAT(result_or, IsSuccessfulAndHolds(Eq(4)));
  ASSERT_SUCCESS_AND_ASSIGN(int value, result_or);
  EXPECT_EQ(value, 4);

  std::vector<ExecutionResult> results = {FailureExecutionResult(1),
                                          RetryExecutionResult(2)};
  std::vector<ExecutionResult> expected = {RetryExecutionResult(2),
                                           FailureExecutionResult(1)};
  EXPECT_THAT(results, UnorderedPointwise(ResultIs(), expected));
}

TEST(ExecutionResultOrTest, HoldsEitherResultOrValue) {
  ExecutionResultOr<std::string> empty;
  EXPECT_FALSE(empty.has_value());
  EXPECT_FALSE(empty.Successful());

  auto upload_id = FetchUploadId(true);
  ASSERT_TRUE(upload_id.has_value());
  EXPECT_EQ(*upload_id, "upload-1");
  EXPECT_THAT(upload_id.result(), IsSuccessful());
  upload_id->append("-a");
  EXPECT_EQ(upload_id.value(), "upload-1-a");

  upload_id = FailureExecutionResult(SC_UNKNOWN);
  EXPECT_FALSE(upload_id.has_value());
  EXPECT_THAT(upload_id, ResultIs(FailureExecutionResult(SC_UNKNOWN)));
}

TEST(ExecutionResultOrTest, ArrowOnFailureCrashes) {
  EXPECT_DEATH(
      {
        ExecutionResultOr<std::string> upload_id = FetchUploadId(false);
        upload_id = std::string(upload_id->empty() ? "a" : "b");
      },
      "failed ExecutionResultOr");
}

TEST(ExecutionResultOrTest, ReleaseLeavesMovedFromValue) {
  ExecutionResultOr<MoveOnlyPart> part_or(
      MoveOnlyPart(std::make_unique<int>(5)));
  MoveOnlyPart part = part_or.release();
  EXPECT_THAT(part.number, Pointee(Eq(5)));
  ASSERT_TRUE(part_or.has_value());
  EXPECT_EQ(part_or->number, nullptr);
}

TEST(ExecutionResultOrTest, RvalueAccessDoesNotMoveByItself) {
  ExecutionResultOr<MoveOnlyPart> part_or(
      MoveOnlyPart(std::make_unique<int>(5)));
  *std::move(part_or);
  std::move(part_or).value();
  EXPECT_THAT(part_or->number, Pointee(Eq(5)));

  MoveOnlyPart part = *std::move(part_or);
  EXPECT_THAT(part.number, Pointee(Eq(5)));
  EXPECT_EQ(part_or->number, nullptr);
}

}  // namespace s3upload::core::test
