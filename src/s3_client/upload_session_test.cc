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


#include "src/s3_client/upload_session.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/public/core/test_execution_result_matchers.h"
#include "src/s3_client/error_codes.h"
#include "src/s3_client/meta_request/error_codes.h"
#include "src/s3_client/meta_request/mock/mock_meta_request.h"
#include "src/s3_client/mock/mock_throughput_metric_recorder.h"

using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpHeaders;
using s3upload::core::SuccessExecutionResult;
using s3upload::core::common::InitializeLog;
using s3upload::core::common::LogOption;
using s3upload::core::errors::SC_S3_CLIENT_MISSING_RESPONSE_HEADERS;
using s3upload::core::errors::SC_S3_CLIENT_REQUEST_CANCELED;
using s3upload::core::errors::SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED;
using s3upload::core::errors::SC_S3_OPERATIONS_ACCESS_DENIED;
using s3upload::core::errors::SC_S3_OPERATIONS_RETRIABLE_ERROR;
using s3upload::core::test::ResultIs;
using s3upload::s3_client::mock::MockMetaRequest;
using s3upload::s3_client::mock::MockThroughputMetricRecorder;
using testing::_;
using testing::Eq;
using testing::InSequence;
using testing::Return;

namespace s3upload::s3_client::test {

class UploadSessionTest : public testing::Test {
 protected:
  static void SetUpTestSuite() { InitializeLog(LogOption::kNoLog); }

  UploadSessionTest()
      : meta_request_(std::make_shared<MockMetaRequest>()),
        signals_(std::make_shared<UploadSignals>()),
        metric_recorder_(std::make_shared<MockThroughputMetricRecorder>()) {
    // Sessions left incomplete by a test cancel on destruction.
    ON_CALL(*meta_request_, Cancel).WillByDefault(Return());
    EXPECT_CALL(*meta_request_, Cancel).Times(testing::AnyNumber());
  }

  std::unique_ptr<UploadSession> NewSession() {
    return std::make_unique<UploadSession>(meta_request_, signals_,
                                           metric_recorder_);
  }

  /// Makes the final write deliver headers the way a meta request does.
  void CompleteWithHeaders(HttpHeaders headers) {
    EXPECT_CALL(*meta_request_, Write(_, true))
        .WillOnce([this, headers](std::string_view, bool) {
          signals_->response_headers.Set(headers);
          return ExecutionResultOr<std::string_view>(std::string_view());
        });
    EXPECT_CALL(*meta_request_, AwaitCompletion)
        .WillOnce(Return(SuccessExecutionResult()));
  }

  std::shared_ptr<MockMetaRequest> meta_request_;
  std::shared_ptr<UploadSignals> signals_;
  std::shared_ptr<MockThroughputMetricRecorder> metric_recorder_;
};

TEST_F(UploadSessionTest, CountsBytesAcceptedAcrossPartialWrites) {
  signals_->readiness.Set(SuccessExecutionResult());
  {
    InSequence sequence;
    // The transport takes three bytes, then the rest.
    EXPECT_CALL(*meta_request_, Write(Eq("0123456789"), false))
        .WillOnce([](std::string_view data, bool) {
          return ExecutionResultOr<std::string_view>(data.substr(3));
        });
    EXPECT_CALL(*meta_request_, Write(Eq("3456789"), false))
        .WillOnce(Return(ExecutionResultOr<std::string_view>(
            std::string_view())));
  }

  auto session = NewSession();
  EXPECT_SUCCESS(session->Write("0123456789"));
  EXPECT_EQ(session->BytesWritten(), 10);
}

TEST_F(UploadSessionTest, EmptyWriteDoesNotReachTransport) {
  signals_->readiness.Set(SuccessExecutionResult());
  EXPECT_CALL(*meta_request_, Write(_, false)).Times(0);

  auto session = NewSession();
  EXPECT_SUCCESS(session->Write(""));
  EXPECT_SUCCESS(session->Write(""));
  EXPECT_EQ(session->BytesWritten(), 0);
}

TEST_F(UploadSessionTest, FirstWriteWaitsForReadiness) {
  EXPECT_CALL(*meta_request_, Write(Eq("data"), false))
      .WillOnce(
          Return(ExecutionResultOr<std::string_view>(std::string_view())));

  auto session = NewSession();
  absl::Notification write_done;
  std::thread writer([&] {
    EXPECT_SUCCESS(session->Write("data"));
    write_done.Notify();
  });

  EXPECT_FALSE(write_done.WaitForNotificationWithTimeout(
      absl::Milliseconds(50)));
  signals_->readiness.Set(SuccessExecutionResult());
  writer.join();
  EXPECT_EQ(session->BytesWritten(), 4);
}

TEST_F(UploadSessionTest, FirstWriteReturnsCreationFailure) {
  const auto failure = FailureExecutionResult(SC_S3_OPERATIONS_ACCESS_DENIED);
  signals_->readiness.Set(failure);
  EXPECT_CALL(*meta_request_, Write).Times(0);

  auto session = NewSession();
  EXPECT_THAT(session->Write("data"), ResultIs(failure));
  // The session stays unusable.
  EXPECT_THAT(
      session->Write("data"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
}

TEST_F(UploadSessionTest, FailedWritePoisonsSession) {
  signals_->readiness.Set(SuccessExecutionResult());
  const auto failure =
      FailureExecutionResult(SC_S3_OPERATIONS_RETRIABLE_ERROR);
  EXPECT_CALL(*meta_request_, Write(_, false))
      .WillOnce(Return(ExecutionResultOr<std::string_view>(failure)));

  auto session = NewSession();
  EXPECT_THAT(session->Write("data"), ResultIs(failure));
  EXPECT_THAT(
      session->Write("more"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
  EXPECT_THAT(
      session->Complete().result(),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
}

TEST_F(UploadSessionTest, OverlappingCallsAreRejected) {
  signals_->readiness.Set(SuccessExecutionResult());
  absl::Notification entered;
  absl::Notification release;
  EXPECT_CALL(*meta_request_, Write(Eq("slow"), false))
      .WillOnce([&](std::string_view, bool) {
        entered.Notify();
        release.WaitForNotification();
        return ExecutionResultOr<std::string_view>(std::string_view());
      });

  auto session = NewSession();
  std::thread writer([&] { EXPECT_SUCCESS(session->Write("slow")); });
  entered.WaitForNotification();

  EXPECT_THAT(
      session->Write("fast"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
  EXPECT_THAT(
      session->Complete().result(),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));

  release.Notify();
  writer.join();
  EXPECT_EQ(session->BytesWritten(), 4);
}

TEST_F(UploadSessionTest, CompleteRecordsThroughputAndReturnsResult) {
  signals_->readiness.Set(SuccessExecutionResult());
  EXPECT_CALL(*meta_request_, Write(_, false))
      .WillOnce(
          Return(ExecutionResultOr<std::string_view>(std::string_view())));
  CompleteWithHeaders({{"ETag", "\"abc\""},
                       {"x-amz-server-side-encryption", "aws:kms"},
                       {"x-amz-server-side-encryption-aws-kms-key-id", "k1"}});
  EXPECT_CALL(*metric_recorder_,
              RecordThroughput(Eq(kPutObjectOperation), 5, _));
  EXPECT_CALL(*meta_request_, Cancel).Times(0);

  auto session = NewSession();
  ASSERT_SUCCESS(session->Write("hello"));
  auto result = session->Complete();
  ASSERT_SUCCESS(result);
  EXPECT_EQ(result->etag(), "\"abc\"");
  EXPECT_EQ(result->sse_type(), "aws:kms");
  EXPECT_EQ(result->sse_kms_key_id(), "k1");
}

TEST_F(UploadSessionTest, CompleteWithoutWritesUploadsEmptyObject) {
  CompleteWithHeaders({{"ETag", "\"empty\""}});
  EXPECT_CALL(*metric_recorder_,
              RecordThroughput(Eq(kPutObjectOperation), 0, _));

  auto session = NewSession();
  auto result = session->Complete();
  ASSERT_SUCCESS(result);
  EXPECT_EQ(result->etag(), "\"empty\"");
}

TEST_F(UploadSessionTest, CompleteTwiceIsRejected) {
  CompleteWithHeaders({{"ETag", "\"abc\""}});
  EXPECT_CALL(*metric_recorder_, RecordThroughput);

  auto session = NewSession();
  ASSERT_SUCCESS(session->Complete());
  EXPECT_THAT(
      session->Complete().result(),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
  EXPECT_THAT(
      session->Write("late"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)));
}

TEST_F(UploadSessionTest, ReviewCallbackIsBoundBeforeFinalWrite) {
  int review_calls = 0;
  EXPECT_CALL(*meta_request_, Write(_, true))
      .WillOnce([this](std::string_view, bool) {
        v1::UploadReview review;
        review.add_parts()->set_size(3);
        // The meta request consults the gate once all parts are uploaded.
        EXPECT_FALSE(signals_->review_gate.Invoke(review));
        return ExecutionResultOr<std::string_view>(std::string_view());
      });
  const auto rejected =
      FailureExecutionResult(SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED);
  EXPECT_CALL(*meta_request_, AwaitCompletion).WillOnce(Return(rejected));
  EXPECT_CALL(*metric_recorder_, RecordThroughput).Times(0);

  auto session = NewSession();
  auto result =
      session->ReviewAndComplete([&](const v1::UploadReview& review) {
        ++review_calls;
        EXPECT_EQ(review.parts_size(), 1);
        return false;
      });
  EXPECT_THAT(result.result(), ResultIs(rejected));
  EXPECT_EQ(review_calls, 1);
}

TEST_F(UploadSessionTest, RejectedFinalWriteReturnsUploadFailure) {
  const auto failure = FailureExecutionResult(SC_S3_OPERATIONS_ACCESS_DENIED);
  EXPECT_CALL(*meta_request_, Write(_, true))
      .WillOnce(Return(ExecutionResultOr<std::string_view>(
          FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED))));
  EXPECT_CALL(*meta_request_, AwaitCompletion).WillOnce(Return(failure));

  auto session = NewSession();
  EXPECT_THAT(session->Complete().result(), ResultIs(failure));
}

TEST_F(UploadSessionTest, MissingResponseHeadersFail) {
  EXPECT_CALL(*meta_request_, Write(_, true))
      .WillOnce(
          Return(ExecutionResultOr<std::string_view>(std::string_view())));
  EXPECT_CALL(*meta_request_, AwaitCompletion)
      .WillOnce(Return(SuccessExecutionResult()));
  EXPECT_CALL(*metric_recorder_, RecordThroughput);

  auto session = NewSession();
  EXPECT_THAT(session->Complete().result(),
              ResultIs(FailureExecutionResult(
                  SC_S3_CLIENT_MISSING_RESPONSE_HEADERS)));
}

TEST_F(UploadSessionTest, DestroyingIncompleteSessionCancels) {
  signals_->readiness.Set(SuccessExecutionResult());
  EXPECT_CALL(*meta_request_, Write(_, false))
      .WillOnce(
          Return(ExecutionResultOr<std::string_view>(std::string_view())));
  EXPECT_CALL(*meta_request_, Cancel).Times(1);

  auto session = NewSession();
  EXPECT_SUCCESS(session->Write("abc"));
  session.reset();
}

}  // namespace s3upload::s3_client::test
