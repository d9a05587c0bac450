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


#include "src/s3_client/meta_request/meta_request_client.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "src/core/async_executor/mock/mock_async_executor.h"
#include "src/core/interface/type_def.h"
#include "src/public/core/test_execution_result_matchers.h"
#include "src/s3_client/meta_request/error_codes.h"
#include "src/s3_client/meta_request/mock/in_memory_s3_operations.h"

using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpMethod;
using s3upload::core::kMinimumPartSizeInBytes;
using s3upload::core::async_executor::mock::MockAsyncExecutor;
using s3upload::core::errors::SC_S3_META_REQUEST_INVALID_OPTIONS;
using s3upload::core::test::ResultIs;
using s3upload::s3_client::mock::InMemoryS3Operations;

namespace s3upload::s3_client::test {
namespace {
MetaRequestOptions MakeOptions(S3Operation operation) {
  auto message = S3Message::New(HttpMethod::PUT, "bucket", "key");
  return MetaRequestOptions(*std::move(message), operation);
}
}  // namespace

class MetaRequestClientTest : public testing::Test {
 protected:
  MetaRequestClientTest()
      : store_(std::make_shared<InMemoryS3Operations>(
            std::make_shared<MockAsyncExecutor>())),
        client_(store_) {}

  std::shared_ptr<InMemoryS3Operations> store_;
  MetaRequestClient client_;
};

TEST_F(MetaRequestClientTest, RejectsPartSizeBelowMinimum) {
  auto options = MakeOptions(S3Operation::kPutObject);
  options.part_size = kMinimumPartSizeInBytes - 1;
  EXPECT_THAT(
      client_.MakeMetaRequest(std::move(options)),
      ResultIs(FailureExecutionResult(SC_S3_META_REQUEST_INVALID_OPTIONS)));
  EXPECT_EQ(store_->RequestCount(RequestType::kCreateMultipartUpload), 0);
}

TEST_F(MetaRequestClientTest, RejectsZeroBufferingLimits) {
  auto options = MakeOptions(S3Operation::kPutObject);
  options.max_buffered_parts = 0;
  EXPECT_THAT(
      client_.MakeMetaRequest(std::move(options)),
      ResultIs(FailureExecutionResult(SC_S3_META_REQUEST_INVALID_OPTIONS)));

  options = MakeOptions(S3Operation::kPutObject);
  options.max_concurrent_part_uploads = 0;
  EXPECT_THAT(
      client_.MakeMetaRequest(std::move(options)),
      ResultIs(FailureExecutionResult(SC_S3_META_REQUEST_INVALID_OPTIONS)));
}

TEST_F(MetaRequestClientTest, StartsStreamingUpload) {
  ASSERT_SUCCESS_AND_ASSIGN(
      auto meta_request,
      client_.MakeMetaRequest(MakeOptions(S3Operation::kPutObject)));
  EXPECT_EQ(store_->RequestCount(RequestType::kCreateMultipartUpload), 1);
  EXPECT_EQ(store_->ActiveUploadCount(), 1);
  meta_request->Cancel();
  EXPECT_THAT(meta_request->AwaitCompletion(),
              ResultIs(FailureExecutionResult(
                  core::errors::SC_S3_META_REQUEST_CANCELED)));
  EXPECT_EQ(store_->ActiveUploadCount(), 0);
}

TEST_F(MetaRequestClientTest, SingleRequestUploadIgnoresPartSize) {
  auto options = MakeOptions(S3Operation::kPutObjectSingle);
  options.part_size = 1;
  options.message.SetBody("data");
  ASSERT_SUCCESS_AND_ASSIGN(auto meta_request,
                            client_.MakeMetaRequest(std::move(options)));
  EXPECT_SUCCESS(meta_request->AwaitCompletion());
  EXPECT_EQ(store_->GetObject("bucket", "key"), "data");
}

}  // namespace s3upload::s3_client::test
