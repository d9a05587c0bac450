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


#include "src/s3_client/upload_error.h"

#include <gtest/gtest.h>

#include "src/core/async_executor/error_codes.h"
#include "src/s3_client/error_codes.h"
#include "src/s3_client/meta_request/error_codes.h"

using s3upload::core::FailureExecutionResult;
using s3upload::core::SuccessExecutionResult;

namespace s3upload::s3_client::test {

TEST(UploadErrorTest, ClassifiesResults) {
  using namespace core::errors;  // NOLINT
  EXPECT_EQ(ClassifyUploadError(SuccessExecutionResult()),
            UploadErrorKind::kNone);
  EXPECT_EQ(ClassifyUploadError(
                FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_NAME)),
            UploadErrorKind::kConstructionFailure);
  EXPECT_EQ(ClassifyUploadError(
                FailureExecutionResult(SC_S3_CLIENT_INVALID_BUCKET_NAME)),
            UploadErrorKind::kConstructionFailure);
  EXPECT_EQ(ClassifyUploadError(
                FailureExecutionResult(SC_S3_CLIENT_REQUEST_CANCELED)),
            UploadErrorKind::kRequestCanceled);
  EXPECT_EQ(
      ClassifyUploadError(FailureExecutionResult(SC_S3_CLIENT_MISSING_ETAG)),
      UploadErrorKind::kInternalError);
  EXPECT_EQ(ClassifyUploadError(FailureExecutionResult(
                SC_S3_META_REQUEST_UPLOAD_REVIEW_REJECTED)),
            UploadErrorKind::kTransportFailure);
  EXPECT_EQ(ClassifyUploadError(
                FailureExecutionResult(SC_S3_OPERATIONS_ACCESS_DENIED)),
            UploadErrorKind::kTransportFailure);
  EXPECT_EQ(ClassifyUploadError(
                FailureExecutionResult(SC_ASYNC_EXECUTOR_EXCEEDING_QUEUE_CAP)),
            UploadErrorKind::kTransportFailure);
}

}  // namespace s3upload::s3_client::test
