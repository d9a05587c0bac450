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


#include "upload_review_gate.h"

#include <utility>

#include "absl/log/check.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/core/interface/errors.h"

using s3upload::core::FailureExecutionResult;
using s3upload::core::common::kZeroUuid;

namespace {
constexpr char kUploadReviewGate[] = "UploadReviewGate";
}  // namespace

namespace s3upload::s3_client {

void UploadReviewGate::Set(UploadReviewCallback callback) {
  absl::MutexLock lock(&mutex_);
  CHECK(!callback_) << "review callback set twice";
  callback_ = std::move(callback);
}

bool UploadReviewGate::Invoke(const v1::UploadReview& review) {
  UploadReviewCallback callback;
  {
    absl::MutexLock lock(&mutex_);
    callback.swap(callback_);
  }
  if (!callback) {
    S3U_ERROR(kUploadReviewGate, kZeroUuid,
              FailureExecutionResult(SC_UNKNOWN),
              "review callback was either never set or invoked twice");
    return false;
  }
  return callback(review);
}

}  // namespace s3upload::s3_client
