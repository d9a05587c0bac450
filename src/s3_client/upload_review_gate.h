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


#ifndef S3_CLIENT_UPLOAD_REVIEW_GATE_H_
#define S3_CLIENT_UPLOAD_REVIEW_GATE_H_

#include "absl/synchronization/mutex.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/proto/s3_client.pb.h"

namespace s3upload::s3_client {
/**
 * @brief Holds the review callback of one upload. The meta request is given
 * a callback forwarding to Invoke() when it starts; the caller binds the
 * real callback with Set() when it completes the upload.
 */
class UploadReviewGate {
 public:
  UploadReviewGate() = default;
  UploadReviewGate(const UploadReviewGate&) = delete;
  UploadReviewGate& operator=(const UploadReviewGate&) = delete;

  /// Binds the callback. Binding twice is a programming error and crashes.
  void Set(UploadReviewCallback callback);

  /**
   * @brief Takes the bound callback and returns its verdict. Returns false,
   * logging an error, when no callback is bound or it was already taken.
   */
  bool Invoke(const v1::UploadReview& review);

 private:
  absl::Mutex mutex_;
  UploadReviewCallback callback_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_UPLOAD_REVIEW_GATE_H_
