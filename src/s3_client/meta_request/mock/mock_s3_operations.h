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


#ifndef S3_CLIENT_META_REQUEST_MOCK_MOCK_S3_OPERATIONS_H_
#define S3_CLIENT_META_REQUEST_MOCK_MOCK_S3_OPERATIONS_H_

#include <gmock/gmock.h>

#include "src/s3_client/meta_request/s3_operations_interface.h"

namespace s3upload::s3_client::mock {
class MockS3Operations : public S3OperationsInterface {
 public:
  MOCK_METHOD(core::ExecutionResult, CreateMultipartUpload,
              ((core::AsyncContext<v1::CreateMultipartUploadRequest,
                                   v1::CreateMultipartUploadResponse>&)),
              (noexcept, override));

  MOCK_METHOD(core::ExecutionResult, UploadPart,
              ((core::AsyncContext<v1::UploadPartRequest,
                                   v1::UploadPartResponse>&)),
              (noexcept, override));

  MOCK_METHOD(core::ExecutionResult, CompleteMultipartUpload,
              ((core::AsyncContext<v1::CompleteMultipartUploadRequest,
                                   v1::CompleteMultipartUploadResponse>&)),
              (noexcept, override));

  MOCK_METHOD(core::ExecutionResult, AbortMultipartUpload,
              ((core::AsyncContext<v1::AbortMultipartUploadRequest,
                                   v1::AbortMultipartUploadResponse>&)),
              (noexcept, override));

  MOCK_METHOD(core::ExecutionResult, PutObject,
              ((core::AsyncContext<v1::PutObjectRequest,
                                   v1::PutObjectResponse>&)),
              (noexcept, override));
};
}  // namespace s3upload::s3_client::mock

#endif  // S3_CLIENT_META_REQUEST_MOCK_MOCK_S3_OPERATIONS_H_
