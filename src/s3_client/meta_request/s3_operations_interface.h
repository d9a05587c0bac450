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


#ifndef S3_CLIENT_META_REQUEST_S3_OPERATIONS_INTERFACE_H_
#define S3_CLIENT_META_REQUEST_S3_OPERATIONS_INTERFACE_H_

#include "src/core/interface/async_context.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/proto/s3_operations.pb.h"

namespace s3upload::s3_client {
/**
 * @brief Individual object store requests. Each call returns once the
 * request is issued; the context is finished when the response arrives. A
 * failed return means the context will not be finished.
 */
class S3OperationsInterface {
 public:
  virtual ~S3OperationsInterface() = default;

  virtual core::ExecutionResult CreateMultipartUpload(
      core::AsyncContext<v1::CreateMultipartUploadRequest,
                         v1::CreateMultipartUploadResponse>&
          context) noexcept = 0;

  virtual core::ExecutionResult UploadPart(
      core::AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
          context) noexcept = 0;

  virtual core::ExecutionResult CompleteMultipartUpload(
      core::AsyncContext<v1::CompleteMultipartUploadRequest,
                         v1::CompleteMultipartUploadResponse>&
          context) noexcept = 0;

  virtual core::ExecutionResult AbortMultipartUpload(
      core::AsyncContext<v1::AbortMultipartUploadRequest,
                         v1::AbortMultipartUploadResponse>&
          context) noexcept = 0;

  virtual core::ExecutionResult PutObject(
      core::AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
          context) noexcept = 0;
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_S3_OPERATIONS_INTERFACE_H_
