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


#ifndef S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_H_
#define S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_H_

#include <memory>
#include <string>

#include <aws/core/client/AsyncCallerContext.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include "src/core/interface/async_context.h"
#include "src/core/interface/async_executor_interface.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/meta_request/s3_operations_interface.h"
#include "src/s3_client/proto/s3_operations.pb.h"
#include "src/s3_client/s3_object_client_options.h"

namespace s3upload::s3_client {
/*! @copydoc S3OperationsInterface
 * Backed by the asynchronous calls of Aws::S3::S3Client. Contexts are
 * finished on callback_executor.
 */
class AwsS3Operations : public S3OperationsInterface {
 public:
  AwsS3Operations(
      std::shared_ptr<Aws::S3::S3Client> s3_client,
      std::shared_ptr<core::AsyncExecutorInterface> callback_executor)
      : s3_client_(std::move(s3_client)),
        callback_executor_(std::move(callback_executor)) {}

  core::ExecutionResult CreateMultipartUpload(
      core::AsyncContext<v1::CreateMultipartUploadRequest,
                         v1::CreateMultipartUploadResponse>&
          create_context) noexcept override;

  core::ExecutionResult UploadPart(
      core::AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
          upload_part_context) noexcept override;

  core::ExecutionResult CompleteMultipartUpload(
      core::AsyncContext<v1::CompleteMultipartUploadRequest,
                         v1::CompleteMultipartUploadResponse>&
          complete_context) noexcept override;

  core::ExecutionResult AbortMultipartUpload(
      core::AsyncContext<v1::AbortMultipartUploadRequest,
                         v1::AbortMultipartUploadResponse>&
          abort_context) noexcept override;

  core::ExecutionResult PutObject(
      core::AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
          put_object_context) noexcept override;

 private:
  /**
   * @brief Is called when the S3 CreateMultipartUpload call is done.
   *
   * @param create_context The create multipart upload context.
   * @param s3_client An instance of the S3 client. Not used.
   * @param request The AWS request.
   * @param outcome The outcome of the async operation.
   * @param async_context The Aws async context. Not used.
   */
  void OnCreateMultipartUploadCallback(
      core::AsyncContext<v1::CreateMultipartUploadRequest,
                         v1::CreateMultipartUploadResponse>& create_context,
      const Aws::S3::S3Client* s3_client,
      const Aws::S3::Model::CreateMultipartUploadRequest& request,
      Aws::S3::Model::CreateMultipartUploadOutcome outcome,
      const std::shared_ptr<const Aws::Client::AsyncCallerContext>
          async_context) noexcept;

  void OnUploadPartCallback(
      core::AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
          upload_part_context,
      const Aws::S3::S3Client* s3_client,
      const Aws::S3::Model::UploadPartRequest& request,
      Aws::S3::Model::UploadPartOutcome outcome,
      const std::shared_ptr<const Aws::Client::AsyncCallerContext>
          async_context) noexcept;

  void OnCompleteMultipartUploadCallback(
      core::AsyncContext<v1::CompleteMultipartUploadRequest,
                         v1::CompleteMultipartUploadResponse>&
          complete_context,
      const Aws::S3::S3Client* s3_client,
      const Aws::S3::Model::CompleteMultipartUploadRequest& request,
      Aws::S3::Model::CompleteMultipartUploadOutcome outcome,
      const std::shared_ptr<const Aws::Client::AsyncCallerContext>
          async_context) noexcept;

  void OnAbortMultipartUploadCallback(
      core::AsyncContext<v1::AbortMultipartUploadRequest,
                         v1::AbortMultipartUploadResponse>& abort_context,
      const Aws::S3::S3Client* s3_client,
      const Aws::S3::Model::AbortMultipartUploadRequest& request,
      Aws::S3::Model::AbortMultipartUploadOutcome outcome,
      const std::shared_ptr<const Aws::Client::AsyncCallerContext>
          async_context) noexcept;

  void OnPutObjectCallback(
      core::AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
          put_object_context,
      const Aws::S3::S3Client* s3_client,
      const Aws::S3::Model::PutObjectRequest& request,
      Aws::S3::Model::PutObjectOutcome outcome,
      const std::shared_ptr<const Aws::Client::AsyncCallerContext>
          async_context) noexcept;

  std::shared_ptr<Aws::S3::S3Client> s3_client_;
  std::shared_ptr<core::AsyncExecutorInterface> callback_executor_;
};

/// Creates Aws::S3::S3Client
class AwsS3ClientFactory {
 public:
  virtual ~AwsS3ClientFactory() = default;

  /**
   * @brief Creates a client for options.region, talking to
   * options.endpoint_url when set. The SDK runs its IO on io_async_executor.
   */
  virtual core::ExecutionResultOr<std::shared_ptr<Aws::S3::S3Client>>
  CreateClient(
      const S3ObjectClientOptions& options,
      std::shared_ptr<core::AsyncExecutorInterface> io_async_executor) noexcept;
};

}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_H_
