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


#ifndef S3_CLIENT_S3_OBJECT_CLIENT_INTERFACE_H_
#define S3_CLIENT_S3_OBJECT_CLIENT_INTERFACE_H_

#include <memory>
#include <string>
#include <string_view>

#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/proto/s3_client.pb.h"
#include "src/s3_client/upload_session.h"

namespace s3upload::s3_client {
/**
 * @brief Uploads objects to an S3 compatible object store.
 */
class S3ObjectClientInterface {
 public:
  virtual ~S3ObjectClientInterface() = default;

  /**
   * @brief Starts a streaming upload of bucket/key. The object becomes
   * visible once the returned session is completed.
   *
   * @return a failure with an SC_S3_CLIENT code when the request cannot be
   * built, or the failure of the transport when it refuses the upload.
   */
  virtual core::ExecutionResultOr<std::unique_ptr<UploadSession>> PutObject(
      std::string bucket, std::string key,
      const v1::PutObjectParams& params) noexcept = 0;

  /**
   * @brief Uploads contents as bucket/key with a single request, blocking
   * until the object store answers.
   */
  virtual core::ExecutionResultOr<v1::PutObjectResult> PutObjectSingle(
      std::string bucket, std::string key,
      const v1::PutObjectSingleParams& params,
      std::string_view contents) noexcept = 0;
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_S3_OBJECT_CLIENT_INTERFACE_H_
