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


#ifndef S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_UTILS_H_
#define S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_UTILS_H_

#include <aws/s3/S3Errors.h>
#include <aws/s3/model/ServerSideEncryption.h>

#include "google/protobuf/repeated_ptr_field.h"
#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/proto/s3_client.pb.h"

namespace s3upload::s3_client {
/**
 * @brief Converts between AWS SDK types and the types of the upload
 * pipeline.
 */
class AwsS3OperationsUtils {
 public:
  /**
   * @brief Converts an S3 error to an ExecutionResult with an
   * SC_S3_OPERATIONS code. Errors the SDK considers retriable become
   * RetryExecutionResult.
   */
  static core::ExecutionResult ConvertS3ErrorToExecutionResult(
      const Aws::Client::AWSError<Aws::S3::S3Errors>& s3_error) noexcept;

  /**
   * @brief Appends the headers a completed upload reports: ETag and the
   * server side encryption settings when present.
   */
  static void AppendResultHeaders(
      const Aws::String& etag,
      Aws::S3::Model::ServerSideEncryption server_side_encryption,
      const Aws::String& ssekms_key_id,
      google::protobuf::RepeatedPtrField<v1::Header>& headers) noexcept;
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_AWS_AWS_S3_OPERATIONS_UTILS_H_
