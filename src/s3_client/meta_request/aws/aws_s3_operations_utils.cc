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


#include "aws_s3_operations_utils.h"

#include <string>

#include "src/s3_client/meta_request/error_codes.h"
#include "src/s3_client/put_object_result.h"
#include "src/s3_client/put_request_builder.h"

using Aws::S3::S3Errors;
using Aws::S3::Model::ServerSideEncryption;
using Aws::S3::Model::ServerSideEncryptionMapper::
    GetNameForServerSideEncryption;
using s3upload::core::ExecutionResult;
using s3upload::core::FailureExecutionResult;
using s3upload::core::RetryExecutionResult;
using s3upload::core::errors::SC_S3_OPERATIONS_ACCESS_DENIED;
using s3upload::core::errors::SC_S3_OPERATIONS_BAD_REQUEST;
using s3upload::core::errors::SC_S3_OPERATIONS_NOT_FOUND;
using s3upload::core::errors::SC_S3_OPERATIONS_RETRIABLE_ERROR;
using s3upload::core::errors::SC_S3_OPERATIONS_UNRETRIABLE_ERROR;

namespace {
void AppendHeader(std::string_view name, const Aws::String& value,
                  google::protobuf::RepeatedPtrField<
                      s3upload::s3_client::v1::Header>& headers) {
  auto* header = headers.Add();
  header->set_name(std::string(name));
  header->set_value(value.c_str(), value.size());
}
}  // namespace

namespace s3upload::s3_client {

ExecutionResult AwsS3OperationsUtils::ConvertS3ErrorToExecutionResult(
    const Aws::Client::AWSError<S3Errors>& s3_error) noexcept {
  switch (s3_error.GetErrorType()) {
    case S3Errors::NO_SUCH_BUCKET:
      [[fallthrough]];
    case S3Errors::NO_SUCH_KEY:
      [[fallthrough]];
    case S3Errors::NO_SUCH_UPLOAD:
      return FailureExecutionResult(SC_S3_OPERATIONS_NOT_FOUND);
    case S3Errors::ACCESS_DENIED:
      [[fallthrough]];
    case S3Errors::INVALID_ACCESS_KEY_ID:
      [[fallthrough]];
    case S3Errors::SIGNATURE_DOES_NOT_MATCH:
      return FailureExecutionResult(SC_S3_OPERATIONS_ACCESS_DENIED);
    case S3Errors::INVALID_PARAMETER_VALUE:
      [[fallthrough]];
    case S3Errors::INVALID_PARAMETER_COMBINATION:
      [[fallthrough]];
    case S3Errors::MISSING_PARAMETER:
      return FailureExecutionResult(SC_S3_OPERATIONS_BAD_REQUEST);
    case S3Errors::INTERNAL_FAILURE:
      [[fallthrough]];
    case S3Errors::SERVICE_UNAVAILABLE:
      [[fallthrough]];
    case S3Errors::THROTTLING:
      [[fallthrough]];
    case S3Errors::SLOW_DOWN:
      [[fallthrough]];
    case S3Errors::REQUEST_TIMEOUT:
      [[fallthrough]];
    case S3Errors::NETWORK_CONNECTION:
      return RetryExecutionResult(SC_S3_OPERATIONS_RETRIABLE_ERROR);
    default:
      if (s3_error.ShouldRetry()) {
        return RetryExecutionResult(SC_S3_OPERATIONS_RETRIABLE_ERROR);
      }
      return FailureExecutionResult(SC_S3_OPERATIONS_UNRETRIABLE_ERROR);
  }
}

void AwsS3OperationsUtils::AppendResultHeaders(
    const Aws::String& etag, ServerSideEncryption server_side_encryption,
    const Aws::String& ssekms_key_id,
    google::protobuf::RepeatedPtrField<v1::Header>& headers) noexcept {
  if (!etag.empty()) {
    AppendHeader(kEtagHeader, etag, headers);
  }
  if (server_side_encryption != ServerSideEncryption::NOT_SET) {
    AppendHeader(kSseTypeHeader,
                 GetNameForServerSideEncryption(server_side_encryption),
                 headers);
  }
  if (!ssekms_key_id.empty()) {
    AppendHeader(kSseKeyIdHeader, ssekms_key_id, headers);
  }
}

}  // namespace s3upload::s3_client
