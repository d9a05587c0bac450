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


#include "meta_request_client.h"

#include <memory>
#include <utility>

#include "src/core/common/global_logger/global_logger.h"
#include "src/core/interface/type_def.h"
#include "src/s3_client/meta_request/error_codes.h"
#include "src/s3_client/meta_request/put_meta_request.h"

using s3upload::core::ExecutionResultOr;
using s3upload::core::FailureExecutionResult;
using s3upload::core::kMinimumPartSizeInBytes;
using s3upload::core::common::kZeroUuid;
using s3upload::core::errors::SC_S3_META_REQUEST_INVALID_OPTIONS;

namespace {
constexpr char kMetaRequestClient[] = "MetaRequestClient";
}  // namespace

namespace s3upload::s3_client {

ExecutionResultOr<std::shared_ptr<MetaRequestInterface>>
MetaRequestClient::MakeMetaRequest(MetaRequestOptions options) noexcept {
  if (options.operation == S3Operation::kPutObject &&
      (options.part_size < kMinimumPartSizeInBytes ||
       options.max_buffered_parts == 0 ||
       options.max_concurrent_part_uploads == 0)) {
    auto result = FailureExecutionResult(SC_S3_META_REQUEST_INVALID_OPTIONS);
    S3U_ERROR(kMetaRequestClient, kZeroUuid, result,
              "Invalid meta request options. part_size: %zu, "
              "max_buffered_parts: %zu, max_concurrent_part_uploads: %zu",
              options.part_size, options.max_buffered_parts,
              options.max_concurrent_part_uploads);
    return result;
  }

  auto meta_request =
      std::make_shared<PutMetaRequest>(std::move(options), s3_operations_);
  RETURN_IF_FAILURE(meta_request->Start());
  return std::shared_ptr<MetaRequestInterface>(std::move(meta_request));
}

}  // namespace s3upload::s3_client
