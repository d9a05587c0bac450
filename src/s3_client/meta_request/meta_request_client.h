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


#ifndef S3_CLIENT_META_REQUEST_META_REQUEST_CLIENT_H_
#define S3_CLIENT_META_REQUEST_META_REQUEST_CLIENT_H_

#include <memory>

#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/meta_request/s3_operations_interface.h"

namespace s3upload::s3_client {
/*! @copydoc MetaRequestClientInterface
 */
class MetaRequestClient : public MetaRequestClientInterface {
 public:
  explicit MetaRequestClient(
      std::shared_ptr<S3OperationsInterface> s3_operations)
      : s3_operations_(std::move(s3_operations)) {}

  /**
   * @brief Validates the options and starts a PutMetaRequest.
   *
   * @return SC_S3_META_REQUEST_INVALID_OPTIONS when a streaming upload has a
   * part size below the object store minimum or a zero buffering limit.
   */
  core::ExecutionResultOr<std::shared_ptr<MetaRequestInterface>>
  MakeMetaRequest(MetaRequestOptions options) noexcept override;

 private:
  std::shared_ptr<S3OperationsInterface> s3_operations_;
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_META_REQUEST_META_REQUEST_CLIENT_H_
