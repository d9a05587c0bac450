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


#ifndef S3_CLIENT_META_REQUEST_MOCK_MOCK_META_REQUEST_H_
#define S3_CLIENT_META_REQUEST_MOCK_MOCK_META_REQUEST_H_

#include <gmock/gmock.h>

#include <memory>
#include <string_view>

#include "src/s3_client/meta_request/meta_request_interface.h"

namespace s3upload::s3_client::mock {
class MockMetaRequest : public MetaRequestInterface {
 public:
  MOCK_METHOD(core::ExecutionResultOr<std::string_view>, Write,
              (std::string_view data, bool is_final), (noexcept, override));

  MOCK_METHOD(core::ExecutionResult, AwaitCompletion, (),
              (noexcept, override));

  MOCK_METHOD(void, Cancel, (), (noexcept, override));
};

class MockMetaRequestClient : public MetaRequestClientInterface {
 public:
  MOCK_METHOD(core::ExecutionResultOr<std::shared_ptr<MetaRequestInterface>>,
              MakeMetaRequest, (MetaRequestOptions options),
              (noexcept, override));
};
}  // namespace s3upload::s3_client::mock

#endif  // S3_CLIENT_META_REQUEST_MOCK_MOCK_META_REQUEST_H_
