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


#ifndef S3_CLIENT_S3_OBJECT_CLIENT_H_
#define S3_CLIENT_S3_OBJECT_CLIENT_H_

#include <memory>
#include <string>
#include <string_view>

#include "src/public/core/interface/execution_result.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/s3_object_client_interface.h"
#include "src/s3_client/s3_object_client_options.h"
#include "src/s3_client/throughput_metric.h"

namespace s3upload::s3_client {
/*! @copydoc S3ObjectClientInterface
 */
class S3ObjectClient : public S3ObjectClientInterface {
 public:
  S3ObjectClient(
      std::shared_ptr<MetaRequestClientInterface> meta_request_client,
      S3ObjectClientOptions options,
      std::shared_ptr<ThroughputMetricRecorderInterface> metric_recorder)
      : meta_request_client_(std::move(meta_request_client)),
        options_(std::move(options)),
        metric_recorder_(std::move(metric_recorder)) {}

  core::ExecutionResultOr<std::unique_ptr<UploadSession>> PutObject(
      std::string bucket, std::string key,
      const v1::PutObjectParams& params) noexcept override;

  core::ExecutionResultOr<v1::PutObjectResult> PutObjectSingle(
      std::string bucket, std::string key,
      const v1::PutObjectSingleParams& params,
      std::string_view contents) noexcept override;

 private:
  std::shared_ptr<MetaRequestClientInterface> meta_request_client_;
  S3ObjectClientOptions options_;
  std::shared_ptr<ThroughputMetricRecorderInterface> metric_recorder_;
};
}  // namespace s3upload::s3_client

#endif  // S3_CLIENT_S3_OBJECT_CLIENT_H_
