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


#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <istream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <aws/core/Aws.h>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "src/core/async_executor/async_executor.h"
#include "src/core/common/global_logger/global_logger.h"
#include "src/core/config_provider/env_config_provider.h"
#include "src/core/interface/errors.h"
#include "src/core/interface/type_def.h"
#include "src/s3_client/meta_request/aws/aws_s3_operations.h"
#include "src/s3_client/meta_request/meta_request_client.h"
#include "src/s3_client/s3_object_client.h"
#include "src/s3_client/s3_object_client_options.h"
#include "src/s3_client/throughput_metric.h"

ABSL_FLAG(std::string, bucket, "", "Destination bucket.");
ABSL_FLAG(std::string, key, "", "Destination object key.");
ABSL_FLAG(std::string, file, "-",
          "File to upload. `-` reads standard input.");
ABSL_FLAG(bool, single, false,
          "Upload with one PutObject request instead of a multipart upload.");
ABSL_FLAG(std::string, trailing_checksums, "disabled",
          "One of `disabled`, `enabled` or `review_only`.");
ABSL_FLAG(std::string, storage_class, "", "Optional x-amz-storage-class.");
ABSL_FLAG(std::string, server_side_encryption, "",
          "Optional x-amz-server-side-encryption, e.g. `aws:kms`.");
ABSL_FLAG(std::string, ssekms_key_id, "", "Optional KMS key id.");
ABSL_FLAG(std::vector<std::string>, metadata, std::vector<std::string>({}),
          "Object metadata as `name=value` pairs.");
ABSL_FLAG(size_t, chunk_size, 1 << 20, "Bytes handed to each Write call.");
ABSL_FLAG(size_t, part_size, 0,
          "Overrides the s3upload_write_part_size environment variable when "
          "non-zero.");
ABSL_FLAG(std::string, region, "",
          "Overrides the s3upload_region environment variable.");
ABSL_FLAG(std::string, endpoint_url, "",
          "Overrides the s3upload_endpoint_url environment variable.");

namespace {
using s3upload::core::AsyncExecutor;
using s3upload::core::EnvConfigProvider;
using s3upload::core::ExecutionResult;
using s3upload::core::ExecutionResultOr;
using s3upload::core::common::InitializeLog;
using s3upload::core::common::LogOption;
using s3upload::core::errors::GetErrorMessage;
using s3upload::s3_client::AwsS3ClientFactory;
using s3upload::s3_client::AwsS3Operations;
using s3upload::s3_client::LoadS3ObjectClientOptions;
using s3upload::s3_client::LogThroughputMetricRecorder;
using s3upload::s3_client::MetaRequestClient;
using s3upload::s3_client::S3ObjectClient;
using s3upload::s3_client::S3ObjectClientOptions;
using s3upload::s3_client::v1::PutObjectParams;
using s3upload::s3_client::v1::PutObjectResult;
using s3upload::s3_client::v1::PutObjectSingleParams;
using s3upload::s3_client::v1::PutObjectTrailingChecksums;

constexpr std::string_view kUsageMessage =
    "Uploads a file to an S3 compatible object store.\n"
    "Usage: s3upload_put_object --bucket=<bucket> --key=<key> "
    "[--file=<path>]";

int Fail(std::string_view what, const ExecutionResult& result) {
  std::cerr << what << ": " << GetErrorMessage(result.status_code)
            << std::endl;
  return EXIT_FAILURE;
}

bool ParseTrailingChecksums(std::string_view value,
                            PutObjectTrailingChecksums& out) {
  if (value == "disabled") {
    out = s3upload::s3_client::v1::PUT_OBJECT_TRAILING_CHECKSUMS_DISABLED;
  } else if (value == "enabled") {
    out = s3upload::s3_client::v1::PUT_OBJECT_TRAILING_CHECKSUMS_ENABLED;
  } else if (value == "review_only") {
    out = s3upload::s3_client::v1::PUT_OBJECT_TRAILING_CHECKSUMS_REVIEW_ONLY;
  } else {
    return false;
  }
  return true;
}

// Fills the fields shared by PutObjectParams and PutObjectSingleParams.
template <typename Params>
bool FillCommonParams(Params& params) {
  if (const std::string value = absl::GetFlag(FLAGS_storage_class);
      !value.empty()) {
    params.set_storage_class(value);
  }
  if (const std::string value = absl::GetFlag(FLAGS_server_side_encryption);
      !value.empty()) {
    params.set_server_side_encryption(value);
  }
  if (const std::string value = absl::GetFlag(FLAGS_ssekms_key_id);
      !value.empty()) {
    params.set_ssekms_key_id(value);
  }
  for (const std::string& entry : absl::GetFlag(FLAGS_metadata)) {
    std::vector<std::string> name_value =
        absl::StrSplit(entry, absl::MaxSplits('=', 1));
    if (name_value.size() != 2 || name_value[0].empty()) {
      std::cerr << "Metadata entry [" << entry
                << "] is not formatted as name=value" << std::endl;
      return false;
    }
    (*params.mutable_object_metadata())[name_value[0]] = name_value[1];
  }
  return true;
}

int Upload(S3ObjectClient& client, std::istream& input) {
  const std::string bucket = absl::GetFlag(FLAGS_bucket);
  const std::string key = absl::GetFlag(FLAGS_key);

  if (absl::GetFlag(FLAGS_single)) {
    PutObjectSingleParams params;
    if (!FillCommonParams(params)) {
      return EXIT_FAILURE;
    }
    const std::string contents(std::istreambuf_iterator<char>(input), {});
    auto result = client.PutObjectSingle(bucket, key, params, contents);
    if (!result.Successful()) {
      return Fail("Upload failed", result.result());
    }
    std::cout << "ETag: " << result->etag() << std::endl;
    return EXIT_SUCCESS;
  }

  PutObjectParams params;
  PutObjectTrailingChecksums trailing_checksums;
  if (!ParseTrailingChecksums(absl::GetFlag(FLAGS_trailing_checksums),
                              trailing_checksums)) {
    std::cerr << "Unknown --trailing_checksums value" << std::endl;
    return EXIT_FAILURE;
  }
  params.set_trailing_checksums(trailing_checksums);
  if (!FillCommonParams(params)) {
    return EXIT_FAILURE;
  }

  auto session_or = client.PutObject(bucket, key, params);
  if (!session_or.Successful()) {
    return Fail("Cannot start the upload", session_or.result());
  }
  auto session = std::move(*session_or);

  std::string chunk(std::max<size_t>(absl::GetFlag(FLAGS_chunk_size), 1),
                    '\0');
  while (input) {
    input.read(chunk.data(), chunk.size());
    const std::streamsize read = input.gcount();
    if (read <= 0) {
      break;
    }
    if (ExecutionResult result =
            session->Write(std::string_view(chunk.data(), read));
        !result.Successful()) {
      return Fail("Write failed", result);
    }
  }

  ExecutionResultOr<PutObjectResult> result = session->Complete();
  if (!result.Successful()) {
    return Fail("Upload failed", result.result());
  }
  std::cout << "ETag: " << result->etag() << "\n"
            << "Bytes: " << session->BytesWritten() << std::endl;
  return EXIT_SUCCESS;
}

int Run() {
  S3ObjectClientOptions options;
  EnvConfigProvider config_provider;
  if (ExecutionResult result =
          LoadS3ObjectClientOptions(config_provider, options);
      !result.Successful()) {
    return Fail("Invalid configuration", result);
  }
  if (const size_t part_size = absl::GetFlag(FLAGS_part_size);
      part_size != 0) {
    if (part_size < s3upload::core::kMinimumPartSizeInBytes) {
      std::cerr << "--part_size must be at least "
                << s3upload::core::kMinimumPartSizeInBytes << " bytes"
                << std::endl;
      return EXIT_FAILURE;
    }
    options.write_part_size = part_size;
  }
  if (std::string region = absl::GetFlag(FLAGS_region); !region.empty()) {
    options.region = std::move(region);
  }
  if (std::string endpoint_url = absl::GetFlag(FLAGS_endpoint_url);
      !endpoint_url.empty()) {
    options.endpoint_url = std::move(endpoint_url);
  }

  auto io_executor = std::make_shared<AsyncExecutor>(
      options.executor_thread_count, options.executor_queue_cap);
  auto callback_executor = std::make_shared<AsyncExecutor>(
      options.executor_thread_count, options.executor_queue_cap);
  auto s3_client_or = AwsS3ClientFactory().CreateClient(options, io_executor);
  if (!s3_client_or.Successful()) {
    return Fail("Cannot create the S3 client", s3_client_or.result());
  }
  auto s3_operations = std::make_shared<AwsS3Operations>(
      std::move(*s3_client_or), callback_executor);
  S3ObjectClient client(std::make_shared<MetaRequestClient>(s3_operations),
                        options,
                        std::make_shared<LogThroughputMetricRecorder>());

  const std::string file = absl::GetFlag(FLAGS_file);
  if (file == "-") {
    return Upload(client, std::cin);
  }
  std::ifstream input(file, std::ios::binary);
  if (!input) {
    std::cerr << "Cannot open [" << file << "]" << std::endl;
    return EXIT_FAILURE;
  }
  return Upload(client, input);
}
}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(kUsageMessage);
  absl::ParseCommandLine(argc, argv);
  if (absl::GetFlag(FLAGS_bucket).empty() || absl::GetFlag(FLAGS_key).empty()) {
    std::cerr << "Please provide --bucket and --key\n"
              << absl::ProgramUsageMessage();
    return EXIT_FAILURE;
  }

  InitializeLog(LogOption::kConsoleLog);
  Aws::SDKOptions sdk_options;
  Aws::InitAPI(sdk_options);
  const int exit_code = Run();
  Aws::ShutdownAPI(sdk_options);
  return exit_code;
}
