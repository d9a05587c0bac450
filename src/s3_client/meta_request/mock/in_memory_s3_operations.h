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


#ifndef S3_CLIENT_META_REQUEST_MOCK_IN_MEMORY_S3_OPERATIONS_H_
#define S3_CLIENT_META_REQUEST_MOCK_IN_MEMORY_S3_OPERATIONS_H_

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/crc/crc32c.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "src/core/interface/async_context.h"
#include "src/core/interface/async_executor_interface.h"
#include "src/s3_client/checksum.h"
#include "src/s3_client/meta_request/error_codes.h"
#include "src/s3_client/meta_request/meta_request_interface.h"
#include "src/s3_client/meta_request/s3_operations_interface.h"

namespace s3upload::s3_client::mock {
/**
 * @brief Object store kept in memory. Every request is finished on the given
 * executor. Failures can be injected per request type.
 */
class InMemoryS3Operations : public S3OperationsInterface {
 public:
  explicit InMemoryS3Operations(
      std::shared_ptr<core::AsyncExecutorInterface> async_executor)
      : async_executor_(std::move(async_executor)) {}

  /// The next request of this type finishes with result.
  void FailNext(RequestType request_type, core::ExecutionResult result) {
    absl::MutexLock lock(&mutex_);
    injected_failures_[request_type].push_back(result);
  }

  size_t RequestCount(RequestType request_type) const {
    absl::MutexLock lock(&mutex_);
    const auto it = request_counts_.find(request_type);
    return it == request_counts_.end() ? 0 : it->second;
  }

  std::optional<std::string> GetObject(const std::string& bucket,
                                       const std::string& key) const {
    absl::MutexLock lock(&mutex_);
    const auto it = objects_.find(ObjectPath(bucket, key));
    if (it == objects_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  /// Multipart uploads neither completed nor aborted.
  size_t ActiveUploadCount() const {
    absl::MutexLock lock(&mutex_);
    return uploads_.size();
  }

  /// Every CreateMultipartUpload request received, in arrival order.
  std::vector<v1::CreateMultipartUploadRequest> CreateMultipartUploadRequests()
      const {
    absl::MutexLock lock(&mutex_);
    return create_requests_;
  }

  /// Every UploadPart request received, in arrival order.
  std::vector<v1::UploadPartRequest> UploadPartRequests() const {
    absl::MutexLock lock(&mutex_);
    return upload_part_requests_;
  }

  core::ExecutionResult CreateMultipartUpload(
      core::AsyncContext<v1::CreateMultipartUploadRequest,
                         v1::CreateMultipartUploadResponse>&
          context) noexcept override {
    core::ExecutionResult result = core::SuccessExecutionResult();
    {
      absl::MutexLock lock(&mutex_);
      create_requests_.push_back(*context.request);
      result = TakeResult(RequestType::kCreateMultipartUpload);
      if (result.Successful()) {
        const std::string upload_id = absl::StrCat("upload-", ++upload_count_);
        Upload& upload = uploads_[upload_id];
        upload.bucket = context.request->bucket();
        upload.key = context.request->key();
        upload.checksum_algorithm = context.request->checksum_algorithm();
        upload.headers.assign(context.request->headers().begin(),
                              context.request->headers().end());
        context.response =
            std::make_shared<v1::CreateMultipartUploadResponse>();
        context.response->set_upload_id(upload_id);
      }
    }
    core::FinishContext(result, context, async_executor_);
    return core::SuccessExecutionResult();
  }

  core::ExecutionResult UploadPart(
      core::AsyncContext<v1::UploadPartRequest, v1::UploadPartResponse>&
          context) noexcept override {
    core::ExecutionResult result = core::SuccessExecutionResult();
    {
      absl::MutexLock lock(&mutex_);
      upload_part_requests_.push_back(*context.request);
      result = TakeResult(RequestType::kUploadPart);
      const auto upload = uploads_.find(context.request->upload_id());
      if (result.Successful() && upload == uploads_.end()) {
        result = core::FailureExecutionResult(
            core::errors::SC_S3_OPERATIONS_NOT_FOUND);
      }
      // Checksums are accepted only on uploads that declared the algorithm.
      if (result.Successful() && context.request->has_checksum_crc32c() &&
          upload->second.checksum_algorithm != v1::CHECKSUM_ALGORITHM_CRC32C) {
        result = core::FailureExecutionResult(
            core::errors::SC_S3_OPERATIONS_BAD_REQUEST);
      }
      if (result.Successful() && context.request->has_checksum_crc32c()) {
        auto expected = ComputeEncodedCrc32c(context.request->data());
        if (!expected.Successful() ||
            *expected != context.request->checksum_crc32c()) {
          result = core::FailureExecutionResult(
              core::errors::SC_S3_OPERATIONS_BAD_REQUEST);
        }
      }
      if (result.Successful()) {
        const std::string etag = PartEtag(context.request->part_number(),
                                          context.request->data());
        upload->second.parts[context.request->part_number()] =
            StoredPart{context.request->data(), etag};
        context.response = std::make_shared<v1::UploadPartResponse>();
        context.response->set_etag(etag);
      }
    }
    core::FinishContext(result, context, async_executor_);
    return core::SuccessExecutionResult();
  }

  core::ExecutionResult CompleteMultipartUpload(
      core::AsyncContext<v1::CompleteMultipartUploadRequest,
                         v1::CompleteMultipartUploadResponse>&
          context) noexcept override {
    core::ExecutionResult result = core::SuccessExecutionResult();
    {
      absl::MutexLock lock(&mutex_);
      result = TakeResult(RequestType::kCompleteMultipartUpload);
      const auto upload = uploads_.find(context.request->upload_id());
      if (result.Successful() && upload == uploads_.end()) {
        result = core::FailureExecutionResult(
            core::errors::SC_S3_OPERATIONS_NOT_FOUND);
      }
      std::string data;
      if (result.Successful()) {
        if (context.request->parts().empty()) {
          result = core::FailureExecutionResult(
              core::errors::SC_S3_OPERATIONS_BAD_REQUEST);
        }
        for (const auto& part : context.request->parts()) {
          const auto stored = upload->second.parts.find(part.part_number());
          if (stored == upload->second.parts.end() ||
              stored->second.etag != part.etag() ||
              (part.has_checksum_crc32c() &&
               upload->second.checksum_algorithm !=
                   v1::CHECKSUM_ALGORITHM_CRC32C)) {
            result = core::FailureExecutionResult(
                core::errors::SC_S3_OPERATIONS_BAD_REQUEST);
            break;
          }
          data.append(stored->second.data);
        }
      }
      if (result.Successful()) {
        context.response =
            std::make_shared<v1::CompleteMultipartUploadResponse>();
        AddHeader(*context.response->mutable_headers(), "ETag",
                  absl::StrCat("\"", ObjectEtag(data), "-",
                               context.request->parts_size(), "\""));
        EchoEncryptionHeaders(upload->second.headers,
                              *context.response->mutable_headers());
        objects_[ObjectPath(upload->second.bucket, upload->second.key)] =
            std::move(data);
        uploads_.erase(upload);
      }
    }
    core::FinishContext(result, context, async_executor_);
    return core::SuccessExecutionResult();
  }

  core::ExecutionResult AbortMultipartUpload(
      core::AsyncContext<v1::AbortMultipartUploadRequest,
                         v1::AbortMultipartUploadResponse>&
          context) noexcept override {
    core::ExecutionResult result = core::SuccessExecutionResult();
    {
      absl::MutexLock lock(&mutex_);
      result = TakeResult(RequestType::kAbortMultipartUpload);
      if (result.Successful() &&
          uploads_.erase(context.request->upload_id()) == 0) {
        result = core::FailureExecutionResult(
            core::errors::SC_S3_OPERATIONS_NOT_FOUND);
      }
      if (result.Successful()) {
        context.response =
            std::make_shared<v1::AbortMultipartUploadResponse>();
      }
    }
    core::FinishContext(result, context, async_executor_);
    return core::SuccessExecutionResult();
  }

  core::ExecutionResult PutObject(
      core::AsyncContext<v1::PutObjectRequest, v1::PutObjectResponse>&
          context) noexcept override {
    core::ExecutionResult result = core::SuccessExecutionResult();
    {
      absl::MutexLock lock(&mutex_);
      result = TakeResult(RequestType::kPutObject);
      if (result.Successful()) {
        std::vector<v1::Header> headers(context.request->headers().begin(),
                                        context.request->headers().end());
        context.response = std::make_shared<v1::PutObjectResponse>();
        AddHeader(*context.response->mutable_headers(), "ETag",
                  absl::StrCat("\"", ObjectEtag(context.request->data()),
                               "\""));
        EchoEncryptionHeaders(headers, *context.response->mutable_headers());
        objects_[ObjectPath(context.request->bucket(),
                            context.request->key())] = context.request->data();
      }
    }
    core::FinishContext(result, context, async_executor_);
    return core::SuccessExecutionResult();
  }

 private:
  struct StoredPart {
    std::string data;
    std::string etag;
  };

  struct Upload {
    std::string bucket;
    std::string key;
    v1::ChecksumAlgorithm checksum_algorithm =
        v1::CHECKSUM_ALGORITHM_UNSPECIFIED;
    std::vector<v1::Header> headers;
    std::map<int32_t, StoredPart> parts;
  };

  static std::string ObjectPath(const std::string& bucket,
                                const std::string& key) {
    return absl::StrCat(bucket, "/", key);
  }

  static std::string ObjectEtag(const std::string& data) {
    return absl::StrCat(
        absl::Hex(static_cast<uint32_t>(absl::ComputeCrc32c(data)),
                  absl::kZeroPad8));
  }

  static std::string PartEtag(int32_t part_number, const std::string& data) {
    return absl::StrCat("\"", part_number, "-", ObjectEtag(data), "\"");
  }

  static void AddHeader(google::protobuf::RepeatedPtrField<v1::Header>& headers,
                        const std::string& name, const std::string& value) {
    auto* header = headers.Add();
    header->set_name(name);
    header->set_value(value);
  }

  static void EchoEncryptionHeaders(
      const std::vector<v1::Header>& request_headers,
      google::protobuf::RepeatedPtrField<v1::Header>& response_headers) {
    for (const auto& header : request_headers) {
      if (absl::StartsWithIgnoreCase(header.name(),
                                     "x-amz-server-side-encryption")) {
        *response_headers.Add() = header;
      }
    }
  }

  core::ExecutionResult TakeResult(RequestType request_type)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    request_counts_[request_type]++;
    auto& failures = injected_failures_[request_type];
    if (failures.empty()) {
      return core::SuccessExecutionResult();
    }
    core::ExecutionResult result = failures.front();
    failures.pop_front();
    return result;
  }

  std::shared_ptr<core::AsyncExecutorInterface> async_executor_;
  mutable absl::Mutex mutex_;
  uint64_t upload_count_ ABSL_GUARDED_BY(mutex_) = 0;
  absl::flat_hash_map<std::string, std::string> objects_
      ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<std::string, Upload> uploads_ ABSL_GUARDED_BY(mutex_);
  std::vector<v1::CreateMultipartUploadRequest> create_requests_
      ABSL_GUARDED_BY(mutex_);
  std::vector<v1::UploadPartRequest> upload_part_requests_
      ABSL_GUARDED_BY(mutex_);
  std::map<RequestType, std::deque<core::ExecutionResult>> injected_failures_
      ABSL_GUARDED_BY(mutex_);
  std::map<RequestType, size_t> request_counts_ ABSL_GUARDED_BY(mutex_);
};
}  // namespace s3upload::s3_client::mock

#endif  // S3_CLIENT_META_REQUEST_MOCK_IN_MEMORY_S3_OPERATIONS_H_
