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


#include "src/s3_client/s3_message.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "src/public/core/test_execution_result_matchers.h"
#include "src/s3_client/error_codes.h"

using s3upload::core::FailureExecutionResult;
using s3upload::core::HttpMethod;
using s3upload::core::test::ResultIs;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_BUCKET_NAME;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_HEADER_NAME;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_HEADER_VALUE;
using s3upload::core::errors::SC_S3_CLIENT_INVALID_OBJECT_KEY;
using testing::ElementsAre;
using testing::Pair;

namespace s3upload::s3_client::test {

TEST(S3MessageTest, NewBuildsPathFromKey) {
  ASSERT_SUCCESS_AND_ASSIGN(S3Message message,
                            S3Message::New(HttpMethod::PUT, "bucket", "a/b"));
  EXPECT_EQ(message.method(), HttpMethod::PUT);
  EXPECT_EQ(message.bucket(), "bucket");
  EXPECT_EQ(message.key(), "a/b");
  EXPECT_EQ(message.path(), "/a/b");
  EXPECT_TRUE(message.headers().empty());
}

TEST(S3MessageTest, NewRejectsEmptyBucketAndKey) {
  EXPECT_THAT(S3Message::New(HttpMethod::PUT, "", "key"),
              ResultIs(FailureExecutionResult(
                  SC_S3_CLIENT_INVALID_BUCKET_NAME)));
  EXPECT_THAT(
      S3Message::New(HttpMethod::PUT, "bucket", ""),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_OBJECT_KEY)));
}

TEST(S3MessageTest, SetHeaderReplacesAndAddHeaderAppends) {
  ASSERT_SUCCESS_AND_ASSIGN(S3Message message,
                            S3Message::New(HttpMethod::PUT, "bucket", "key"));
  EXPECT_SUCCESS(message.SetHeader("x-amz-storage-class", "STANDARD"));
  EXPECT_SUCCESS(message.AddHeader("x-custom", "1"));
  EXPECT_SUCCESS(message.AddHeader("x-custom", "2"));
  EXPECT_SUCCESS(message.SetHeader("X-Amz-Storage-Class", "GLACIER"));

  EXPECT_THAT(message.headers(),
              ElementsAre(Pair("x-custom", "1"), Pair("x-custom", "2"),
                          Pair("X-Amz-Storage-Class", "GLACIER")));
  EXPECT_EQ(message.GetHeader("x-amz-storage-class"), "GLACIER");
  EXPECT_EQ(message.GetHeader("x-custom"), "1");
  EXPECT_FALSE(message.GetHeader("missing").has_value());
}

TEST(S3MessageTest, RejectsInvalidHeaders) {
  ASSERT_SUCCESS_AND_ASSIGN(S3Message message,
                            S3Message::New(HttpMethod::PUT, "bucket", "key"));
  EXPECT_THAT(
      message.SetHeader("", "value"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_NAME)));
  EXPECT_THAT(
      message.SetHeader("bad name", "value"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_NAME)));
  EXPECT_THAT(
      message.AddHeader("name:", "value"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_NAME)));
  EXPECT_THAT(
      message.SetHeader("name", "line\r\nbreak"),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_VALUE)));
  EXPECT_THAT(
      message.AddHeader("name", std::string("nul\0byte", 8)),
      ResultIs(FailureExecutionResult(SC_S3_CLIENT_INVALID_HEADER_VALUE)));
  EXPECT_TRUE(message.headers().empty());
}

TEST(S3MessageTest, ContentLengthAndChecksumHeaders) {
  ASSERT_SUCCESS_AND_ASSIGN(S3Message message,
                            S3Message::New(HttpMethod::PUT, "bucket", "key"));
  message.SetContentLength(10);
  message.SetContentLength(12);
  EXPECT_SUCCESS(message.SetChecksumHeader(0xE3069283));
  EXPECT_THAT(message.headers(),
              ElementsAre(Pair("Content-Length", "12"),
                          Pair("x-amz-checksum-crc32c", "4waSgw==")));
}

TEST(S3MessageTest, CopyHeadersToProto) {
  ASSERT_SUCCESS_AND_ASSIGN(S3Message message,
                            S3Message::New(HttpMethod::PUT, "bucket", "key"));
  EXPECT_SUCCESS(message.AddHeader("a", "1"));
  EXPECT_SUCCESS(message.AddHeader("b", "2"));
  google::protobuf::RepeatedPtrField<v1::Header> headers;
  message.CopyHeadersTo(headers);
  ASSERT_EQ(headers.size(), 2);
  EXPECT_EQ(headers[0].name(), "a");
  EXPECT_EQ(headers[1].value(), "2");
}

}  // namespace s3upload::s3_client::test
