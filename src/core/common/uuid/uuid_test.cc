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

#include "src/core/common/uuid/uuid.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using testing::StrEq;

namespace s3upload::core::common::test {

TEST(UuidTests, UuidGeneration) {
  Uuid uuid = Uuid::GenerateUuid();

  EXPECT_NE(uuid.high, 0);
  EXPECT_NE(uuid, Uuid::GenerateUuid());
}

TEST(UuidTests, UuidToString) {
  Uuid uuid{.high = 0x1794CADF6CD80B88, .low = 0xE79E8E4B730042C6};
  EXPECT_THAT(ToString(uuid), StrEq("1794CADF-6CD8-0B88-E79E-8E4B730042C6"));
}

TEST(UuidTests, ZeroUuidToString) {
  EXPECT_THAT(ToString(kZeroUuid),
              StrEq("00000000-0000-0000-0000-000000000000"));
}

}  // namespace s3upload::core::common::test
