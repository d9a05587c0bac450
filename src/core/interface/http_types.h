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


#ifndef CORE_INTERFACE_HTTP_TYPES_H_
#define CORE_INTERFACE_HTTP_TYPES_H_

#include <string>

#include "absl/container/btree_map.h"

namespace s3upload::core {
/// Http Methods enumerator.
enum class HttpMethod {
  GET = 0,
  POST = 1,
  PUT = 2,
  DELETE = 3,
  UNKNOWN = 1000,
};

/// Keeps http headers key value pairs. Values of one name keep insertion
/// order.
using HttpHeaders = absl::btree_multimap<std::string, std::string>;

}  // namespace s3upload::core

#endif  // CORE_INTERFACE_HTTP_TYPES_H_
