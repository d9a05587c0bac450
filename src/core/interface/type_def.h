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

#ifndef CORE_INTERFACE_TYPE_DEF_H_
#define CORE_INTERFACE_TYPE_DEF_H_

#include <cstddef>

namespace s3upload::core {
/// Smallest part size accepted by the object store for multipart uploads.
inline constexpr size_t kMinimumPartSizeInBytes = 5 * 1024 * 1024;

/// Part size used when none is configured.
inline constexpr size_t kDefaultPartSizeInBytes = 8 * 1024 * 1024;

}  // namespace s3upload::core

#endif  // CORE_INTERFACE_TYPE_DEF_H_
