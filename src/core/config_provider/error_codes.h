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

#ifndef CORE_CONFIG_PROVIDER_ERROR_CODES_H_
#define CORE_CONFIG_PROVIDER_ERROR_CODES_H_

#include "src/core/interface/errors.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::errors {

/// Registers component code as 0x0002 for config provider.
REGISTER_COMPONENT_CODE(SC_CONFIG_PROVIDER, 0x0002)

DEFINE_ERROR_CODE(SC_CONFIG_PROVIDER_KEY_NOT_FOUND, SC_CONFIG_PROVIDER, 0x0002,
                  "Config provider cannot find the key",
                  HttpStatusCode::NOT_FOUND)

DEFINE_ERROR_CODE(SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR, SC_CONFIG_PROVIDER,
                  0x0003, "Config provider value type of the key doesn't match",
                  HttpStatusCode::BAD_REQUEST)
}  // namespace s3upload::core::errors

#endif  // CORE_CONFIG_PROVIDER_ERROR_CODES_H_
