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

#ifndef CORE_INTERFACE_CONFIG_PROVIDER_INTERFACE_H_
#define CORE_INTERFACE_CONFIG_PROVIDER_INTERFACE_H_

#include <cstddef>
#include <string>

#include "src/public/core/interface/execution_result.h"

namespace s3upload::core {

/// Configuration key for value retrieval.
using ConfigKey = std::string;

/**
 * @brief ConfigProvider serves the configuration values of the process and
 * its components.
 */
class ConfigProviderInterface {
 public:
  virtual ~ConfigProviderInterface() = default;

  /**
   * @brief Looks up configuration key with string output type.
   * @param key configuration key.
   * @param out configuration value;
   * @return ExecutionResult SC_CONFIG_PROVIDER_KEY_NOT_FOUND when absent.
   */
  virtual ExecutionResult Get(const ConfigKey& key,
                              std::string& out) noexcept = 0;

  /**
   * @brief Looks up configuration key with size_t output type.
   * @return ExecutionResult SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR when the value
   * does not parse.
   */
  virtual ExecutionResult Get(const ConfigKey& key, size_t& out) noexcept = 0;

  virtual ExecutionResult Get(const ConfigKey& key, bool& out) noexcept = 0;
};
}  // namespace s3upload::core

#endif  // CORE_INTERFACE_CONFIG_PROVIDER_INTERFACE_H_
