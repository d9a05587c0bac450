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

#ifndef CORE_CONFIG_PROVIDER_ENV_CONFIG_PROVIDER_H_
#define CORE_CONFIG_PROVIDER_ENV_CONFIG_PROVIDER_H_

#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "src/core/interface/config_provider_interface.h"
#include "src/public/core/interface/execution_result.h"

#include "error_codes.h"

namespace s3upload::core {

/*! @copydoc ConfigProviderInterface
 * Values are read from environment variables named after the key.
 */
class EnvConfigProvider : public ConfigProviderInterface {
 public:
  ExecutionResult Get(const ConfigKey& key, std::string& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, size_t& out) noexcept override;

  ExecutionResult Get(const ConfigKey& key, bool& out) noexcept override;

 private:
  template <typename T>
  ExecutionResult Get(const ConfigKey& key, T& out) noexcept {
    const char* var_value = std::getenv(key.c_str());

    if (var_value == nullptr) {
      return FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND);
    }

    return StringToType(var_value, out);
  }

  /**
   * @brief Convert a string to the desired, supported type.
   *
   * @tparam T the desired output type.
   * @param str The input string.
   * @param out The output value.
   * @return ExecutionResult failure if the conversion failed.
   */
  template <typename T>
  ExecutionResult StringToType(std::string_view str, T& out) {
    if constexpr (std::is_same_v<T, std::string>) {
      // Only strings may be empty.
      out = std::string(str);
      return SuccessExecutionResult();
    } else {
      std::stringstream string_stream;
      if constexpr (std::is_same_v<T, bool>) {
        string_stream << std::boolalpha << str;
        string_stream >> std::boolalpha >> out;
      } else {
        string_stream << str;
        string_stream >> out;
      }
      // Trailing garbage such as "12abc" is rejected as well.
      if (string_stream.fail() || string_stream.peek() != EOF) {
        return FailureExecutionResult(
            errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR);
      }
      return SuccessExecutionResult();
    }
  }
};
}  // namespace s3upload::core

#endif  // CORE_CONFIG_PROVIDER_ENV_CONFIG_PROVIDER_H_
