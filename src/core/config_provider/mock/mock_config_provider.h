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

#ifndef CORE_CONFIG_PROVIDER_MOCK_MOCK_CONFIG_PROVIDER_H_
#define CORE_CONFIG_PROVIDER_MOCK_MOCK_CONFIG_PROVIDER_H_

#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "src/core/config_provider/error_codes.h"
#include "src/core/interface/config_provider_interface.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::config_provider::mock {
class MockConfigProvider : public ConfigProviderInterface {
 public:
  MockConfigProvider() {}

  ExecutionResult Get(const ConfigKey& key,
                      std::string& out) noexcept override {
    return Lookup(string_config_map_, key, out);
  }

  ExecutionResult Get(const ConfigKey& key, size_t& out) noexcept override {
    if (string_config_map_.contains(key)) {
      // Mirrors a value of the wrong type in the environment.
      return FailureExecutionResult(
          errors::SC_CONFIG_PROVIDER_VALUE_TYPE_ERROR);
    }
    return Lookup(size_t_config_map_, key, out);
  }

  ExecutionResult Get(const ConfigKey& key, bool& out) noexcept override {
    return Lookup(bool_config_map_, key, out);
  }

  void Set(const ConfigKey& key, std::string value) {
    string_config_map_[key] = std::move(value);
  }

  void SetInt(const ConfigKey& key, const size_t value) {
    size_t_config_map_[key] = value;
  }

  void SetBool(const ConfigKey& key, const bool value) {
    bool_config_map_[key] = value;
  }

 private:
  template <typename T>
  static ExecutionResult Lookup(const absl::flat_hash_map<ConfigKey, T>& map,
                                const ConfigKey& key, T& out) {
    if (const auto it = map.find(key); it != map.end()) {
      out = it->second;
      return SuccessExecutionResult();
    }
    return FailureExecutionResult(errors::SC_CONFIG_PROVIDER_KEY_NOT_FOUND);
  }

  absl::flat_hash_map<ConfigKey, std::string> string_config_map_;
  absl::flat_hash_map<ConfigKey, size_t> size_t_config_map_;
  absl::flat_hash_map<ConfigKey, bool> bool_config_map_;
};
}  // namespace s3upload::core::config_provider::mock

#endif  // CORE_CONFIG_PROVIDER_MOCK_MOCK_CONFIG_PROVIDER_H_
