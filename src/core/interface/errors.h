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

#ifndef CORE_INTERFACE_ERRORS_H_
#define CORE_INTERFACE_ERRORS_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "src/public/core/interface/execution_result.h"

namespace s3upload::core::errors {

/// Http status classes attached to registered error codes.
enum class HttpStatusCode {
  UNKNOWN = 0,

  OK = 200,
  NO_CONTENT = 204,

  BAD_REQUEST = 400,
  UNAUTHORIZED = 401,
  FORBIDDEN = 403,
  NOT_FOUND = 404,
  CONFLICT = 409,
  PRECONDITION_FAILED = 412,
  REQUEST_ENTITY_TOO_LARGE = 413,
  TOO_MANY_REQUESTS = 429,
  CANCELLED = 444,

  INTERNAL_SERVER_ERROR = 500,
  NOT_IMPLEMENTED = 501,
  BAD_GATEWAY = 502,
  SERVICE_UNAVAILABLE = 503,
  GATEWAY_TIMEOUT = 504,
};

inline bool IsRetriableErrorCode(HttpStatusCode http_status_code) {
  return http_status_code >= HttpStatusCode::INTERNAL_SERVER_ERROR;
}

/// Registered description of one error code.
struct S3UError {
  std::string error_message;
  HttpStatusCode error_http_status_code;
};

/**
 * @brief Returns the registry of all error codes, keyed by component code and
 * then by the full error code.
 */
absl::flat_hash_map<uint64_t, absl::flat_hash_map<uint64_t, S3UError>>&
GetGlobalErrorCodes();

/**
 * @brief Registers component code.
 *
 * @param component_name component name.
 * @param component_code a uint_64 number.
 */
#define REGISTER_COMPONENT_CODE(component_name, component_code) \
  static constexpr uint64_t component_name = component_code;    \
  static constexpr bool registered_##component_code = true;

/**
 * @brief Combines a component code and a component-local error code into a
 * globally unique error code.
 */
constexpr uint64_t MakeErrorCode(uint64_t component, uint64_t error) {
  return (((uint64_t)(1) << 31) | ((uint64_t)(component) << 16) |
          ((uint64_t)(error)));
}

/**
 * @brief Defines an error code and registers its message and http status in
 * GetGlobalErrorCodes().
 *
 * @param error_name the global error code name.
 * @param component component code.
 * @param error component-specific error code.
 * @param message message about the error.
 * @param http_status_code Http status code.
 */
#define DEFINE_ERROR_CODE(error_name, component, error, message,               \
                          http_status_code)                                    \
  static_assert(((component) > 0) && ((component) < 0x8000),                   \
                "Component code out of range. Valid range [0x0001, 0x7FFF)."); \
  static_assert(                                                               \
      ((error) > 0) && ((error) < 0x10000),                                    \
      "Error code is out of range. Valid range is [0x0001, 0xFFFF].");         \
  static constexpr uint64_t error_name =                                       \
      ::s3upload::core::errors::MakeErrorCode((component), (error));           \
  static bool initialized_##component##error = []() {                          \
    ::s3upload::core::errors::GetGlobalErrorCodes()[component].emplace(        \
        error_name, ::s3upload::core::errors::S3UError{                        \
                        .error_message = (message),                            \
                        .error_http_status_code = (http_status_code),          \
                    });                                                        \
    return true;                                                               \
  }();

constexpr uint64_t ExtractComponentCode(uint64_t error_code) {
  return ((error_code >> 16) & 0x7FFF);
}

/**
 * @brief Gets the error message.
 *
 * @param error_code the global error code.
 * @return std::string_view the message about the error code.
 */
inline std::string_view GetErrorMessage(uint64_t error_code) {
  static constexpr std::string_view kInvalidErrorCodeStr = "InvalidErrorCode";
  static constexpr std::string_view kUnknownErrorCodeStr = "Unknown Error";
  static constexpr std::string_view kSuccessErrorCodeStr = "Success";
  static constexpr std::string_view kUnknownComponentCodeStr =
      "Unrecognized Component";
  switch (error_code) {
    case SC_OK:
      return kSuccessErrorCodeStr;
    case SC_UNKNOWN:
      return kUnknownErrorCodeStr;
    default:
      break;
  }
  const uint64_t component = ExtractComponentCode(error_code);
  const auto& global_err_codes = GetGlobalErrorCodes();
  const auto comp_it = global_err_codes.find(component);
  if (comp_it == global_err_codes.end()) {
    return kUnknownComponentCodeStr;
  }
  const auto& comp_map = comp_it->second;
  if (const auto it = comp_map.find(error_code); it != comp_map.end()) {
    return std::string_view(it->second.error_message);
  }
  return kInvalidErrorCodeStr;
}

/**
 * @brief Gets the http status class of a registered error code, or UNKNOWN.
 */
inline HttpStatusCode GetErrorHttpStatusCode(uint64_t error_code) {
  const uint64_t component = ExtractComponentCode(error_code);
  const auto& global_err_codes = GetGlobalErrorCodes();
  const auto comp_it = global_err_codes.find(component);
  if (comp_it == global_err_codes.end()) {
    return HttpStatusCode::UNKNOWN;
  }
  if (const auto it = comp_it->second.find(error_code);
      it != comp_it->second.end()) {
    return it->second.error_http_status_code;
  }
  return HttpStatusCode::UNKNOWN;
}

}  // namespace s3upload::core::errors

#endif  // CORE_INTERFACE_ERRORS_H_
