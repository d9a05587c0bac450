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

#ifndef CORE_INTERFACE_ASYNC_CONTEXT_H_
#define CORE_INTERFACE_ASYNC_CONTEXT_H_

#include <functional>
#include <memory>
#include <typeinfo>
#include <utility>

#include "src/core/common/global_logger/global_logger.h"
#include "src/core/common/uuid/uuid.h"
#include "src/public/core/interface/execution_result.h"

#include "async_executor_interface.h"
#include "errors.h"

namespace s3upload::core {
/**
 * @brief AsyncContext carries one asynchronous operation: its request, its
 * response once produced, the result, and the callback that consumes them.
 *
 * @tparam TRequest request template param
 * @tparam TResponse response template param
 */
template <typename TRequest, typename TResponse>
struct AsyncContext {
  using Callback =
      typename std::function<void(AsyncContext<TRequest, TResponse>&)>;

  AsyncContext()
      : AsyncContext(
            nullptr /* request */, [](AsyncContext<TRequest, TResponse>&) {},
            common::kZeroUuid, common::kZeroUuid) {}

  AsyncContext(const std::shared_ptr<TRequest>& request,
               const Callback& callback)
      : AsyncContext(request, callback, common::kZeroUuid, common::kZeroUuid) {}

  /**
   * @brief Constructs a child context: its parent activity is the parent's
   * activity and the correlation id is inherited.
   */
  template <typename ParentAsyncContext>
  AsyncContext(const std::shared_ptr<TRequest>& request,
               const Callback& callback,
               const ParentAsyncContext& parent_context)
      : AsyncContext(request, callback, parent_context.activity_id,
                     parent_context.correlation_id) {}

  AsyncContext(const std::shared_ptr<TRequest>& request,
               const Callback& callback, const common::Uuid& parent_activity_id,
               const common::Uuid& correlation_id)
      : parent_activity_id(parent_activity_id),
        activity_id(common::Uuid::GenerateUuid()),
        correlation_id(correlation_id),
        request(request),
        response(nullptr),
        result(FailureExecutionResult(SC_UNKNOWN)),
        callback(callback) {}

  virtual ~AsyncContext() = default;

  AsyncContext(const AsyncContext& right) = default;
  AsyncContext& operator=(const AsyncContext& right) = default;

  /// Finishes the async operation by calling the callback.
  virtual void Finish() noexcept {
    if (callback) {
      if (!result.Successful()) {
        S3U_ERROR_CONTEXT("AsyncContext", (*this), result,
                          "AsyncContext Finished. Mangled RequestType: '%s', "
                          "Mangled ResponseType: '%s'",
                          typeid(TRequest).name(), typeid(TResponse).name());
      }
      callback(*this);
    }
  }

  /// Sets `result` and finishes the async operation by calling the callback.
  void Finish(ExecutionResult execution_result) noexcept {
    result = execution_result;
    Finish();
  }

  common::Uuid parent_activity_id;

  common::Uuid activity_id;

  /// Shared by every context that belongs to the same upload.
  common::Uuid correlation_id;

  std::shared_ptr<TRequest> request;

  std::shared_ptr<TResponse> response;

  ExecutionResult result;

  Callback callback;
};

/**
 * @brief Assigns the result and schedules Finish() on the executor. If the
 * executor rejects the work, the context is finished on the current thread.
 */
template <typename TRequest, typename TResponse>
void FinishContext(const ExecutionResult& result,
                   AsyncContext<TRequest, TResponse>& context,
                   AsyncExecutorInterface& async_executor,
                   AsyncPriority priority = AsyncPriority::High) {
  context.result = result;

  // The lambda owns a copy so the context outlives the caller's frame.
  if (!async_executor
           .Schedule([context, result]() mutable { context.Finish(result); },
                     priority)
           .Successful()) {
    context.Finish(result);
  }
}

template <typename TRequest, typename TResponse>
void FinishContext(
    const ExecutionResult& result, AsyncContext<TRequest, TResponse>& context,
    const std::shared_ptr<AsyncExecutorInterface>& async_executor,
    AsyncPriority priority = AsyncPriority::High) {
  FinishContext(result, context, *async_executor, priority);
}

/// Finishes the context on the current thread.
template <typename TRequest, typename TResponse>
void FinishContext(const ExecutionResult& result,
                   AsyncContext<TRequest, TResponse>& context) {
  context.Finish(result);
}

}  // namespace s3upload::core

#endif  // CORE_INTERFACE_ASYNC_CONTEXT_H_
