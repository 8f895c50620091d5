#pragma once

#include <coroutine>
#include <exception>
#include <expected>
#include <type_traits>
#include <utility>

#include "framed/error-display.hpp"
#include "framed/log.hpp"
#include "framed/request-task.hpp"

namespace framed::detail {

template <class E>
void LogHandlerResult(const std::expected<void, E>& result) {
  if (!result) {
    log::error("Error in request handler: {}", DisplayError(result.error()));
  }
}

inline void LogHandlerException(const std::exception& ex) { log::error("Exception in request handler: {}", ex.what()); }

inline RequestTask<void> CompletedDispatch() { co_return; }

// The handler threw instead of producing an outcome. Like a ready result, it is only logged when
// the dispatch task is driven.
inline RequestTask<void> DispatchException(std::exception_ptr exception) {
  try {
    std::rethrow_exception(std::move(exception));
  } catch (const std::exception& ex) {
    LogHandlerException(ex);
  }
  co_return;
}

// The handler already produced its result. It is only inspected when the dispatch task is driven.
template <class E>
RequestTask<void> DispatchReady(std::expected<void, E> result) {
  LogHandlerResult(result);
  co_return;
}

// Drives the handler's task: each resume of the dispatch task resumes the handler once, and the
// dispatch task suspends as long as the handler is not finished.
// Handler errors and std::exception are logged, the dispatch task itself always completes normally.
template <class T>
RequestTask<void> DispatchAsync(RequestTask<T> handlerTask) {
  while (!handlerTask.step()) {
    co_await std::suspend_always{};
  }
  try {
    if constexpr (std::is_void_v<T>) {
      handlerTask.consumeResult();
    } else {
      LogHandlerResult(handlerTask.consumeResult());
    }
  } catch (const std::exception& ex) {
    LogHandlerException(ex);
  }
}

}  // namespace framed::detail
