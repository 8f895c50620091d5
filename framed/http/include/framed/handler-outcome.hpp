#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <type_traits>

#include "framed/error-display.hpp"
#include "framed/request-task.hpp"

namespace framed {

// Result of a route handler: nothing on success, a displayable error otherwise.
template <DisplayableError E = std::string>
using HandlerResult = std::expected<void, E>;

// Describes what a handler may return:
//   - HandlerResult<E>               : outcome already known when the handler returns
//   - RequestTask<HandlerResult<E>>  : outcome produced by a coroutine
//   - RequestTask<void>              : coroutine reporting failures by throwing only
template <class R>
struct HandlerOutcomeTraits {
  static constexpr bool kIsOutcome = false;
};

template <DisplayableError E>
struct HandlerOutcomeTraits<std::expected<void, E>> {
  static constexpr bool kIsOutcome = true;
  static constexpr bool kIsAsync = false;
  using error_type = E;
};

template <DisplayableError E>
struct HandlerOutcomeTraits<RequestTask<std::expected<void, E>>> {
  static constexpr bool kIsOutcome = true;
  static constexpr bool kIsAsync = true;
  using error_type = E;
};

template <>
struct HandlerOutcomeTraits<RequestTask<void>> {
  static constexpr bool kIsOutcome = true;
  static constexpr bool kIsAsync = true;
  using error_type = void;
};

template <class R>
concept HandlerOutcome = HandlerOutcomeTraits<std::remove_cvref_t<R>>::kIsOutcome;

template <class Handler, class Request>
using HandlerOutcomeOf = std::remove_cvref_t<std::invoke_result_t<Handler&, Request>>;

// A route handler is copied into every service built from its route, and is invoked with the request by value.
template <class Handler, class Request>
concept RouteHandler = std::copy_constructible<Handler> && std::invocable<Handler&, Request> &&
                       HandlerOutcome<std::invoke_result_t<Handler&, Request>>;

}  // namespace framed
