#pragma once

#include <exception>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "framed/framed-request.hpp"
#include "framed/handler-dispatch.hpp"
#include "framed/handler-outcome.hpp"
#include "framed/http-method-set.hpp"
#include "framed/http-method.hpp"
#include "framed/log.hpp"
#include "framed/request-task.hpp"
#include "framed/route-config.hpp"
#include "framed/service.hpp"
#include "framed/transport.hpp"

namespace framed {

// Per-connection dispatcher of a route. Owns its own copies of the handler and of the method set,
// so handler state never aliases between connections.
template <DuplexTransport Io, class State, class Handler>
  requires RouteHandler<Handler, FramedRequest<Io, State>>
class FramedRouteService {
 public:
  using request_type = FramedRequest<Io, State>;

  FramedRouteService(Handler handler, http::MethodSet methods, RouteConfig config)
      : _handler(std::move(handler)), _methods(std::move(methods)), _config(config) {}

  // There is no admission control, a route service is always ready.
  [[nodiscard]] Readiness pollReady() const noexcept { return Readiness::Ready; }

  // Invokes the handler with the request and returns the task completing the dispatch.
  // The task never fails because of the handler: errors reported by the handler, and std::exception
  // thrown by it, are logged when the task is driven and the task completes normally.
  RequestTask<void> call(request_type request) {
    if (_config.methodPolicy == RouteConfig::MethodPolicy::Enforce && !_methods.accepts(request.method())) {
      log::warn("Method {} not accepted for {}", http::MethodToStr(request.method()), request.path());
      return detail::CompletedDispatch();
    }

    try {
      if constexpr (HandlerOutcomeTraits<HandlerOutcomeOf<Handler, request_type>>::kIsAsync) {
        auto handlerTask = std::invoke(_handler, std::move(request));
        if (!handlerTask.valid()) {
          log::error("Request handler returned an invalid RequestTask");
          return detail::CompletedDispatch();
        }
        return detail::DispatchAsync(std::move(handlerTask));
      } else {
        return detail::DispatchReady(std::invoke(_handler, std::move(request)));
      }
    } catch (const std::exception&) {
      return detail::DispatchException(std::current_exception());
    }
  }

  [[nodiscard]] const http::MethodSet& methods() const noexcept { return _methods; }

  [[nodiscard]] const RouteConfig& config() const noexcept { return _config; }

 private:
  Handler _handler;
  http::MethodSet _methods;
  RouteConfig _config;
};

// Reusable template of a route, kept for the application's lifetime.
// newService() does not modify the factory and may be called concurrently.
template <DuplexTransport Io, class State, class Handler>
  requires RouteHandler<Handler, FramedRequest<Io, State>>
class FramedRouteFactory {
 public:
  using service_type = FramedRouteService<Io, State, Handler>;

  FramedRouteFactory(Handler handler, http::MethodSet methods, RouteConfig config)
      : _handler(std::move(handler)), _methods(std::move(methods)), _config(config) {}

  // Always succeeds. The error alternative only exists to fulfill the ServiceFactory contract.
  [[nodiscard]] std::expected<service_type, ServiceInitError> newService(
      [[maybe_unused]] const ServiceContext& context = {}) const {
    return service_type(_handler, _methods, _config);
  }

  [[nodiscard]] const http::MethodSet& methods() const noexcept { return _methods; }

 private:
  Handler _handler;
  http::MethodSet _methods;
  RouteConfig _config;
};

// Route definition: a path pattern, the accepted methods and the handler.
// The pattern is only stored, matching it against request paths is the application registry's job.
template <DuplexTransport Io, class State, class Handler>
  requires RouteHandler<Handler, FramedRequest<Io, State>>
class FramedRoute {
 public:
  using factory_type = FramedRouteFactory<Io, State, Handler>;

  FramedRoute(std::string_view pattern, Handler handler) : _handler(std::move(handler)), _pattern(pattern) {}

  FramedRoute(std::string pattern, http::MethodSet methods, RouteConfig config, Handler handler)
      : _handler(std::move(handler)), _pattern(std::move(pattern)), _methods(std::move(methods)), _config(config) {}

  FramedRoute& method(http::Method method) & {
    _methods.insert(method);
    return *this;
  }

  FramedRoute&& method(http::Method method) && {
    _methods.insert(method);
    return std::move(*this);
  }

  [[nodiscard]] std::string_view path() const noexcept { return _pattern; }

  [[nodiscard]] const http::MethodSet& methods() const noexcept { return _methods; }

  [[nodiscard]] const RouteConfig& config() const noexcept { return _config; }

  // Consumes the route.
  [[nodiscard]] factory_type create() && {
    return factory_type(std::move(_handler), std::move(_methods), _config);
  }

 private:
  Handler _handler;
  std::string _pattern;
  http::MethodSet _methods;
  RouteConfig _config;
};

// Accumulates the pattern and methods of a route until a handler is attached with to().
template <DuplexTransport Io, class State>
class FramedRouteBuilder {
 public:
  using request_type = FramedRequest<Io, State>;

  explicit FramedRouteBuilder(std::string_view path) : _pattern(path) {}

  FramedRouteBuilder& method(http::Method method) & {
    _methods.insert(method);
    return *this;
  }

  FramedRouteBuilder&& method(http::Method method) && {
    _methods.insert(method);
    return std::move(*this);
  }

  FramedRouteBuilder& config(RouteConfig config) & {
    _config = config;
    return *this;
  }

  FramedRouteBuilder&& config(RouteConfig config) && {
    _config = config;
    return std::move(*this);
  }

  [[nodiscard]] std::string_view path() const noexcept { return _pattern; }

  [[nodiscard]] const http::MethodSet& methods() const noexcept { return _methods; }

  // Consumes the builder.
  template <class Handler>
    requires RouteHandler<std::decay_t<Handler>, request_type>
  [[nodiscard]] FramedRoute<Io, State, std::decay_t<Handler>> to(Handler&& handler) && {
    return FramedRoute<Io, State, std::decay_t<Handler>>(std::move(_pattern), std::move(_methods), _config,
                                                         std::forward<Handler>(handler));
  }

 private:
  std::string _pattern;
  http::MethodSet _methods;
  RouteConfig _config;
};

namespace route {

// Route accepting any method.
template <DuplexTransport Io, class State>
FramedRouteBuilder<Io, State> Build(std::string_view path) {
  return FramedRouteBuilder<Io, State>(path);
}

template <DuplexTransport Io, class State>
FramedRouteBuilder<Io, State> Get(std::string_view path) {
  return FramedRouteBuilder<Io, State>(path).method(http::Method::GET);
}

template <DuplexTransport Io, class State>
FramedRouteBuilder<Io, State> Post(std::string_view path) {
  return FramedRouteBuilder<Io, State>(path).method(http::Method::POST);
}

template <DuplexTransport Io, class State>
FramedRouteBuilder<Io, State> Put(std::string_view path) {
  return FramedRouteBuilder<Io, State>(path).method(http::Method::PUT);
}

template <DuplexTransport Io, class State>
FramedRouteBuilder<Io, State> Delete(std::string_view path) {
  return FramedRouteBuilder<Io, State>(path).method(http::Method::DELETE);
}

}  // namespace route

}  // namespace framed
