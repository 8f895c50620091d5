#pragma once

#include <cstdint>

namespace framed {

struct RouteConfig {
  enum class MethodPolicy : std::int8_t { Trust, Enforce };

  // Whether the route service checks the request method against the route's method set.
  //   Trust  : the method set is metadata for the router, which is expected to have filtered requests
  //            before dispatch. Every request reaching the service is passed to the handler.
  //   Enforce: a request whose method is not in a non-empty method set is not passed to the handler.
  //            A warning is logged and the call still completes successfully.
  // Default: Trust
  MethodPolicy methodPolicy{MethodPolicy::Trust};

  RouteConfig& withMethodPolicy(MethodPolicy policy);

  bool operator==(const RouteConfig&) const noexcept = default;
};

}  // namespace framed
