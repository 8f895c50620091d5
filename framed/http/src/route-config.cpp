#include "framed/route-config.hpp"

namespace framed {

RouteConfig& RouteConfig::withMethodPolicy(MethodPolicy policy) {
  methodPolicy = policy;
  return *this;
}

}  // namespace framed
