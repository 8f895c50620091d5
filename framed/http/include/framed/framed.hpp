// framed Umbrella Header
//
// Pulls in the public route API:
//   - Route building and dispatch (route::Get / Post / ..., FramedRoute, FramedRouteFactory, FramedRouteService)
//   - Handler contract (FramedRequest, HandlerResult, RequestTask)
//   - Service contract concepts used by an application registry (Service, ServiceFactory, HttpServiceFactory)
//   - Transport contract (DuplexTransport, ITransport)
//
// Usage Example:
//    #include <framed/framed.hpp>
//    using namespace framed;
//    struct Session {};
//    // MyTransport: any type satisfying DuplexTransport, for instance an ITransport implementation.
//    auto factory = route::Get<MyTransport, Session>("/ping")
//                       .to([](FramedRequest<MyTransport, Session> req) -> HandlerResult<> {
//                         req.io().write("pong");
//                         return {};
//                       })
//                       .create();
//    auto service = factory.newService();
//    service->call(std::move(request)).runSynchronously();

#pragma once

#include "framed/error-display.hpp"     // IWYU pragma: export
#include "framed/framed-request.hpp"    // IWYU pragma: export
#include "framed/framed-route.hpp"      // IWYU pragma: export
#include "framed/handler-outcome.hpp"   // IWYU pragma: export
#include "framed/http-method-set.hpp"   // IWYU pragma: export
#include "framed/http-method.hpp"       // IWYU pragma: export
#include "framed/log.hpp"               // IWYU pragma: export
#include "framed/request-task.hpp"      // IWYU pragma: export
#include "framed/route-config.hpp"      // IWYU pragma: export
#include "framed/service.hpp"           // IWYU pragma: export
#include "framed/transport.hpp"         // IWYU pragma: export
