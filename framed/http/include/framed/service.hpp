#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "framed/request-task.hpp"

namespace framed {

enum class Readiness : uint8_t { Ready, Pending };

// Activation context handed to a service factory, one per connection.
struct ServiceContext {};

// Failure to build a service. Part of the factory contract, route factories never produce it.
struct ServiceInitError {
  std::string reason;
};

// A per-connection unit of work: reports readiness, then accepts one request at a time.
// The returned task completes once the request has been fully handled.
template <class S>
concept Service = requires(S& service, typename S::request_type request) {
  { service.pollReady() } -> std::same_as<Readiness>;
  { service.call(std::move(request)) } -> std::same_as<RequestTask<void>>;
};

// Produces a fresh Service per activation context.
template <class F>
concept ServiceFactory = requires(const F& factory, const ServiceContext& context) {
  typename F::service_type;
  { factory.newService(context) } -> std::same_as<std::expected<typename F::service_type, ServiceInitError>>;
} && Service<typename F::service_type>;

// What the application registry consumes when assembling its route table:
// a pattern to match against and a one-shot conversion into a service factory.
template <class R>
concept HttpServiceFactory = requires(const R& cref, R&& rref) {
  { cref.path() } -> std::convertible_to<std::string_view>;
  { std::move(rref).create() } -> ServiceFactory;
};

}  // namespace framed
