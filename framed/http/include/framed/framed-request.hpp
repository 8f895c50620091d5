#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "framed/http-method.hpp"
#include "framed/transport.hpp"

namespace framed {

// Pre-parsed request line, as produced by the connection's parser.
struct RequestHead {
  http::Method method{http::Method::GET};
  std::string path;
  std::string query;
};

// A request bound to its connection: the parsed head, the connection's transport and the
// per-connection state shared by every request of that connection.
// The transport must outlive the request.
template <DuplexTransport Io, class State>
class FramedRequest {
 public:
  using transport_type = Io;
  using state_type = State;

  FramedRequest(Io& io, RequestHead head, std::shared_ptr<State> state) noexcept
      : _io(&io), _head(std::move(head)), _state(std::move(state)) {}

  [[nodiscard]] const RequestHead& head() const noexcept { return _head; }

  [[nodiscard]] http::Method method() const noexcept { return _head.method; }

  [[nodiscard]] std::string_view path() const noexcept { return _head.path; }

  [[nodiscard]] std::string_view query() const noexcept { return _head.query; }

  [[nodiscard]] Io& io() const noexcept { return *_io; }

  [[nodiscard]] State& state() const noexcept { return *_state; }

  [[nodiscard]] const std::shared_ptr<State>& stateHandle() const noexcept { return _state; }

 private:
  Io* _io;
  RequestHead _head;
  std::shared_ptr<State> _state;
};

}  // namespace framed
