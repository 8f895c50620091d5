// Declares a few routes, activates one service per route for a single connection, and dispatches
// pre-parsed requests to them. The connection is one end of a socketpair, the other end plays the client.

#include <framed/framed.hpp>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace framed;

namespace {

// Blocking end of a connected socket. Two-buffer writes use ITransport's sequential writes.
class SocketTransport : public ITransport {
 public:
  explicit SocketTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override {
    const auto nbRead = ::recv(_fd, buf, len, 0);
    if (nbRead < 0) {
      return {0, TransportHint::Error};
    }
    return {static_cast<std::size_t>(nbRead), TransportHint::None};
  }

  using ITransport::write;

  TransportResult write(std::string_view data) override {
    const auto nbSent = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (nbSent < 0) {
      return {0, TransportHint::Error};
    }
    return {static_cast<std::size_t>(nbSent), TransportHint::None};
  }

 private:
  int _fd;
};

struct Session {
  int nbRequests{};
};

using Request = FramedRequest<SocketTransport, Session>;

// Stand-in for the application registry: exact path matching over activated services.
struct ActiveRoute {
  std::string pattern;
  std::function<RequestTask<void>(Request)> dispatch;
};

template <HttpServiceFactory Route>
ActiveRoute Activate(Route route) {
  std::string pattern(route.path());
  auto factory = std::move(route).create();
  auto service = factory.newService(ServiceContext{});
  if (!service) {
    throw std::runtime_error(service.error().reason);
  }
  auto shared = std::make_shared<typename decltype(factory)::service_type>(std::move(*service));
  return {std::move(pattern), [shared](Request req) { return shared->call(std::move(req)); }};
}

std::string Drain(SocketTransport& client) {
  std::array<char, 256> buf;
  const auto res = client.read(buf.data(), buf.size());
  return {buf.data(), res.bytesProcessed};
}

}  // namespace

int main() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    log::critical("socketpair failed");
    return 1;
  }

  SocketTransport connection(fds[0]);
  SocketTransport client(fds[1]);
  auto session = std::make_shared<Session>();

  std::vector<ActiveRoute> routes;
  routes.push_back(Activate(route::Get<SocketTransport, Session>("/ping").to([](Request req) -> HandlerResult<> {
    ++req.state().nbRequests;
    req.io().write("pong\n");
    return {};
  })));
  routes.push_back(Activate(route::Build<SocketTransport, Session>("/echo")
                                .method(http::Method::POST)
                                .method(http::Method::PUT)
                                .to([](Request req) -> RequestTask<HandlerResult<>> {
                                  ++req.state().nbRequests;
                                  const auto res = req.io().write(req.head().query, "\n");
                                  if (res.want == TransportHint::Error) {
                                    co_return std::unexpected<std::string>("echo write failed");
                                  }
                                  co_return HandlerResult<>{};
                                })));
  routes.push_back(Activate(route::Get<SocketTransport, Session>("/fail").to([](Request req) -> HandlerResult<> {
    ++req.state().nbRequests;
    return std::unexpected<std::string>("storage unavailable");
  })));

  const std::array<RequestHead, 4> heads{{{http::Method::GET, "/ping", {}},
                                          {http::Method::POST, "/echo", "hello"},
                                          {http::Method::GET, "/fail", {}},
                                          {http::Method::GET, "/missing", {}}}};

  for (const RequestHead& head : heads) {
    auto it = std::ranges::find(routes, std::string_view(head.path), &ActiveRoute::pattern);
    if (it == routes.end()) {
      log::warn("No route for {} {}", http::MethodToStr(head.method), head.path);
      continue;
    }
    it->dispatch(Request(connection, head, session)).runSynchronously();
    if (head.path != "/fail") {
      log::info("{} {} -> {}", http::MethodToStr(head.method), head.path, Drain(client));
    }
  }

  log::info("Connection served {} requests", session->nbRequests);

  ::close(fds[0]);
  ::close(fds[1]);
  return 0;
}
