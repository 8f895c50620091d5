#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace framed {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation could not complete.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed)
  ReadReady,   // Need the connection readable before the operation can proceed
  WriteReady,  // Need the connection writable before the operation can proceed
  Error        // Fatal error, the connection should be closed
};

struct TransportResult {
  std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
  TransportHint want;
};

// A readable and writable connection handle. Routes are generic over it, the per-connection
// service keeps a reference to it for its whole lifetime.
template <class Io>
concept DuplexTransport = requires(Io& io, char* buf, std::size_t len, std::string_view data) {
  { io.read(buf, len) } -> std::same_as<TransportResult>;
  { io.write(data) } -> std::same_as<TransportResult>;
};

// Base transport abstraction, for servers that mix several transport kinds behind one type.
// Concrete transports (plain sockets, TLS...) belong to the server embedding the routes.
class ITransport {
 public:
  virtual ~ITransport() = default;

  // Non-blocking read. bytesProcessed == 0 with want == None means orderly close by the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. If not everything was written, want tells whether to wait or give up.
  virtual TransportResult write(std::string_view data) = 0;

  // Writes firstBuf then secondBuf. secondBuf is only started once firstBuf has been fully written.
  virtual TransportResult write(std::string_view firstBuf, std::string_view secondBuf);
};

static_assert(DuplexTransport<ITransport>);

}  // namespace framed
