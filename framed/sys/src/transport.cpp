#include "framed/transport.hpp"

#include <string_view>

namespace framed {

TransportResult ITransport::write(std::string_view firstBuf, std::string_view secondBuf) {
  // A partially written head must be flushed before any body byte goes out.
  TransportResult result = write(firstBuf);
  if (result.want != TransportHint::None || result.bytesProcessed < firstBuf.size()) {
    return result;
  }

  if (!secondBuf.empty()) {
    const auto [bytesWritten, want] = write(secondBuf);
    result.bytesProcessed += bytesWritten;
    result.want = want;
  }
  return result;
}

}  // namespace framed
