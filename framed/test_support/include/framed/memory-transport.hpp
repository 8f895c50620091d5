#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "framed/transport.hpp"

namespace framed::test {

// In-memory duplex transport: reads come from a fixed input, writes are appended to output().
// Once the input is exhausted, reads report ReadReady (more data may come) until closeInput() is called.
class MemoryTransport {
 public:
  explicit MemoryTransport(std::string input = {}) : _input(std::move(input)) {}

  TransportResult read(char* buf, std::size_t len) {
    const std::size_t nb = std::min(len, _input.size() - _readPos);
    if (nb == 0) {
      return {0, _inputClosed ? TransportHint::None : TransportHint::ReadReady};
    }
    std::copy_n(_input.data() + _readPos, nb, buf);
    _readPos += nb;
    return {nb, TransportHint::None};
  }

  TransportResult write(std::string_view data) {
    _output.append(data);
    return {data.size(), TransportHint::None};
  }

  void closeInput() noexcept { _inputClosed = true; }

  [[nodiscard]] const std::string& output() const noexcept { return _output; }

 private:
  std::string _input;
  std::string _output;
  std::size_t _readPos{};
  bool _inputClosed{};
};

static_assert(DuplexTransport<MemoryTransport>);

}  // namespace framed::test
