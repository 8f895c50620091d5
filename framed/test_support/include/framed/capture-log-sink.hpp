#pragma once

#include <spdlog/details/log_msg.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "framed/log.hpp"

namespace framed::test {

struct CapturedLogLine {
  log::level::level_enum level;
  std::string payload;
};

// Sink keeping every formatted payload in memory, with its level.
class CaptureLogSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  std::vector<CapturedLogLine> lines() {
    std::lock_guard<std::mutex> lock(mutex_);
    return _lines;
  }

  std::size_t count(log::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t nb = 0;
    for (const auto& line : _lines) {
      nb += static_cast<std::size_t>(line.level == level);
    }
    return nb;
  }

  std::size_t countContaining(log::level::level_enum level, std::string_view needle) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t nb = 0;
    for (const auto& line : _lines) {
      nb += static_cast<std::size_t>(line.level == level && line.payload.find(needle) != std::string::npos);
    }
    return nb;
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return _lines.size();
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    _lines.push_back(CapturedLogLine{msg.level, std::string(msg.payload.data(), msg.payload.size())});
  }

  void flush_() override {}

 private:
  std::vector<CapturedLogLine> _lines;
};

// Replaces the default logger by one writing into a CaptureLogSink, restores the previous one on destruction.
class ScopedLogCapture {
 public:
  ScopedLogCapture() : _previous(spdlog::default_logger()), _sink(std::make_shared<CaptureLogSink>()) {
    auto logger = std::make_shared<spdlog::logger>("framed-capture", _sink);
    logger->set_level(log::level::trace);
    spdlog::set_default_logger(std::move(logger));
  }

  ScopedLogCapture(const ScopedLogCapture&) = delete;
  ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

  ~ScopedLogCapture() { spdlog::set_default_logger(std::move(_previous)); }

  CaptureLogSink& sink() noexcept { return *_sink; }

 private:
  std::shared_ptr<spdlog::logger> _previous;
  std::shared_ptr<CaptureLogSink> _sink;
};

}  // namespace framed::test
