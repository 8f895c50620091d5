#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace framed {

template <class T>
class RequestTask;

namespace detail {

struct RequestTaskPromiseBase {
  // Lazy start: nothing runs until the owner resumes the task.
  std::suspend_always initial_suspend() noexcept { return {}; }
  std::suspend_always final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  void rethrowIfNeeded() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  std::exception_ptr _exception;
};

template <class T>
struct RequestTaskPromise : RequestTaskPromiseBase {
  void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value.emplace(std::move(value)); }

  T consumeResult() {
    rethrowIfNeeded();
    return std::move(*_value);
  }

  std::optional<T> _value;
};

template <>
struct RequestTaskPromise<void> : RequestTaskPromiseBase {
  void return_void() const noexcept {}

  void consumeResult() const { rethrowIfNeeded(); }
};

}  // namespace detail

// Move-only owner of a lazily started coroutine producing a T (or nothing for T = void).
// The task is driven by whoever owns it (typically the connection's event loop) through resume() or step().
// Destroying the task destroys the coroutine frame, which cancels any in-flight work.
template <class T>
class RequestTask {
 public:
  using value_type = T;

  struct promise_type : detail::RequestTaskPromise<T> {
    RequestTask get_return_object() noexcept {
      return RequestTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  void resume() {
    if (!done()) {
      _coro.resume();
    }
  }

  // Resumes the coroutine once if it is not finished yet. Returns true when it is done.
  bool step() {
    resume();
    return done();
  }

  // Returns the produced value, or rethrows the exception that escaped the coroutine.
  // An empty RequestTask<void> has nothing to report. Throws std::logic_error on an unfinished task,
  // and on an empty task producing a value.
  T consumeResult() {
    if (!_coro) {
      if constexpr (std::is_void_v<T>) {
        return;
      } else {
        throw std::logic_error("Cannot consume the result of an empty RequestTask");
      }
    }
    if (!_coro.done()) {
      throw std::logic_error("Cannot consume the result of an unfinished RequestTask");
    }
    return _coro.promise().consumeResult();
  }

  T runSynchronously() {
    while (!step()) {
    }
    return consumeResult();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace framed
