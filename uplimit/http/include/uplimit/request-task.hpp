#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

namespace uplimit {

// Lazily started coroutine producing a T, typically the HttpResponse of an asynchronous handler.
// The coroutine does not run until resumed, and stays suspended at its end until the result is consumed.
template <class T>
class RequestTask {
 public:
  struct promise_type {
    RequestTask get_return_object() noexcept {
      return RequestTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value = std::move(value); }

    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    // Returns the produced value, or rethrows the exception that escaped the coroutine body.
    T&& consume_result() {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
      return std::move(_value);
    }

    std::exception_ptr _exception;
    T _value{};
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

  // Runs the coroutine until its next suspension point.
  void resume() {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
  }

  // Returns the result of a finished task. Rethrows the exception of the coroutine body, if any.
  // Precondition: valid() && done()
  T result() { return std::move(_coro.promise().consume_result()); }

  // Drives the coroutine to completion from the calling thread and returns its result.
  // Only suitable for coroutines that never wait for a transport (all awaited body chunks are ready).
  T runSynchronously() {
    while (_coro && !_coro.done()) {
      _coro.resume();
    }
    return result();
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

}  // namespace uplimit
