#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace portico {

template <class T>
class RequestTask;

namespace internal {

// State shared by every RequestTask promise: who to resume on completion and what escaped the body.
struct RequestTaskPromiseBase {
  struct FinalAwaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    // Symmetric transfer to the awaiting task. The outermost task returns to whoever resumed it.
    template <class Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> done) const noexcept {
      const std::coroutine_handle<> next = done.promise().continuation;
      return next ? next : std::noop_coroutine();
    }

    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() const noexcept { return {}; }
  FinalAwaiter final_suspend() const noexcept { return {}; }

  void unhandled_exception() noexcept { exception = std::current_exception(); }

  void rethrowIfFailed() const {
    if (exception) {
      std::rethrow_exception(exception);
    }
  }

  std::coroutine_handle<> continuation;
  std::exception_ptr exception;
};

template <class T>
struct RequestTaskPromise : RequestTaskPromiseBase {
  RequestTask<T> get_return_object() noexcept;

  template <class U = T>
  void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
    result.emplace(std::forward<U>(value));
  }

  T take() {
    rethrowIfFailed();
    return std::move(*result);
  }

  std::optional<T> result;
};

template <>
struct RequestTaskPromise<void> : RequestTaskPromiseBase {
  RequestTask<void> get_return_object() noexcept;

  void return_void() const noexcept {}

  void take() const { rethrowIfFailed(); }
};

}  // namespace internal

// Lazy coroutine type of request handlers and of everything they co_await.
// Nothing runs until the task is resumed (by the HandlerSupervisor for a handler) or co_awaited by another task,
// in which case the awaiting task is resumed by symmetric transfer once this one completes.
// The task owns its frame: destroying a suspended task destroys the frame and the locals it holds.
template <class T>
class RequestTask {
 public:
  using promise_type = internal::RequestTaskPromise<T>;
  using Handle = std::coroutine_handle<promise_type>;

  RequestTask() noexcept = default;
  explicit RequestTask(Handle coro) noexcept : _coro(coro) {}

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

  auto operator co_await() && noexcept {
    struct Awaiter {
      Handle coro;

      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) const noexcept {
        coro.promise().continuation = awaiting;
        return coro;
      }

      T await_resume() const { return coro.promise().take(); }
    };
    return Awaiter{_coro};
  }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Entry resume point of the task.
  [[nodiscard]] Handle handle() const noexcept { return _coro; }

  void resume() const {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
  }

  // Resumes until completion without any scheduler, then returns the result or rethrows the body's exception.
  // Only meaningful for tasks whose suspensions complete immediately, or that are already done.
  T runSynchronously() {
    while (!done()) {
      _coro.resume();
    }
    if constexpr (std::is_void_v<T>) {
      if (_coro) {
        _coro.promise().take();
      }
    } else {
      return _coro.promise().take();
    }
  }

  void reset() noexcept {
    if (_coro) {
      std::exchange(_coro, {}).destroy();
    }
  }

 private:
  Handle _coro;
};

namespace internal {

template <class T>
RequestTask<T> RequestTaskPromise<T>::get_return_object() noexcept {
  return RequestTask<T>{std::coroutine_handle<RequestTaskPromise<T>>::from_promise(*this)};
}

inline RequestTask<void> RequestTaskPromise<void>::get_return_object() noexcept {
  return RequestTask<void>{std::coroutine_handle<RequestTaskPromise<void>>::from_promise(*this)};
}

}  // namespace internal

}  // namespace portico
