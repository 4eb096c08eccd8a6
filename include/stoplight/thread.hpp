#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include "stoplight/stop_token.hpp"

namespace stoplight {
/// Returned by spawn when no worker thread could be started.
struct spawn_error {
  std::error_code code;

  /// Describes the system error that prevented the worker from starting.
  std::string message() const { return code.message(); }
};

/// Returned by join when the worker exited by throwing instead of returning a
/// value. Holds the exception that escaped the task body.
class worker_fault {
 public:
  explicit worker_fault(std::exception_ptr exception);

  /// Describes the captured exception.
  std::string what() const;

  /// Rethrows the captured exception in the calling thread.
  [[noreturn]] void rethrow() const;

  /// Returns the exception that escaped the task body.
  std::exception_ptr exception() const { return captured; }

 private:
  std::exception_ptr captured;
};

/// Value produced by joining a thread<T>. Threads returning void yield
/// std::monostate.
template <typename T>
using join_value_t =
    std::conditional_t<std::is_void_v<T>, std::monostate, T>;

/// A thread paired with a stop signal that the task body polls to discover it
/// has been asked to stop.
///
/// Cancellation is cooperative only: nothing interrupts a worker that does
/// not check its stop_token. Joining such a worker blocks for as long as the
/// worker runs, possibly forever.
///
/// Destroying a thread that was never joined detaches the worker without
/// requesting a stop. Use get_stop_source() beforehand to keep the ability to
/// stop it.
template <typename T>
class thread {
 public:
  using value_type = join_value_t<T>;
  using join_result = std::variant<value_type, worker_fault>;

  /// Starts a worker running body(token) and returns without waiting for it.
  /// Fails with a spawn_error if the worker thread cannot be created.
  template <typename F>
    requires std::is_invocable_r_v<T, F&, const stop_token&>
  static std::variant<thread, spawn_error> spawn(F body) {
    try {
      // The signal exists before the worker that observes it
      auto signal = std::make_shared<stop_signal>();
      std::promise<T> promise;
      std::future<T> future = promise.get_future();

      auto task = [promise = std::move(promise), callable = std::move(body),
                   token = stop_token(signal)]() mutable {
        try {
          // Store the body's return value in the promise if it has one
          if constexpr (std::is_void_v<T>) {
            std::invoke(callable, std::as_const(token));
            promise.set_value();
          } else {
            promise.set_value(std::invoke(callable, std::as_const(token)));
          }
        } catch (...) {
          // Hand the exception to the joining thread instead of terminating
          promise.set_exception(std::current_exception());
        }
      };

      std::thread worker(std::move(task));
      return thread(std::move(worker), std::move(signal), std::move(future));
    } catch (const std::system_error& error) {
      return spawn_error{error.code()};
    } catch (const std::bad_alloc&) {
      return spawn_error{std::make_error_code(std::errc::not_enough_memory)};
    }
  }

  thread(thread&&) noexcept = default;

  thread& operator=(thread&& other) noexcept {
    if (this != &other) {
      release();
      worker = std::move(other.worker);
      signal = std::move(other.signal);
      result = std::move(other.result);
    }
    return *this;
  }

  thread(const thread&) = delete;
  thread& operator=(const thread&) = delete;

  ~thread() { release(); }

  /// Requests a stop, blocks until the worker exits, then returns the value
  /// the body produced or the worker_fault it threw. The thread is consumed;
  /// joining it again throws std::logic_error.
  join_result join() && {
    if (!worker.joinable()) {
      throw std::logic_error("stoplight::thread has already been joined");
    }

    signal->request_stop();
    worker.join();

    try {
      if constexpr (std::is_void_v<T>) {
        result.get();
        return join_result(std::in_place_index<0>);
      } else {
        return join_result(std::in_place_index<0>, result.get());
      }
    } catch (...) {
      return join_result(std::in_place_index<1>, std::current_exception());
    }
  }

  /// Requests a stop without waiting for the worker. Returns true only if this
  /// call set the stop state, and false on a moved-from thread.
  bool request_stop() { return signal && signal->request_stop(); }

  /// Checks if a stop has been requested on this thread's signal. A
  /// moved-from thread has no signal and reports false.
  bool stop_requested() const { return signal && signal->stop_requested(); }

  /// Returns a handle that can request a stop even after this thread object
  /// is gone. The handle has no stop state if this thread was moved from.
  stop_source get_stop_source() const { return stop_source(signal); }

  /// Checks if this thread still owns a worker that has not been joined.
  bool joinable() const noexcept { return worker.joinable(); }

  /// Returns the id of the worker, or a default id once joined or moved from.
  std::thread::id get_id() const noexcept { return worker.get_id(); }

 private:
  thread(std::thread worker,
         std::shared_ptr<stop_signal> signal,
         std::future<T> result)
      : worker(std::move(worker)),
        signal(std::move(signal)),
        result(std::move(result)) {}

  void release() noexcept {
    if (worker.joinable()) {
      worker.detach();
    }
  }

  std::thread worker;
  std::shared_ptr<stop_signal> signal;
  std::future<T> result;
};

/// Spawns a stoppable thread, deducing its value type from the body.
template <typename F>
  requires std::is_invocable_v<F&, const stop_token&>
auto spawn(F body) {
  using R = std::remove_cvref_t<std::invoke_result_t<F&, const stop_token&>>;
  return thread<R>::spawn(std::move(body));
}
}  // namespace stoplight
