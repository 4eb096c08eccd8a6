#pragma once

#include <atomic>
#include <memory>

namespace stoplight {
/// Represents a signal for cooperatively interrupting threads. Maintains a
/// one-way stop state that can be set and queried in a thread-safe manner.
/// Once a stop has been requested the state never returns to unset.
class stop_signal {
 public:
  stop_signal() = default;

  stop_signal(const stop_signal&) = delete;
  stop_signal& operator=(const stop_signal&) = delete;

  /// Signals to request the stopping of the associated thread. Returns true
  /// only for the call that actually set the stop state.
  bool request_stop();

  /// Checks if a stop has been requested. Never blocks.
  bool stop_requested() const;

 private:
  std::atomic<bool> stop{false};
};

/// Token that can be used to check if a stop has been requested. Shares
/// ownership of its stop_signal, so copies may be handed to other threads.
class stop_token {
 public:
  /// Constructs a stop_token observing the given stop_signal.
  explicit stop_token(std::shared_ptr<const stop_signal> signal);

  /// Checks if the associated stop_signal has requested a stop. A token
  /// without a stop_signal never reports a stop.
  bool stop_requested() const;

 private:
  std::shared_ptr<const stop_signal> signal;
};

/// Writable handle to a stop_signal. Allows a stop to be requested
/// independently of joining the thread that observes the signal.
class stop_source {
 public:
  /// Constructs a stop_source with a fresh, unset stop_signal.
  stop_source();

  /// Constructs a stop_source sharing an existing stop_signal.
  explicit stop_source(std::shared_ptr<stop_signal> signal);

  /// Requests a stop on the associated stop_signal. Returns false if there is
  /// no stop_signal.
  bool request_stop() const;

  /// Checks if the associated stop_signal has requested a stop.
  bool stop_requested() const;

  /// Returns a token observing the same stop_signal.
  stop_token get_token() const;

 private:
  std::shared_ptr<stop_signal> signal;
};
}  // namespace stoplight
