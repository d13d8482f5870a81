#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>

#include "xylium/timedef.hpp"

namespace xylium {

// Cooperative cancellation and deadline handle attached to an ExecutionContext.
//
// Tokens form a tree: a child is cancelled when its parent is, never the reverse. Cancellation is advisory,
// it never interrupts a running handler. Handlers are expected to poll isCancelled() or to register a
// std::stop_callback on stopToken() and return early.
//
// A deadline is checked lazily: isCancelled() turns an expired token into a cancelled one
// (reason DeadlineExceeded). Callbacks registered on stopToken() therefore only run for an expired
// deadline once somebody observed it or explicitly cancelled the token (the timeout middleware does).
//
// Copies of a token share the same state. A default constructed token is null and must not be used as a
// context token.
class CancellationToken {
 public:
  enum class Reason : std::uint8_t { None, Cancelled, DeadlineExceeded };

  CancellationToken() noexcept = default;

  // Returns the root token: never cancelled, no deadline.
  static CancellationToken Background();

  // Returns a new child token of parent. Throws std::invalid_argument if parent is null.
  static CancellationToken WithCancel(const CancellationToken& parent);

  // Returns a new child token of parent, expiring at deadline (or earlier if the parent expires before).
  // Throws std::invalid_argument if parent is null.
  static CancellationToken WithDeadline(const CancellationToken& parent, SteadyTimePoint deadline);

  static CancellationToken WithTimeout(const CancellationToken& parent, Duration timeout) {
    return WithDeadline(parent, SteadyClock::now() + timeout);
  }

  [[nodiscard]] bool isNull() const noexcept { return !_state; }

  explicit operator bool() const noexcept { return static_cast<bool>(_state); }

  // Cancels this token and all its descendants with given reason.
  // No-op on a null token, on the root token, or if it is already cancelled.
  void cancel(Reason reason = Reason::Cancelled) const;

  [[nodiscard]] bool isCancelled() const;

  // Reason of the cancellation, or None if not cancelled (yet).
  [[nodiscard]] Reason reason() const;

  [[nodiscard]] std::optional<SteadyTimePoint> deadline() const noexcept;

  // Token usable with std::stop_callback and std::condition_variable_any. Empty for the root and null tokens.
  [[nodiscard]] std::stop_token stopToken() const noexcept;

  // Two tokens are equal if they share the same state.
  bool operator==(const CancellationToken& other) const noexcept { return _state == other._state; }

 private:
  struct State;

  explicit CancellationToken(std::shared_ptr<State> state) noexcept;

  std::shared_ptr<State> _state;
};

}  // namespace xylium
