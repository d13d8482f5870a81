#include "xylium/cancellation-token.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <utility>

#include "xylium/timedef.hpp"

namespace xylium {

struct CancellationToken::State {
  struct PropagateCancel {
    void operator()() const noexcept { child->requestCancel(parent->reason.load(std::memory_order_acquire)); }

    State* child;
    const State* parent;
  };

  explicit State(bool cancellable) : source(cancellable ? std::stop_source() : std::stop_source(std::nostopstate)) {}

  void requestCancel(Reason cancelReason) noexcept {
    if (!source.stop_possible()) {
      return;
    }
    Reason expected = Reason::None;
    if (reason.compare_exchange_strong(expected, cancelReason, std::memory_order_acq_rel)) {
      source.request_stop();
    }
  }

  std::stop_source source;
  std::optional<SteadyTimePoint> deadline;
  std::atomic<Reason> reason{Reason::None};
  // Keeps the parent alive as long as the link below may fire.
  std::shared_ptr<const State> parent;
  // Declared last so that it is unregistered first on destruction.
  std::optional<std::stop_callback<PropagateCancel>> parentLink;
};

CancellationToken::CancellationToken(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

CancellationToken CancellationToken::Background() {
  static const auto kBackgroundState = std::make_shared<State>(false);
  return CancellationToken(kBackgroundState);
}

CancellationToken CancellationToken::WithCancel(const CancellationToken& parent) {
  if (!parent._state) {
    throw std::invalid_argument("Cannot derive a cancellation token from a null parent");
  }
  auto state = std::make_shared<State>(true);
  state->deadline = parent._state->deadline;
  state->parent = parent._state;
  // Invoked immediately if the parent is already cancelled.
  state->parentLink.emplace(parent._state->source.get_token(),
                            State::PropagateCancel{state.get(), parent._state.get()});
  return CancellationToken(std::move(state));
}

CancellationToken CancellationToken::WithDeadline(const CancellationToken& parent, SteadyTimePoint deadline) {
  CancellationToken child = WithCancel(parent);
  child._state->deadline = child._state->deadline ? std::min(*child._state->deadline, deadline) : deadline;
  return child;
}

void CancellationToken::cancel(Reason reason) const {
  if (_state) {
    _state->requestCancel(reason == Reason::None ? Reason::Cancelled : reason);
  }
}

bool CancellationToken::isCancelled() const {
  if (!_state) {
    return false;
  }
  if (_state->source.stop_requested()) {
    return true;
  }
  if (_state->deadline && SteadyClock::now() >= *_state->deadline) {
    _state->requestCancel(Reason::DeadlineExceeded);
    return true;
  }
  return false;
}

CancellationToken::Reason CancellationToken::reason() const {
  if (!isCancelled()) {
    return Reason::None;
  }
  return _state->reason.load(std::memory_order_acquire);
}

std::optional<SteadyTimePoint> CancellationToken::deadline() const noexcept {
  if (!_state) {
    return std::nullopt;
  }
  return _state->deadline;
}

std::stop_token CancellationToken::stopToken() const noexcept {
  if (!_state) {
    return {};
  }
  return _state->source.get_token();
}

}  // namespace xylium
