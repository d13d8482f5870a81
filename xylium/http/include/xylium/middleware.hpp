#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "xylium/http-error.hpp"

namespace xylium {

class ExecutionContext;

// Outcome of a handler or a middleware step: success, or an HttpError.
class HandlerResult {
 public:
  // Success.
  HandlerResult() noexcept = default;

  // Failure. Implicit so that handlers can directly 'return HttpError(...)'.
  HandlerResult(HttpError error) noexcept : _error(std::move(error)) {}

  static HandlerResult Ok() noexcept { return {}; }

  [[nodiscard]] bool ok() const noexcept { return !_error.has_value(); }

  [[nodiscard]] bool failed() const noexcept { return _error.has_value(); }

  // Precondition: failed().
  [[nodiscard]] const HttpError& error() const& noexcept { return *_error; }

  // Precondition: failed().
  [[nodiscard]] HttpError&& takeError() && noexcept { return std::move(*_error); }

 private:
  std::optional<HttpError> _error;
};

// Terminal request handler, or one step of a composed chain.
using Handler = std::function<HandlerResult(ExecutionContext&)>;

// A middleware wraps the 'next' handler and returns a new one.
// The returned handler continues the chain by calling next(ctx), which advances the context cursor.
// Not calling it short-circuits the remaining steps. Code placed after the call runs once the inner steps
// returned, whatever their outcome.
using Middleware = std::function<Handler(Handler)>;

}  // namespace xylium
