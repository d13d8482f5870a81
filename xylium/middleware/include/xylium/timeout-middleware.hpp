#pragma once

#include <functional>
#include <string>

#include "xylium/execution-context.hpp"
#include "xylium/middleware.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

struct TimeoutConfig {
  // Called once the deadline expired and the rest of the chain returned, with the calling context and the
  // result of the chain. Its result becomes the result of the middleware.
  using ErrorHandler = std::function<HandlerResult(ExecutionContext&, HandlerResult)>;

  // Maximum duration of the rest of the chain. Must be strictly positive.
  Duration timeout{};

  // Client message of the default 503 error. Default: "Request processing timed out after <timeout>."
  std::string message;

  // Replaces the default 503 error policy.
  ErrorHandler errorHandler;

  TimeoutConfig& withTimeout(Duration newTimeout);

  TimeoutConfig& withMessage(std::string newMessage);

  TimeoutConfig& withErrorHandler(ErrorHandler handler);

  // Throws ConfigError if timeout is not strictly positive.
  void validate() const;
};

// Runs the rest of the chain on a worker thread with a derived context, whose cancellation token expires after
// config.timeout. When the deadline is reached first, the token is cancelled (reason DeadlineExceeded), the
// middleware waits for the worker to return, then reports a 503 error unless the response was already
// committed. Downstream handlers are expected to observe their cancellation token to return early.
// Exceptions thrown by the rest of the chain are rethrown in the calling thread.
// Throws ConfigError if config is invalid.
[[nodiscard]] Middleware Timeout(TimeoutConfig config);

[[nodiscard]] inline Middleware Timeout(Duration timeout) { return Timeout(TimeoutConfig{}.withTimeout(timeout)); }

}  // namespace xylium
