#include "xylium/timeout-middleware.hpp"

#include <fmt/format.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/config-error.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/middleware.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

namespace {

std::string FormatTimeout(Duration timeout) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
  if (millis.count() != 0 && millis.count() % 1000 == 0) {
    return fmt::format("{}s", millis.count() / 1000);
  }
  if (millis.count() != 0) {
    return fmt::format("{}ms", millis.count());
  }
  return fmt::format("{}us", std::chrono::duration_cast<std::chrono::microseconds>(timeout).count());
}

HandlerResult DefaultTimeoutErrorHandler(const TimeoutConfig& config, ExecutionContext& ctx,
                                         HandlerResult workerResult) {
  const FieldLogger logger = ctx.logger().withField("middleware", "Timeout");
  const std::string timeoutStr = FormatTimeout(config.timeout);
  if (ctx.responseCommitted()) {
    logger.warn("Request {} {} timed out after {}, but the response was already committed", ctx.method(), ctx.path(),
                timeoutStr);
    return workerResult;
  }
  logger.warn("Request {} {} timed out after {}, responding with {}", ctx.method(), ctx.path(), timeoutStr,
              http::StatusCodeServiceUnavailable);
  std::string message =
      config.message.empty() ? fmt::format("Request processing timed out after {}.", timeoutStr) : config.message;
  return HttpError(http::StatusCodeServiceUnavailable, std::move(message)).withInternal("context deadline exceeded");
}

}  // namespace

TimeoutConfig& TimeoutConfig::withTimeout(Duration newTimeout) {
  timeout = newTimeout;
  return *this;
}

TimeoutConfig& TimeoutConfig::withMessage(std::string newMessage) {
  message = std::move(newMessage);
  return *this;
}

TimeoutConfig& TimeoutConfig::withErrorHandler(ErrorHandler handler) {
  errorHandler = std::move(handler);
  return *this;
}

void TimeoutConfig::validate() const {
  if (timeout <= Duration::zero()) {
    throw ConfigError("Timeout middleware duration must be strictly positive, got {} ns",
                      std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
  }
}

Middleware Timeout(TimeoutConfig config) {
  config.validate();
  auto pConfig = std::make_shared<const TimeoutConfig>(std::move(config));
  return [pConfig](Handler next) -> Handler {
    return [pConfig, next = std::move(next)](ExecutionContext& ctx) -> HandlerResult {
      const CancellationToken token = CancellationToken::WithTimeout(ctx.cancellationToken(), pConfig->timeout);
      ExecutionContext derived = ctx.derive(token);

      // The worker refers to derived and next, both outliving it as it is always joined before returning.
      std::future<HandlerResult> worker = std::async(std::launch::async, [&next, &derived] { return next(derived); });

      const SteadyTimePoint deadline = token.deadline().value_or(SteadyClock::now() + pConfig->timeout);
      if (worker.wait_until(deadline) == std::future_status::ready) {
        return worker.get();
      }

      token.cancel(CancellationToken::Reason::DeadlineExceeded);
      // Never give back the context to the pool while the worker still uses it.
      HandlerResult workerResult = worker.get();

      if (pConfig->errorHandler) {
        return pConfig->errorHandler(ctx, std::move(workerResult));
      }
      return DefaultTimeoutErrorHandler(*pConfig, ctx, std::move(workerResult));
    };
  };
}

}  // namespace xylium
