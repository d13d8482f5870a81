#include "xylium/rate-limiter-middleware.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <utility>

#include "xylium/config-error.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-constants.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/in-memory-limiter-store.hpp"
#include "xylium/limiter-store.hpp"
#include "xylium/middleware.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

namespace {

// RFC 9110 IMF-fixdate, for instance "Sun, 06 Nov 1994 08:49:37 GMT".
std::string FormatHttpDate(SysTimePoint tp) {
  return fmt::format("{:%a, %d %b %Y %H:%M:%S} GMT", fmt::gmtime(SysClock::to_time_t(tp)));
}

void SetRateLimitHeaders(ExecutionContext& ctx, const LimitDecision& decision, int64_t remaining,
                         const std::string& resetValue) {
  ctx.setHeader(http::XRateLimitLimit, fmt::format("{}", decision.limit));
  ctx.setHeader(http::XRateLimitRemaining, fmt::format("{}", remaining));
  ctx.setHeader(http::XRateLimitReset, resetValue);
}

}  // namespace

RateLimiterConfig& RateLimiterConfig::withMaxRequests(int64_t newMaxRequests) {
  maxRequests = newMaxRequests;
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withWindow(Duration newWindow) {
  window = newWindow;
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withMessage(std::string newMessage) {
  message = std::move(newMessage);
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withMessageGenerator(MessageGenerator generator) {
  messageGenerator = std::move(generator);
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withKeyGenerator(KeyGenerator generator) {
  keyGenerator = std::move(generator);
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withSkip(SkipPredicate predicate) {
  skip = std::move(predicate);
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withStore(std::shared_ptr<LimiterStore> newStore) {
  store = std::move(newStore);
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withHeaderPolicy(HeaderPolicy policy) {
  headerPolicy = policy;
  return *this;
}

RateLimiterConfig& RateLimiterConfig::withRetryAfterMode(RetryAfterMode mode) {
  retryAfterMode = mode;
  return *this;
}

void RateLimiterConfig::validate() const {
  if (maxRequests <= 0) {
    throw ConfigError("Rate limiter maxRequests must be strictly positive, got {}", maxRequests);
  }
  if (window <= Duration::zero()) {
    throw ConfigError("Rate limiter window must be strictly positive");
  }
}

Middleware RateLimiter(RateLimiterConfig config) {
  config.validate();
  if (!config.keyGenerator) {
    config.keyGenerator = [](ExecutionContext& ctx) { return std::string(ctx.realIp()); };
  }
  if (!config.store) {
    config.store = std::make_shared<InMemoryLimiterStore>();
  }
  auto pConfig = std::make_shared<const RateLimiterConfig>(std::move(config));
  return [pConfig](Handler next) -> Handler {
    return [pConfig, next = std::move(next)](ExecutionContext& ctx) -> HandlerResult {
      const RateLimiterConfig& cfg = *pConfig;
      const FieldLogger logger = ctx.logger().withField("middleware", "RateLimiter");
      if (cfg.skip && cfg.skip(ctx)) {
        logger.debug("Skipping rate limit for {} {}", ctx.method(), ctx.path());
        return next(ctx);
      }

      const std::string key = cfg.keyGenerator(ctx);
      const LimitDecision decision = cfg.store->allow(key, cfg.maxRequests, cfg.window);

      const auto timeToReset = std::max(decision.windowEnds - SteadyClock::now(), Duration::zero());
      const int64_t secondsToReset = std::chrono::duration_cast<std::chrono::seconds>(timeToReset).count();
      const int64_t remaining = decision.allowed ? std::max(decision.limit - decision.count, int64_t{0}) : 0;

      std::string resetValue;
      if (cfg.retryAfterMode == RateLimiterConfig::RetryAfterMode::HttpDate) {
        resetValue = FormatHttpDate(
            std::chrono::time_point_cast<SysClock::duration>(SysClock::now() + timeToReset));
      } else {
        resetValue = fmt::format("{}", secondsToReset);
      }

      if (!decision.allowed) {
        logger.warn("Limit exceeded for key '{}' on {} {} ({}/{}), window ends in {} s", key, ctx.method(), ctx.path(),
                    decision.count, decision.limit, secondsToReset);
        ctx.setHeader(http::RetryAfter, resetValue);
        if (cfg.headerPolicy != RateLimiterConfig::HeaderPolicy::Never) {
          SetRateLimitHeaders(ctx, decision, remaining, resetValue);
        }
        std::string message;
        if (cfg.messageGenerator) {
          message = cfg.messageGenerator(ctx, decision);
        } else if (!cfg.message.empty()) {
          message = cfg.message;
        } else {
          message = fmt::format("Rate limit exceeded. Try again in {} seconds.", secondsToReset);
        }
        return HttpError(http::StatusCodeTooManyRequests, std::move(message));
      }

      logger.debug("Request allowed for key '{}' on {} {} ({}/{})", key, ctx.method(), ctx.path(), decision.count,
                   decision.limit);
      if (cfg.headerPolicy == RateLimiterConfig::HeaderPolicy::Always) {
        SetRateLimitHeaders(ctx, decision, remaining, resetValue);
      }
      return next(ctx);
    };
  };
}

}  // namespace xylium
