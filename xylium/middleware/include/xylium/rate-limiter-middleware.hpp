#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "xylium/execution-context.hpp"
#include "xylium/limiter-store.hpp"
#include "xylium/middleware.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

struct RateLimiterConfig {
  // Which responses carry the X-RateLimit-Limit, X-RateLimit-Remaining and X-RateLimit-Reset headers.
  enum class HeaderPolicy : std::uint8_t { Always, OnLimit, Never };

  // Format of the Retry-After and X-RateLimit-Reset values.
  enum class RetryAfterMode : std::uint8_t { Seconds, HttpDate };

  using KeyGenerator = std::function<std::string(ExecutionContext&)>;
  using SkipPredicate = std::function<bool(ExecutionContext&)>;
  using MessageGenerator = std::function<std::string(ExecutionContext&, const LimitDecision&)>;

  // Maximum number of requests per key and per window. Must be strictly positive.
  int64_t maxRequests{};

  // Duration of a window. Must be strictly positive.
  Duration window{};

  // Client message of the 429 error. Default: "Rate limit exceeded. Try again in <n> seconds."
  std::string message;

  // Takes precedence over message if set.
  MessageGenerator messageGenerator;

  // Default: ExecutionContext::realIp().
  KeyGenerator keyGenerator;

  // Requests for which it returns true are not counted. Default: none.
  SkipPredicate skip;

  // Default: an InMemoryLimiterStore owned by the middleware.
  std::shared_ptr<LimiterStore> store;

  HeaderPolicy headerPolicy{HeaderPolicy::Always};

  RetryAfterMode retryAfterMode{RetryAfterMode::Seconds};

  RateLimiterConfig& withMaxRequests(int64_t newMaxRequests);

  RateLimiterConfig& withWindow(Duration newWindow);

  RateLimiterConfig& withMessage(std::string newMessage);

  RateLimiterConfig& withMessageGenerator(MessageGenerator generator);

  RateLimiterConfig& withKeyGenerator(KeyGenerator generator);

  RateLimiterConfig& withSkip(SkipPredicate predicate);

  RateLimiterConfig& withStore(std::shared_ptr<LimiterStore> newStore);

  RateLimiterConfig& withHeaderPolicy(HeaderPolicy policy);

  RateLimiterConfig& withRetryAfterMode(RetryAfterMode mode);

  // Throws ConfigError if maxRequests or window is not strictly positive.
  void validate() const;
};

// Counts requests per key in fixed windows, and rejects them with a 429 error carrying a Retry-After header
// once maxRequests is exceeded.
// Throws ConfigError if config is invalid.
[[nodiscard]] Middleware RateLimiter(RateLimiterConfig config);

}  // namespace xylium
