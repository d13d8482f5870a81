#pragma once

#include <cstdint>
#include <string_view>

#include "xylium/timedef.hpp"

namespace xylium {

struct LimitDecision {
  bool allowed{};
  // Number of requests seen for the key in the current window, including this one.
  int64_t count{};
  int64_t limit{};
  SteadyTimePoint windowEnds;
};

// Counter storage of the rate limiter middleware. Implementations must be thread safe.
class LimiterStore {
 public:
  virtual ~LimiterStore() = default;

  // Records one request for key, and tells whether it stays within limit requests per window.
  virtual LimitDecision allow(std::string_view key, int64_t limit, Duration window) = 0;

  // Releases background resources. Idempotent.
  virtual void close() = 0;
};

}  // namespace xylium
