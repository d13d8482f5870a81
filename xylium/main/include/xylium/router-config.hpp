#pragma once

#include <cstddef>
#include <memory>

#include "xylium/log.hpp"
#include "xylium/mode.hpp"

namespace xylium {

struct RouterConfig {
  static constexpr std::size_t kMaxContextPoolInitialCapacity = 1UL << 16;

  // Operating mode. Debug mode exposes internal error causes in default error responses.
  // When no logger is given, Debug and Test set the level of the router logger to debug, Release to info.
  // Default: Release
  Mode mode{Mode::Release};

  // Number of execution contexts allocated upfront by the router.
  // Default: 0 (contexts are created lazily on the first concurrent requests)
  std::size_t contextPoolInitialCapacity{};

  // Logger used by the router and given to all execution contexts. Its level is left untouched.
  // If null, the router creates its own logger named "xylium", writing to the sinks of the spdlog default logger.
  std::shared_ptr<log::logger> logger;

  RouterConfig& withMode(Mode newMode);

  RouterConfig& withContextPoolInitialCapacity(std::size_t capacity);

  RouterConfig& withLogger(std::shared_ptr<log::logger> newLogger);

  // Throws ConfigError if a value is invalid.
  void validate() const;
};

}  // namespace xylium
