#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace xylium {

// Thrown at setup time when a route, a middleware or a configuration object is ill-formed.
// It signals a programming mistake that must be fixed before serving any traffic, so callers are
// expected to let it abort their initialization (or report it cleanly and exit).
class ConfigError : public std::invalid_argument {
 public:
  explicit ConfigError(const char* msg) : std::invalid_argument(msg) {}

  template <typename... Args>
  explicit ConfigError(fmt::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(fmt::format(fmt, std::forward<Args>(args)...)) {}
};

}  // namespace xylium
