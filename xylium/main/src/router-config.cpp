#include "xylium/router-config.hpp"

#include <cstddef>
#include <memory>
#include <utility>

#include "xylium/config-error.hpp"
#include "xylium/log.hpp"
#include "xylium/mode.hpp"

namespace xylium {

RouterConfig& RouterConfig::withMode(Mode newMode) {
  mode = newMode;
  return *this;
}

RouterConfig& RouterConfig::withContextPoolInitialCapacity(std::size_t capacity) {
  contextPoolInitialCapacity = capacity;
  return *this;
}

RouterConfig& RouterConfig::withLogger(std::shared_ptr<log::logger> newLogger) {
  logger = std::move(newLogger);
  return *this;
}

void RouterConfig::validate() const {
  if (mode != Mode::Debug && mode != Mode::Test && mode != Mode::Release) {
    throw ConfigError("Invalid router mode {}", static_cast<int>(mode));
  }
  if (contextPoolInitialCapacity > kMaxContextPoolInitialCapacity) {
    throw ConfigError("Context pool initial capacity {} exceeds the maximum of {}", contextPoolInitialCapacity,
                      kMaxContextPoolInitialCapacity);
  }
}

}  // namespace xylium
