#include "xylium/in-memory-limiter-store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "xylium/config-error.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/limiter-store.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

InMemoryLimiterStoreConfig& InMemoryLimiterStoreConfig::withCleanupInterval(Duration interval) {
  cleanupInterval = interval;
  return *this;
}

void InMemoryLimiterStoreConfig::validate() const {
  if (cleanupInterval < Duration::zero()) {
    throw ConfigError("Limiter store cleanup interval cannot be negative");
  }
}

InMemoryLimiterStore::InMemoryLimiterStore(InMemoryLimiterStoreConfig config, FieldLogger logger)
    : _logger(std::move(logger).withField("component", "InMemoryLimiterStore")),
      _cleanupInterval(config.cleanupInterval) {
  config.validate();
  if (_cleanupInterval > Duration::zero()) {
    _logger.debug("Starting cleanup thread with an interval of {} ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(_cleanupInterval).count());
    _cleanupThread = std::jthread([this](std::stop_token stopToken) { cleanupLoop(std::move(stopToken)); });
  }
}

InMemoryLimiterStore::~InMemoryLimiterStore() { close(); }

LimitDecision InMemoryLimiterStore::allow(std::string_view key, int64_t limit, Duration window) {
  const SteadyTimePoint now = SteadyClock::now();

  std::lock_guard lock(_mutex);
  auto it = _visitors.find(key);
  if (it == _visitors.end()) {
    it = _visitors.emplace(std::string(key), Visitor{}).first;
  }
  Visitor& visitor = it->second;
  if (visitor.count == 0 || now > visitor.windowEnds) {
    visitor.count = 1;
    visitor.windowEnds = now + window;
    return LimitDecision{true, 1, limit, visitor.windowEnds};
  }
  ++visitor.count;
  return LimitDecision{visitor.count <= limit, visitor.count, limit, visitor.windowEnds};
}

void InMemoryLimiterStore::close() {
  if (_cleanupThread.joinable()) {
    _cleanupThread.request_stop();
    _cleanupThread.join();
    _logger.debug("Cleanup thread stopped");
  }
}

std::size_t InMemoryLimiterStore::purgeExpired() {
  const SteadyTimePoint now = SteadyClock::now();

  std::size_t nbPurged = 0;
  {
    std::lock_guard lock(_mutex);
    for (auto it = _visitors.begin(); it != _visitors.end();) {
      if (now > it->second.windowEnds) {
        it = _visitors.erase(it);
        ++nbPurged;
      } else {
        ++it;
      }
    }
  }
  if (nbPurged != 0) {
    _logger.debug("Purged {} expired rate limit entries", nbPurged);
  }
  return nbPurged;
}

std::size_t InMemoryLimiterStore::size() const {
  std::lock_guard lock(_mutex);
  return _visitors.size();
}

void InMemoryLimiterStore::cleanupLoop(std::stop_token stopToken) {
  while (true) {
    {
      std::unique_lock lock(_mutex);
      if (_cleanupCv.wait_for(lock, stopToken, _cleanupInterval,
                              [&stopToken] { return stopToken.stop_requested(); })) {
        return;
      }
    }
    purgeExpired();
  }
}

}  // namespace xylium
