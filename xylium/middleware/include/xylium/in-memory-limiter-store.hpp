#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "xylium/field-logger.hpp"
#include "xylium/limiter-store.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

struct InMemoryLimiterStoreConfig {
  static constexpr Duration kDefaultCleanupInterval = std::chrono::minutes(10);

  // Period of the background sweep of expired windows. Zero disables the sweep thread.
  Duration cleanupInterval{kDefaultCleanupInterval};

  InMemoryLimiterStoreConfig& withCleanupInterval(Duration interval);

  // Throws ConfigError if cleanupInterval is negative.
  void validate() const;
};

// Fixed window counters kept in process memory.
// The first request of a key (or the first one after its window expired) opens a new window of given duration.
class InMemoryLimiterStore : public LimiterStore {
 public:
  // Throws ConfigError if config is invalid.
  explicit InMemoryLimiterStore(InMemoryLimiterStoreConfig config = {}, FieldLogger logger = {});

  InMemoryLimiterStore(const InMemoryLimiterStore&) = delete;
  InMemoryLimiterStore(InMemoryLimiterStore&&) = delete;
  InMemoryLimiterStore& operator=(const InMemoryLimiterStore&) = delete;
  InMemoryLimiterStore& operator=(InMemoryLimiterStore&&) = delete;

  ~InMemoryLimiterStore() override;

  LimitDecision allow(std::string_view key, int64_t limit, Duration window) override;

  // Stops the cleanup thread. Idempotent.
  void close() override;

  // Removes all keys whose window ended. Returns the number of removed keys.
  std::size_t purgeExpired();

  // Number of tracked keys.
  [[nodiscard]] std::size_t size() const;

 private:
  struct Visitor {
    int64_t count{};
    SteadyTimePoint windowEnds;
  };

  struct TransparentHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
  };

  void cleanupLoop(std::stop_token stopToken);

  FieldLogger _logger;
  Duration _cleanupInterval;
  mutable std::mutex _mutex;
  std::condition_variable_any _cleanupCv;
  std::unordered_map<std::string, Visitor, TransparentHash, std::equal_to<>> _visitors;
  std::jthread _cleanupThread;
};

}  // namespace xylium
