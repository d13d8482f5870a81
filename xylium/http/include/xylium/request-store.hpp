#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xylium {

// Request-scoped key/value store shared by an ExecutionContext and all the contexts derived from it.
// Values are type-erased (std::any). Every operation locks the store only for its own duration, so it can be
// used from a task spawned by a handler while the main request flow goes on.
class RequestStore {
 public:
  RequestStore() = default;

  RequestStore(const RequestStore&) = delete;
  RequestStore(RequestStore&&) = delete;
  RequestStore& operator=(const RequestStore&) = delete;
  RequestStore& operator=(RequestStore&&) = delete;

  ~RequestStore() = default;

  // Sets the value for key, replacing any previous one.
  void set(std::string_view key, std::any value);

  // Returns a copy of the value stored for key, or std::nullopt if absent.
  [[nodiscard]] std::optional<std::any> get(std::string_view key) const;

  // Returns a copy of the value for key if present and holding a T, std::nullopt otherwise.
  template <class T>
  [[nodiscard]] std::optional<T> getAs(std::string_view key) const {
    std::shared_lock lock(_mutex);
    const auto it = _values.find(key);
    if (it == _values.end()) {
      return std::nullopt;
    }
    const T* pValue = std::any_cast<T>(&it->second);
    if (pValue == nullptr) {
      return std::nullopt;
    }
    return *pValue;
  }

  // Returns the value for key. Throws std::out_of_range if absent.
  [[nodiscard]] std::any mustGet(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const;

  // Removes key. Returns true if it was present.
  bool erase(std::string_view key);

  // Removes all keys, keeping the allocated buckets.
  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] bool empty() const { return size() == 0; }

 private:
  struct TransparentHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
  };

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, std::any, TransparentHash, std::equal_to<>> _values;
};

}  // namespace xylium
