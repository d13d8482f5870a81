#include "xylium/request-store.hpp"

#include <any>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace xylium {

void RequestStore::set(std::string_view key, std::any value) {
  std::unique_lock lock(_mutex);
  auto it = _values.find(key);
  if (it == _values.end()) {
    _values.emplace(std::string(key), std::move(value));
  } else {
    it->second = std::move(value);
  }
}

std::optional<std::any> RequestStore::get(std::string_view key) const {
  std::shared_lock lock(_mutex);
  const auto it = _values.find(key);
  if (it == _values.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::any RequestStore::mustGet(std::string_view key) const {
  auto value = get(key);
  if (!value) {
    throw std::out_of_range(std::string("Key '").append(key).append("' does not exist in the request store"));
  }
  return std::move(*value);
}

bool RequestStore::contains(std::string_view key) const {
  std::shared_lock lock(_mutex);
  return _values.find(key) != _values.end();
}

bool RequestStore::erase(std::string_view key) {
  std::unique_lock lock(_mutex);
  const auto it = _values.find(key);
  if (it == _values.end()) {
    return false;
  }
  _values.erase(it);
  return true;
}

void RequestStore::clear() {
  std::unique_lock lock(_mutex);
  _values.clear();
}

std::size_t RequestStore::size() const {
  std::shared_lock lock(_mutex);
  return _values.size();
}

}  // namespace xylium
