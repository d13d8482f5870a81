#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "xylium/vector.hpp"

namespace xylium {

// A value captured from the request path by a ':name' or '*name' pattern segment.
// 'name' refers to the pattern stored in the PathTree, it stays valid as long as the tree is alive.
struct PathParam {
  std::string_view name;
  std::string value;

  bool operator==(const PathParam&) const noexcept = default;
};

// Captured parameters in pattern order. Names are unique within a route.
using PathParams = vector<PathParam>;

// Returns the value of the parameter with given name, or std::nullopt if the route has no such capture.
inline std::optional<std::string_view> FindPathParam(const PathParams& params, std::string_view name) noexcept {
  for (const PathParam& param : params) {
    if (param.name == name) {
      return std::string_view(param.value);
    }
  }
  return std::nullopt;
}

}  // namespace xylium
