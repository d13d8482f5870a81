#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace xylium {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize (aggregates are reflected automatically).
/// Null std::optional members are omitted from the output.
/// Example usage:
///   struct Message { std::string text; };
///   auto json_str = xylium::SerializeToJson(Message{"hello"});
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace xylium
