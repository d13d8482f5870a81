#pragma once

#include <string_view>

namespace xylium {

constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch = static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  const auto lhsSize = lhs.size();
  if (lhsSize != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type charPos{}; charPos < lhsSize; ++charPos) {
    if (tolower(lhs[charPos]) != tolower(rhs[charPos])) {
      return false;
    }
  }
  return true;
}

}  // namespace xylium
