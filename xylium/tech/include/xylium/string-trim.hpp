#pragma once

#include <string_view>

namespace xylium {

// Trim OWS (optional whitespace) per RFC 9110 §5.6.3: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  constexpr std::string_view kOws = " \t";
  const auto first = sv.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(kOws) - first + 1U);
}

}  // namespace xylium
