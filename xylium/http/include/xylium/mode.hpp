#pragma once

#include <cstdint>
#include <string_view>

namespace xylium {

// Operating mode of a router. It only changes diagnostics: log verbosity and the amount of error details
// exposed to clients by the default error policy.
enum class Mode : std::uint8_t { Debug, Test, Release };

constexpr std::string_view ModeToStr(Mode mode) noexcept {
  switch (mode) {
    case Mode::Debug:
      return "debug";
    case Mode::Test:
      return "test";
    case Mode::Release:
      return "release";
    default:
      return "unknown";
  }
}

}  // namespace xylium
