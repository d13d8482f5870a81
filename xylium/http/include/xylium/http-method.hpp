#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

namespace xylium::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

using MethodBmp = uint16_t;

static_assert(kNbMethods <= sizeof(MethodBmp) * 8,
              "MethodBmp type too small to hold all methods; increase size or change type");

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<http::Method>(1U << methodIdx); }

// Check if a method is set in given bitmap.
constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr bool IsMethodIdxSet(MethodBmp mask, MethodIdx methodIdx) {
  return (mask & (1U << static_cast<MethodBmp>(methodIdx))) != 0U;
}

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodIdxToStr(MethodIdx methodIdx) { return kMethodStrings[methodIdx]; }

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Method indexes ordered by the lexicographic order of their names.
// Iterating a MethodBmp in this order yields an alphabetically sorted method list without sorting.
inline constexpr std::array<MethodIdx, kNbMethods> kMethodIdxByName = []() {
  std::array<MethodIdx, kNbMethods> order{};
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    order[methodIdx] = methodIdx;
  }
  for (MethodIdx pos = 1; pos < kNbMethods; ++pos) {
    for (MethodIdx cur = pos; cur > 0 && kMethodStrings[order[cur]] < kMethodStrings[order[cur - 1]]; --cur) {
      std::swap(order[cur], order[cur - 1]);
    }
  }
  return order;
}();

}  // namespace xylium::http
