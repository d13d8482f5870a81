#include "http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "xylium/http-method.hpp"
#include "xylium/string-equal-ignore-case.hpp"

namespace xylium::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[methodIdx])) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace xylium::http
