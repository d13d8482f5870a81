#pragma once

#include <optional>
#include <string_view>

#include "xylium/http-method.hpp"

namespace xylium::http {

// Attempt to parse a HTTP method token.
// RFC 9110 §9.1 makes the method token case-sensitive, lower case spellings are accepted nonetheless.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace xylium::http
