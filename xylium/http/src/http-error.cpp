#include "xylium/http-error.hpp"

#include <fmt/format.h>

#include <string>
#include <utility>

#include "xylium/http-constants.hpp"
#include "xylium/http-status-code.hpp"

namespace xylium {

HttpError::HttpError(http::StatusCode code) : _message(http::ReasonPhraseFor(code)), _code(code) {}

HttpError::HttpError(http::StatusCode code, std::string message) : _message(std::move(message)), _code(code) {}

std::string HttpError::describe() const {
  if (_internal) {
    return fmt::format("code={}, message={}, internal={}", _code, _message, *_internal);
  }
  return fmt::format("code={}, message={}", _code, _message);
}

}  // namespace xylium
