#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "xylium/http-status-code.hpp"

namespace xylium {

// Request-time failure reported by a handler or a middleware.
// The error policy of the router turns it into a response: code becomes the status, message is shown to the
// client, internal is only logged (and exposed in debug mode).
class HttpError {
 public:
  // Message defaults to the reason phrase of the status code.
  explicit HttpError(http::StatusCode code);

  HttpError(http::StatusCode code, std::string message);

  // Attaches an internal cause, never shown to clients outside of debug mode.
  HttpError& withInternal(std::string internal) & {
    _internal = std::move(internal);
    return *this;
  }

  HttpError&& withInternal(std::string internal) && {
    _internal = std::move(internal);
    return std::move(*this);
  }

  [[nodiscard]] http::StatusCode code() const noexcept { return _code; }

  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  [[nodiscard]] bool hasInternal() const noexcept { return _internal.has_value(); }

  [[nodiscard]] std::string_view internal() const noexcept {
    return _internal ? std::string_view(*_internal) : std::string_view{};
  }

  // Human readable description for logs, for instance "code=503, message=timed out, internal=deadline exceeded".
  [[nodiscard]] std::string describe() const;

  bool operator==(const HttpError&) const noexcept = default;

 private:
  std::string _message;
  std::optional<std::string> _internal;
  http::StatusCode _code;
};

}  // namespace xylium
