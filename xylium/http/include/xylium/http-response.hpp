#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "xylium/http-header.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Response handle given by the transport layer to Router::handle, filled in by handlers.
// The transport serializes it once Router::handle returns (or earlier if it marked it as committed,
// for instance when streaming).
class HttpResponse {
 public:
  using HeadersVector = vector<http::Header>;

  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode code) noexcept : _status(code) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _status = statusCode;
    return *this;
  }

  // Sets a header, replacing the value of any existing header with the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value);

  // Adds a header line without checking for existing ones.
  HttpResponse& addHeader(std::string_view name, std::string_view value);

  // Appends value to the existing header with the same name, separated by separator.
  // Behaves like header() if it does not exist yet.
  HttpResponse& appendHeaderValue(std::string_view name, std::string_view value, std::string_view separator = ", ");

  // Removes all headers with given name. Returns true if at least one was removed.
  bool eraseHeader(std::string_view name);

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] const HeadersVector& headers() const noexcept { return _headers; }

  // Replaces the body.
  HttpResponse& body(std::string_view body);

  HttpResponse& appendBody(std::string_view body);

  HttpResponse& resetBody() noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Called by the transport when the head of the response has left the process
  // (streaming, protocol upgrade, connection hijacking).
  void markCommitted() noexcept { _committed = true; }

  // A response is committed once some body has been written or the transport started sending it.
  // Error policies never overwrite a committed response.
  [[nodiscard]] bool committed() const noexcept { return _committed || !_body.empty(); }

 private:
  HeadersVector _headers;
  std::string _body;
  http::StatusCode _status{http::StatusCodeOK};
  bool _committed{false};
};

}  // namespace xylium
