#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "xylium/http-header.hpp"
#include "xylium/http-method.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Request handle given by the transport layer to Router::handle.
// It owns a decoded copy of the request line, the header fields, the peer address and the body.
// The router never modifies it.
class HttpRequest {
 public:
  using HeadersVector = vector<http::Header>;

  HttpRequest() = default;

  // Builds a request from its method token and its request target.
  // The target is split at the first '?' into path and query.
  // Unknown method tokens are kept as is (methodStr) and yield an empty method().
  HttpRequest(std::string_view method, std::string_view target);

  HttpRequest(http::Method method, std::string_view target);

  // Adds a header field. Several fields with the same name may be added.
  HttpRequest& addHeader(std::string_view name, std::string_view value);

  // Sets the address of the direct peer (without any proxy resolution).
  HttpRequest& remoteAddress(std::string_view address);

  HttpRequest& body(std::string body);

  // The method token as received.
  [[nodiscard]] std::string_view methodStr() const noexcept { return _methodStr; }

  // The parsed method, or std::nullopt if the token is not a known HTTP method.
  [[nodiscard]] std::optional<http::Method> method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string, without the leading '?'.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // Value of the first query parameter with given key (no percent decoding), or std::nullopt.
  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept;

  // Value of the first header with given name (case-insensitive), or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Same as headerValue but returns an empty string_view if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] const HeadersVector& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view remoteAddress() const noexcept { return _remoteAddress; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

 private:
  std::string _methodStr;
  std::optional<http::Method> _method;
  std::string _path;
  std::string _query;
  HeadersVector _headers;
  std::string _remoteAddress;
  std::string _body;
};

}  // namespace xylium
