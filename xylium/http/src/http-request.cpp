#include "xylium/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "http-method-parse.hpp"
#include "xylium/http-method.hpp"
#include "xylium/string-equal-ignore-case.hpp"

namespace xylium {

HttpRequest::HttpRequest(std::string_view method, std::string_view target)
    : _methodStr(method), _method(http::MethodStrToOptEnum(method)) {
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    _path.assign(target);
  } else {
    _path.assign(target.substr(0, queryPos));
    _query.assign(target.substr(queryPos + 1));
  }
}

HttpRequest::HttpRequest(http::Method method, std::string_view target)
    : HttpRequest(http::MethodToStr(method), target) {}

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

HttpRequest& HttpRequest::remoteAddress(std::string_view address) {
  _remoteAddress.assign(address);
  return *this;
}

HttpRequest& HttpRequest::body(std::string body) {
  _body = std::move(body);
  return *this;
}

std::optional<std::string_view> HttpRequest::queryParam(std::string_view key) const noexcept {
  std::string_view remaining(_query);
  while (!remaining.empty()) {
    const auto ampPos = remaining.find('&');
    const std::string_view pair = remaining.substr(0, ampPos);
    const auto eqPos = pair.find('=');
    if (pair.substr(0, eqPos) == key) {
      return eqPos == std::string_view::npos ? std::string_view{} : pair.substr(eqPos + 1);
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(ampPos + 1);
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

}  // namespace xylium
