#include "xylium/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "xylium/string-equal-ignore-case.hpp"

namespace xylium {

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

HttpResponse& HttpResponse::appendHeaderValue(std::string_view name, std::string_view value,
                                              std::string_view separator) {
  auto it = std::ranges::find_if(_headers,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  if (!it->value.empty()) {
    it->value.append(separator);
  }
  it->value.append(value);
  return *this;
}

bool HttpResponse::eraseHeader(std::string_view name) {
  const auto newEnd = std::remove_if(_headers.begin(), _headers.end(), [name](const http::Header& header) {
    return CaseInsensitiveEqual(header.name, name);
  });
  const bool erased = newEnd != _headers.end();
  _headers.erase(newEnd, _headers.end());
  return erased;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

HttpResponse& HttpResponse::body(std::string_view body) {
  _body.assign(body);
  return *this;
}

HttpResponse& HttpResponse::appendBody(std::string_view body) {
  _body.append(body);
  return *this;
}

HttpResponse& HttpResponse::resetBody() noexcept {
  _body.clear();
  return *this;
}

}  // namespace xylium
