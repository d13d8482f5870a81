#include "xylium/execution-context.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-constants.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/middleware.hpp"
#include "xylium/request-store.hpp"
#include "xylium/string-trim.hpp"

namespace xylium {

ExecutionContext::ExecutionContext()
    : _store(std::make_shared<RequestStore>()), _token(CancellationToken::Background()) {}

ExecutionContext::ExecutionContext(const ExecutionContext& other, CancellationToken token)
    : _request(other._request),
      _response(other._response),
      _params(other._params),
      _chain(other._chain),
      _store(other._store),
      _token(std::move(token)),
      _logger(other._logger),
      _cursor(other._cursor),
      _mode(other._mode) {}

HandlerResult ExecutionContext::next() {
  ++_cursor;
  if (std::cmp_less(_cursor, _chain.size())) {
    return _chain[static_cast<std::size_t>(_cursor)](*this);
  }
  _cursor = static_cast<int32_t>(_chain.size());
  return {};
}

ExecutionContext ExecutionContext::derive(CancellationToken token) const {
  if (token.isNull()) {
    throw std::invalid_argument("Cannot derive an execution context with a null cancellation token");
  }
  return {*this, std::move(token)};
}

void ExecutionContext::appendStep(Handler step) { _chain.push_back(std::move(step)); }

std::string_view ExecutionContext::realIp() const noexcept {
  if (_request == nullptr) {
    return {};
  }
  if (const auto forwardedFor = _request->headerValue(http::XForwardedFor); forwardedFor && !forwardedFor->empty()) {
    return TrimOws(forwardedFor->substr(0, forwardedFor->find(',')));
  }
  if (const auto realIp = _request->headerValue(http::XRealIp); realIp && !realIp->empty()) {
    return TrimOws(*realIp);
  }
  return _request->remoteAddress();
}

ExecutionContext& ExecutionContext::setHeader(std::string_view name, std::string_view value) {
  _response->header(name, value);
  return *this;
}

ExecutionContext& ExecutionContext::setContentType(std::string_view contentType) {
  _response->header(http::ContentType, contentType);
  return *this;
}

void ExecutionContext::setDefaultContentType() {
  if (_responsePrepared) {
    return;
  }
  _responsePrepared = true;
  if (!_response->headerValue(http::ContentType)) {
    _response->header(http::ContentType, http::ContentTypeTextPlainUtf8);
  }
}

HandlerResult ExecutionContext::write(std::string_view data) {
  setDefaultContentType();
  _response->appendBody(data);
  return {};
}

HandlerResult ExecutionContext::string(http::StatusCode code, std::string_view text) {
  status(code).setContentType(http::ContentTypeTextPlainUtf8);
  return write(text);
}

HandlerResult ExecutionContext::rawJson(http::StatusCode code, std::string_view json) {
  status(code).setContentType(http::ContentTypeApplicationJsonUtf8);
  return write(json);
}

HandlerResult ExecutionContext::noContent(http::StatusCode code) {
  status(code);
  _response->resetBody();
  return {};
}

FieldLogger ExecutionContext::logger() const {
  if (const auto requestId = _store->getAs<std::string>(kRequestIdStoreKey)) {
    return _logger.withField("request_id", *requestId);
  }
  return _logger;
}

void ExecutionContext::attach(const HttpRequest* request, HttpResponse* response, CancellationToken token,
                              const FieldLogger& logger, Mode mode) {
  _request = request;
  _response = response;
  _token = std::move(token);
  _logger = logger;
  _mode = mode;
}

void ExecutionContext::reset() {
  _request = nullptr;
  _response = nullptr;
  _params.clear();
  _chain.clear();
  _cursor = kCursorBeforeFirstStep;
  if (_store.use_count() == 1) {
    _store->clear();
  } else {
    // A derived context outlived the request: never let it observe the data of the next one.
    _store = std::make_shared<RequestStore>();
  }
  _token = CancellationToken{};
  _responsePrepared = false;
}

}  // namespace xylium
