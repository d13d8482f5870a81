#pragma once

#include <any>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/json-serializer.hpp"
#include "xylium/middleware.hpp"
#include "xylium/mode.hpp"
#include "xylium/path-param.hpp"
#include "xylium/request-store.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Store key under which the request id middleware saves the request id.
inline constexpr std::string_view kRequestIdStoreKey = "xylium_request_id";

// Mutable state of one request flowing through a middleware chain.
//
// A context is checked out from a ContextPool for the duration of one request and exclusively owned by it.
// The chain is driven by next(): each call moves the cursor to the next step and runs it, so a middleware
// chooses to run code before the rest of the chain, after it, or to short-circuit it by not calling next().
// Only one flow of a request may call next() at a time.
//
// The request store is the only state meant to be shared between threads during a request. It is owned
// through a shared_ptr and guarded by its own lock, so that derived contexts share it with their parent.
class ExecutionContext {
 public:
  static constexpr int32_t kCursorBeforeFirstStep = -1;

  ExecutionContext();

  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext(ExecutionContext&&) noexcept = default;
  ExecutionContext& operator=(const ExecutionContext&) = delete;
  ExecutionContext& operator=(ExecutionContext&&) noexcept = default;

  ~ExecutionContext() = default;

  // Advances the cursor and runs the step it points to, returning its result.
  // Returns success without doing anything once the end of the chain is reached.
  HandlerResult next();

  // Returns a new context sharing the store, the transport handles and a snapshot of the parameters, the chain
  // and the cursor of this context, with its own cancellation token and response guard.
  // Calling next() on the derived context runs the remaining steps with the derived context.
  // Throws std::invalid_argument if token is null.
  [[nodiscard]] ExecutionContext derive(CancellationToken token) const;

  // Appends a step at the end of the chain.
  void appendStep(Handler step);

  [[nodiscard]] std::size_t chainSize() const noexcept { return _chain.size(); }

  [[nodiscard]] int32_t cursor() const noexcept { return _cursor; }

  /////////////////
  // Path params //
  /////////////////

  void setParams(PathParams params) noexcept { _params = std::move(params); }

  [[nodiscard]] const PathParams& params() const noexcept { return _params; }

  // Value of the path parameter with given name, or an empty string_view if the route has no such capture.
  [[nodiscard]] std::string_view param(std::string_view name) const noexcept {
    return FindPathParam(_params, name).value_or(std::string_view{});
  }

  [[nodiscard]] std::optional<std::string_view> optParam(std::string_view name) const noexcept {
    return FindPathParam(_params, name);
  }

  // Parses the path parameter with given name as an integral.
  // Returns std::nullopt if absent or not entirely made of a valid integral of this type.
  template <std::integral T>
  [[nodiscard]] std::optional<T> paramAs(std::string_view name) const noexcept {
    const auto value = FindPathParam(_params, name);
    if (!value) {
      return std::nullopt;
    }
    T ret;
    const auto [ptr, errc] = std::from_chars(value->data(), value->data() + value->size(), ret);
    if (errc != std::errc{} || ptr != value->data() + value->size()) {
      return std::nullopt;
    }
    return ret;
  }

  ///////////////////
  // Request store //
  ///////////////////

  void set(std::string_view key, std::any value) { _store->set(key, std::move(value)); }

  [[nodiscard]] std::optional<std::any> get(std::string_view key) const { return _store->get(key); }

  template <class T>
  [[nodiscard]] std::optional<T> getAs(std::string_view key) const {
    return _store->getAs<T>(key);
  }

  // Throws std::out_of_range if key is absent.
  [[nodiscard]] std::any mustGet(std::string_view key) const { return _store->mustGet(key); }

  bool erase(std::string_view key) { return _store->erase(key); }

  [[nodiscard]] const std::shared_ptr<RequestStore>& store() const noexcept { return _store; }

  //////////////////
  // Cancellation //
  //////////////////

  [[nodiscard]] const CancellationToken& cancellationToken() const noexcept { return _token; }

  /////////////
  // Request //
  /////////////

  [[nodiscard]] bool hasTransport() const noexcept { return _request != nullptr; }

  // Precondition: hasTransport().
  [[nodiscard]] const HttpRequest& request() const noexcept { return *_request; }

  // Precondition: hasTransport().
  [[nodiscard]] HttpResponse& response() noexcept { return *_response; }

  [[nodiscard]] std::string_view method() const noexcept {
    return _request == nullptr ? std::string_view{} : _request->methodStr();
  }

  [[nodiscard]] std::string_view path() const noexcept {
    return _request == nullptr ? std::string_view{} : _request->path();
  }

  // Value of the request header with given name (case-insensitive), or an empty string_view.
  [[nodiscard]] std::string_view header(std::string_view name) const noexcept {
    return _request == nullptr ? std::string_view{} : _request->headerValueOrEmpty(name);
  }

  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept {
    return _request == nullptr ? std::nullopt : _request->queryParam(key);
  }

  // Client address, as seen behind reverse proxies: first entry of X-Forwarded-For, then X-Real-IP,
  // then the direct peer address.
  [[nodiscard]] std::string_view realIp() const noexcept;

  //////////////
  // Response //
  //////////////

  ExecutionContext& status(http::StatusCode code) noexcept {
    _response->status(code);
    return *this;
  }

  ExecutionContext& setHeader(std::string_view name, std::string_view value);

  ExecutionContext& setContentType(std::string_view contentType);

  // Sets 'text/plain; charset=utf-8' if no Content-Type is set yet.
  // Only the first call of a request has an effect.
  void setDefaultContentType();

  // Appends data to the response body, setting the default content type first.
  HandlerResult write(std::string_view data);

  HandlerResult string(http::StatusCode code, std::string_view text);

  // Serializes value with glaze as the response body.
  template <class T>
  HandlerResult json(http::StatusCode code, const T& value) {
    return rawJson(code, SerializeToJson(value));
  }

  HandlerResult rawJson(http::StatusCode code, std::string_view json);

  // Sets the status and clears the body.
  HandlerResult noContent(http::StatusCode code = http::StatusCodeNoContent);

  [[nodiscard]] bool responseCommitted() const noexcept { return _response != nullptr && _response->committed(); }

  /////////////////
  // Environment //
  /////////////////

  // Router logger, with a 'request_id' field once the request id middleware ran.
  [[nodiscard]] FieldLogger logger() const;

  [[nodiscard]] Mode mode() const noexcept { return _mode; }

 private:
  friend class ContextPool;

  ExecutionContext(const ExecutionContext& other, CancellationToken token);

  // Called by the pool when the context is checked out.
  void attach(const HttpRequest* request, HttpResponse* response, CancellationToken token, const FieldLogger& logger,
              Mode mode);

  // Called by the pool before putting the context back in its free list.
  void reset();

  const HttpRequest* _request{nullptr};
  HttpResponse* _response{nullptr};
  PathParams _params;
  vector<Handler> _chain;
  std::shared_ptr<RequestStore> _store;
  CancellationToken _token;
  FieldLogger _logger;
  int32_t _cursor{kCursorBeforeFirstStep};
  Mode _mode{Mode::Release};
  bool _responsePrepared{false};
};

}  // namespace xylium
