#pragma once

#include <functional>
#include <string_view>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/context-pool.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-method.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/middleware.hpp"
#include "xylium/mode.hpp"
#include "xylium/path-tree.hpp"
#include "xylium/router-config.hpp"
#include "xylium/vector.hpp"

namespace xylium {

class RouteGroup;

// Name of the logger created by the router when none is given in its config.
inline constexpr std::string_view kRouterLoggerName = "xylium";

// Store key under which the router saves the HttpError given to the error handler.
inline constexpr std::string_view kHandlerErrorStoreKey = "xylium_handler_error";

// Store key under which the router saves the description of an exception given to the panic handler.
inline constexpr std::string_view kPanicInfoStoreKey = "xylium_panic_info";

// Request dispatcher.
//
// Setup phase: register global middleware, routes, groups and the error policies. None of these methods are
// thread safe and they must not be called once serving started.
//
// Serving phase: handle() may be called concurrently from any number of threads. For each request it resolves
// the route, builds the chain [global middleware..., route middleware..., handler] into a pooled
// ExecutionContext and runs it. Unresolved routes go to the not found or method not allowed handlers,
// exceptions escaping the chain go to the panic handler, and any resulting HttpError goes to the error
// handler unless the response is already committed.
class Router {
 public:
  // Turns an HttpError into a response. Returning an error (or throwing) makes the router write a plain 500.
  using ErrorHandler = std::function<HandlerResult(ExecutionContext&, const HttpError&)>;

  // Called with the description of an exception that escaped the chain.
  // Its result goes through the error handler like any handler result.
  using PanicHandler = std::function<HandlerResult(ExecutionContext&, std::string_view)>;

  // Throws ConfigError if config is invalid.
  explicit Router(RouterConfig config = {});

  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router();

  // Appends a global middleware, executed for all matched routes, before the route middleware.
  Router& use(Middleware middleware);

  // Registers handler for method and path, with optional route-local middleware.
  // Throws ConfigError on invalid or duplicate routes (see PathTree::add).
  void addRoute(http::Method method, std::string_view path, Handler handler, vector<Middleware> middleware = {});

  void addRoute(std::string_view method, std::string_view path, Handler handler, vector<Middleware> middleware = {});

  void get(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::GET, path, std::move(handler), std::move(middleware));
  }

  void post(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::POST, path, std::move(handler), std::move(middleware));
  }

  void put(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::PUT, path, std::move(handler), std::move(middleware));
  }

  void patch(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::PATCH, path, std::move(handler), std::move(middleware));
  }

  void del(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::DELETE, path, std::move(handler), std::move(middleware));
  }

  void head(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::HEAD, path, std::move(handler), std::move(middleware));
  }

  void options(std::string_view path, Handler handler, vector<Middleware> middleware = {}) {
    addRoute(http::Method::OPTIONS, path, std::move(handler), std::move(middleware));
  }

  // Creates a group of routes sharing a path prefix and some middleware, placed after the global middleware
  // and before the route ones. The returned group refers to this router and must not outlive it.
  [[nodiscard]] RouteGroup group(std::string_view prefix, vector<Middleware> middleware = {});

  // The setters below throw ConfigError if given handler is empty.

  Router& setNotFoundHandler(Handler handler);

  Router& setMethodNotAllowedHandler(Handler handler);

  Router& setErrorHandler(ErrorHandler handler);

  Router& setPanicHandler(PanicHandler handler);

  // Logs all registered routes at debug level.
  void printRoutes() const;

  // Dispatches request, filling response.
  // parent, if not null, becomes the parent of the context cancellation token (Background otherwise).
  void handle(const HttpRequest& request, HttpResponse& response, CancellationToken parent = {});

  [[nodiscard]] const PathTree& pathTree() const noexcept { return _tree; }

  [[nodiscard]] const ContextPool& contextPool() const noexcept { return _contextPool; }

  [[nodiscard]] const FieldLogger& logger() const noexcept { return _logger; }

  [[nodiscard]] Mode mode() const noexcept { return _mode; }

 private:
  HandlerResult dispatch(ExecutionContext& ctx);

  HandlerResult recoverFromPanic(ExecutionContext& ctx, std::string_view cause);

  void handleError(ExecutionContext& ctx, HttpError error);

  FieldLogger _logger;
  Mode _mode;
  PathTree _tree;
  vector<Middleware> _globalMiddleware;
  Handler _notFoundHandler;
  Handler _methodNotAllowedHandler;
  ErrorHandler _errorHandler;
  PanicHandler _panicHandler;
  ContextPool _contextPool;
};

}  // namespace xylium
