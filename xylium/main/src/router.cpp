#include "xylium/router.hpp"

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/config-error.hpp"
#include "xylium/context-pool.hpp"
#include "xylium/default-handlers.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-constants.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-method.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/log.hpp"
#include "xylium/middleware.hpp"
#include "xylium/mode.hpp"
#include "xylium/path-tree.hpp"
#include "xylium/route-group.hpp"
#include "xylium/router-config.hpp"
#include "xylium/vector.hpp"

namespace xylium {

namespace {

RouterConfig Validated(RouterConfig config) {
  config.validate();
  return config;
}

// A logger given in the config is used as is. Otherwise the router owns a logger writing to the sinks of the
// spdlog default logger, with a level depending on the mode.
FieldLogger MakeRouterLogger(const RouterConfig& config) {
  if (config.logger) {
    return FieldLogger(config.logger);
  }
  const std::shared_ptr<log::logger> defaultLogger = log::default_logger();
  const auto& sinks = defaultLogger->sinks();
  auto logger = std::make_shared<log::logger>(std::string(kRouterLoggerName), sinks.begin(), sinks.end());
  logger->set_level(config.mode == Mode::Release ? log::level::info : log::level::debug);
  return FieldLogger(std::move(logger));
}

std::string JoinAllowedMethods(const PathTree::RouteMatch& match) {
  std::string allow;
  for (std::string_view method : match.allowedMethods()) {
    if (!allow.empty()) {
      allow.append(", ");
    }
    allow.append(method);
  }
  return allow;
}

HandlerResult Continue(ExecutionContext& ctx) { return ctx.next(); }

}  // namespace

Router::Router(RouterConfig config)
    : _logger(MakeRouterLogger(Validated(config))),
      _mode(config.mode),
      _notFoundHandler(DefaultNotFoundHandler),
      _methodNotAllowedHandler(DefaultMethodNotAllowedHandler),
      _errorHandler(DefaultErrorHandler),
      _panicHandler(DefaultPanicHandler),
      _contextPool(config.contextPoolInitialCapacity, _logger, config.mode) {
  _logger.debug("Router created in {} mode", ModeToStr(_mode));
}

Router::~Router() = default;

Router& Router::use(Middleware middleware) {
  if (!middleware) {
    throw ConfigError("Cannot register an empty global middleware");
  }
  _globalMiddleware.push_back(std::move(middleware));
  return *this;
}

void Router::addRoute(http::Method method, std::string_view path, Handler handler, vector<Middleware> middleware) {
  for (const Middleware& routeMiddleware : middleware) {
    if (!routeMiddleware) {
      throw ConfigError("Cannot register an empty middleware for route {} {}", http::MethodToStr(method), path);
    }
  }
  _tree.add(method, path, std::move(handler), std::move(middleware));
}

void Router::addRoute(std::string_view method, std::string_view path, Handler handler, vector<Middleware> middleware) {
  for (const Middleware& routeMiddleware : middleware) {
    if (!routeMiddleware) {
      throw ConfigError("Cannot register an empty middleware for route {} {}", method, path);
    }
  }
  _tree.add(method, path, std::move(handler), std::move(middleware));
}

RouteGroup Router::group(std::string_view prefix, vector<Middleware> middleware) {
  return {*this, NormalizePathSegment(prefix), std::move(middleware)};
}

Router& Router::setNotFoundHandler(Handler handler) {
  if (!handler) {
    throw ConfigError("Not found handler cannot be empty");
  }
  _notFoundHandler = std::move(handler);
  return *this;
}

Router& Router::setMethodNotAllowedHandler(Handler handler) {
  if (!handler) {
    throw ConfigError("Method not allowed handler cannot be empty");
  }
  _methodNotAllowedHandler = std::move(handler);
  return *this;
}

Router& Router::setErrorHandler(ErrorHandler handler) {
  if (!handler) {
    throw ConfigError("Error handler cannot be empty");
  }
  _errorHandler = std::move(handler);
  return *this;
}

Router& Router::setPanicHandler(PanicHandler handler) {
  if (!handler) {
    throw ConfigError("Panic handler cannot be empty");
  }
  _panicHandler = std::move(handler);
  return *this;
}

void Router::printRoutes() const { _tree.printRoutes(_logger); }

void Router::handle(const HttpRequest& request, HttpResponse& response, CancellationToken parent) {
  ContextPool::Lease ctx(_contextPool, request, response, std::move(parent));

  HandlerResult result = dispatch(*ctx);
  if (result.failed()) {
    handleError(*ctx, std::move(result).takeError());
  } else if (_mode == Mode::Debug && !ctx->responseCommitted() && request.method() != http::Method::HEAD &&
             response.status() == http::StatusCodeOK && !response.headerValue(http::ContentLength)) {
    ctx->logger().debug(
        "Handler for {} {} completed without writing a response body or an error (status {}). Ensure handlers "
        "explicitly send a response.",
        ctx->method(), ctx->path(), response.status());
  }
}

HandlerResult Router::dispatch(ExecutionContext& ctx) {
  try {
    const HttpRequest& request = ctx.request();
    PathTree::RouteMatch match = request.method() ? _tree.find(*request.method(), request.path())
                                                  : _tree.find(request.methodStr(), request.path());
    if (match.found()) {
      ctx.setParams(std::move(match.params));
      for (const Middleware& middleware : _globalMiddleware) {
        ctx.appendStep(middleware(Continue));
      }
      for (const Middleware& middleware : match.middleware) {
        ctx.appendStep(middleware(Continue));
      }
      ctx.appendStep(*match.handler);
      return ctx.next();
    }
    if (match.methodNotAllowed()) {
      ctx.setParams(std::move(match.params));
      ctx.setHeader(http::Allow, JoinAllowedMethods(match));
      return _methodNotAllowedHandler(ctx);
    }
    return _notFoundHandler(ctx);
  } catch (const std::exception& ex) {
    return recoverFromPanic(ctx, ex.what());
  } catch (...) {
    return recoverFromPanic(ctx, "unknown exception");
  }
}

HandlerResult Router::recoverFromPanic(ExecutionContext& ctx, std::string_view cause) {
  ctx.logger().error("Exception escaped the handler chain of {} {}: {}", ctx.method(), ctx.path(), cause);
  try {
    ctx.set(kPanicInfoStoreKey, std::string(cause));
    return _panicHandler(ctx, cause);
  } catch (const std::exception& ex) {
    ctx.logger().error("Panic handler threw: {}", ex.what());
    return HttpError(http::StatusCodeInternalServerError).withInternal(ex.what());
  }
}

void Router::handleError(ExecutionContext& ctx, HttpError error) {
  if (ctx.responseCommitted()) {
    ctx.logger().warn("Response already committed, error generated afterwards for {} {}: {}", ctx.method(),
                      ctx.path(), error.describe());
    return;
  }

  HandlerResult errorHandlerResult;
  try {
    ctx.set(kHandlerErrorStoreKey, error);
    errorHandlerResult = _errorHandler(ctx, error);
  } catch (const std::exception& ex) {
    errorHandlerResult = HttpError(http::StatusCodeInternalServerError).withInternal(ex.what());
  }
  if (errorHandlerResult.ok()) {
    return;
  }

  ctx.logger().error("Error handler failed with {} while handling {}", errorHandlerResult.error().describe(),
                     error.describe());
  HttpResponse& response = ctx.response();
  response.status(http::StatusCodeInternalServerError)
      .header(http::ContentType, http::ContentTypeTextPlainUtf8)
      .body(http::ReasonInternalServerError);
}

}  // namespace xylium
