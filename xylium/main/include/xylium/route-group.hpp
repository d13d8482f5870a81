#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "xylium/http-method.hpp"
#include "xylium/middleware.hpp"
#include "xylium/vector.hpp"

namespace xylium {

class Router;

// Set of routes sharing a path prefix and a list of middleware, created by Router::group or RouteGroup::group.
// Routes registered through a group are stored in the router with the prefix prepended to their path and
// the group middleware placed before their own middleware.
// Only usable during the setup phase, and as long as its router is alive.
class RouteGroup {
 public:
  // Appends middleware to this group. It only applies to routes registered afterwards.
  RouteGroup& use(Middleware middleware);

  void addRoute(http::Method method, std::string_view path, Handler handler, vector<Middleware> middleware = {});

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

  // Creates a nested group. Its prefix is appended to this group prefix, its middleware run after the
  // middleware of this group.
  [[nodiscard]] RouteGroup group(std::string_view prefix, vector<Middleware> middleware = {}) const;

  // Normalized prefix: empty for the root, otherwise starting with '/' and without trailing '/'.
  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

 private:
  friend class Router;

  RouteGroup(Router& router, std::string prefix, vector<Middleware> middleware) noexcept
      : _router(&router), _prefix(std::move(prefix)), _middleware(std::move(middleware)) {}

  Router* _router;
  std::string _prefix;
  vector<Middleware> _middleware;
};

// Returns "/" followed by path stripped of its leading and trailing slashes, or an empty string if nothing
// remains.
std::string NormalizePathSegment(std::string_view path);

}  // namespace xylium
