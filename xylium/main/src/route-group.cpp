#include "xylium/route-group.hpp"

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/http-method.hpp"
#include "xylium/middleware.hpp"
#include "xylium/router.hpp"
#include "xylium/vector.hpp"

namespace xylium {

std::string NormalizePathSegment(std::string_view path) {
  const auto first = path.find_first_not_of('/');
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = path.find_last_not_of('/');
  std::string normalized;
  normalized.reserve(last - first + 2U);
  normalized.push_back('/');
  normalized.append(path.substr(first, last - first + 1U));
  return normalized;
}

RouteGroup& RouteGroup::use(Middleware middleware) {
  _middleware.push_back(std::move(middleware));
  return *this;
}

void RouteGroup::addRoute(http::Method method, std::string_view path, Handler handler, vector<Middleware> middleware) {
  std::string fullPath = _prefix + NormalizePathSegment(path);
  if (fullPath.empty()) {
    fullPath.push_back('/');
  }

  vector<Middleware> allMiddleware;
  allMiddleware.reserve(_middleware.size() + middleware.size());
  allMiddleware.insert(allMiddleware.end(), _middleware.begin(), _middleware.end());
  allMiddleware.insert(allMiddleware.end(), std::make_move_iterator(middleware.begin()),
                       std::make_move_iterator(middleware.end()));

  _router->addRoute(method, fullPath, std::move(handler), std::move(allMiddleware));
}

RouteGroup RouteGroup::group(std::string_view prefix, vector<Middleware> middleware) const {
  vector<Middleware> allMiddleware;
  allMiddleware.reserve(_middleware.size() + middleware.size());
  allMiddleware.insert(allMiddleware.end(), _middleware.begin(), _middleware.end());
  allMiddleware.insert(allMiddleware.end(), std::make_move_iterator(middleware.begin()),
                       std::make_move_iterator(middleware.end()));
  return {*_router, _prefix + NormalizePathSegment(prefix), std::move(allMiddleware)};
}

}  // namespace xylium
