#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "xylium/field-logger.hpp"
#include "xylium/http-method.hpp"
#include "xylium/middleware.hpp"
#include "xylium/path-param.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Radix-style routing tree. Each node represents one path segment of the registered patterns.
//
// Pattern syntax (segments are separated by '/'):
//   - 'users'  : static segment, matches the same text exactly
//   - ':id'    : parameter, matches any single segment and captures it under 'id'
//   - '*rest'  : catch-all, matches one or more remaining segments and captures them joined with '/'.
//                It must be the last segment of the pattern.
//
// Matching priority at each level is static, then parameters, then catch-all. Children of the same kind are
// ordered by their raw text, so two parameter siblings with different names are tried in lexicographic order.
// A branch that fails to resolve is backtracked and its captures are dropped before trying the next sibling.
//
// Paths are normalized the same way at registration and lookup: empty segments are ignored, which strips a
// trailing slash ('/users/' is '/users') while the root path '/' stays the root.
//
// Thread safety: add() must only be called during setup. Once built, find() may be called concurrently from
// any number of threads without synchronization.
class PathTree {
 public:
  enum class SegmentKind : std::uint8_t { Static, Param, CatchAll };

  // Handler and route-local middleware registered for one method of one pattern.
  struct RouteTarget {
    Handler handler;
    vector<Middleware> middleware;
  };

  struct RouteMatch {
    // Returns true if a handler is registered for the requested method.
    [[nodiscard]] bool found() const noexcept { return handler != nullptr; }

    // Returns true if the path matched but not the method.
    [[nodiscard]] bool methodNotAllowed() const noexcept { return handler == nullptr && allowedMethodsBmp != 0; }

    // Returns true if no registered pattern matched the path.
    [[nodiscard]] bool notFound() const noexcept { return allowedMethodsBmp == 0; }

    // Methods registered for the matched path, sorted alphabetically. Empty if the path did not match.
    [[nodiscard]] vector<std::string_view> allowedMethods() const;

    const Handler* handler{nullptr};
    std::span<const Middleware> middleware;
    PathParams params;
    http::MethodBmp allowedMethodsBmp{};
  };

  struct RouteInfo {
    http::Method method;
    std::string_view pattern;
  };

  PathTree();

  PathTree(const PathTree&) = delete;
  PathTree(PathTree&&) noexcept = default;
  PathTree& operator=(const PathTree&) = delete;
  PathTree& operator=(PathTree&&) noexcept = default;

  ~PathTree();

  // Registers handler (and its route-local middleware) for given method and pattern.
  // Throws ConfigError if:
  //  - the pattern does not start with '/'
  //  - the handler is empty
  //  - a ':' or '*' marker is not followed by a name, or a name is used twice in the pattern
  //  - a catch-all segment is not the last one, or conflicts with another catch-all name at the same level
  //  - a route is already registered for the same method and normalized pattern
  void add(http::Method method, std::string_view pattern, Handler handler, vector<Middleware> middleware = {});

  // Same as above, with the method given as a token (case-insensitive). Throws ConfigError for unknown methods.
  void add(std::string_view method, std::string_view pattern, Handler handler, vector<Middleware> middleware = {});

  // Resolves given method and request path.
  //  - path not matched : notFound(), all fields empty
  //  - method not found : methodNotAllowed(), null handler, params and allowed methods filled
  //  - match            : handler, route middleware, params and allowed methods filled
  [[nodiscard]] RouteMatch find(http::Method method, std::string_view path) const;

  // Same as above with a method token. Unknown methods never match a handler but still report the
  // allowed methods when the path matches.
  [[nodiscard]] RouteMatch find(std::string_view method, std::string_view path) const;

  // Returns all registered routes, in tree order.
  [[nodiscard]] vector<RouteInfo> routes() const;

  // Logs all registered routes at debug level.
  void printRoutes(const FieldLogger& logger) const;

  [[nodiscard]] std::size_t size() const noexcept { return _nbRoutes; }

  // Number of nodes of the tree, root included.
  [[nodiscard]] std::size_t nbNodes() const;

  [[nodiscard]] bool empty() const noexcept { return _nbRoutes == 0; }

 private:
  struct Node {
    [[nodiscard]] std::string_view captureName() const noexcept {
      return kind == SegmentKind::Static ? std::string_view{} : std::string_view(text).substr(1);
    }

    std::string text;
    SegmentKind kind{SegmentKind::Static};
    http::MethodBmp methods{};
    // Normalized pattern of the routes terminating at this node (empty if none).
    std::string pattern;
    // Sorted by (kind, text).
    vector<std::unique_ptr<Node>> children;
    std::array<std::unique_ptr<RouteTarget>, http::kNbMethods> targets;
  };

  // Returns the child of node with given kind and text, or nullptr.
  static const Node* findChild(const Node& node, SegmentKind kind, std::string_view text) noexcept;

  Node& ensureChild(Node& node, SegmentKind kind, std::string_view text);

  [[nodiscard]] RouteMatch findImpl(std::optional<http::Method> method, std::string_view path) const;

  Node _root;
  std::size_t _nbRoutes{};
};

}  // namespace xylium
