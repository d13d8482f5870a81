#include "xylium/path-tree.hpp"

#include <amc/smallvector.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "http-method-parse.hpp"
#include "xylium/config-error.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-method.hpp"
#include "xylium/middleware.hpp"
#include "xylium/path-param.hpp"
#include "xylium/vector.hpp"

namespace xylium {

namespace {

constexpr char kParamMarker = ':';
constexpr char kCatchAllMarker = '*';

// Most paths have few segments, avoid heap allocations for them in the lookup hot path.
using SegmentsBuffer = amc::SmallVector<std::string_view, 16>;

// Splits path into its non-empty segments. A trailing slash and repeated slashes are thus ignored.
void SplitPathSegments(std::string_view path, SegmentsBuffer& segments) {
  std::size_t pos = 0;
  while (pos < path.size()) {
    std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      nextSlash = path.size();
    }
    if (nextSlash != pos) {
      segments.push_back(path.substr(pos, nextSlash - pos));
    }
    pos = nextSlash + 1U;
  }
}

std::string JoinSegments(std::span<const std::string_view> segments) {
  std::string joined;
  for (std::string_view segment : segments) {
    if (!joined.empty()) {
      joined.push_back('/');
    }
    joined.append(segment);
  }
  return joined;
}

PathTree::SegmentKind ClassifySegment(std::string_view segment) noexcept {
  switch (segment.front()) {
    case kParamMarker:
      return PathTree::SegmentKind::Param;
    case kCatchAllMarker:
      return PathTree::SegmentKind::CatchAll;
    default:
      return PathTree::SegmentKind::Static;
  }
}

}  // namespace

vector<std::string_view> PathTree::RouteMatch::allowedMethods() const {
  vector<std::string_view> methods;
  for (http::MethodIdx methodIdx : http::kMethodIdxByName) {
    if (http::IsMethodIdxSet(allowedMethodsBmp, methodIdx)) {
      methods.push_back(http::MethodIdxToStr(methodIdx));
    }
  }
  return methods;
}

PathTree::PathTree() = default;

PathTree::~PathTree() = default;

void PathTree::add(std::string_view method, std::string_view pattern, Handler handler,
                   vector<Middleware> middleware) {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    throw ConfigError("Unknown HTTP method '{}' for route '{}'", method, pattern);
  }
  add(*optMethod, pattern, std::move(handler), std::move(middleware));
}

void PathTree::add(http::Method method, std::string_view pattern, Handler handler, vector<Middleware> middleware) {
  if (pattern.empty() || pattern.front() != '/') {
    throw ConfigError("Route pattern '{}' must begin with '/'", pattern);
  }
  if (!handler) {
    throw ConfigError("Cannot register an empty handler for {} {}", http::MethodToStr(method), pattern);
  }

  SegmentsBuffer segments;
  SplitPathSegments(pattern, segments);

  std::string normalizedPattern;
  for (std::size_t segmentPos = 0; segmentPos < segments.size(); ++segmentPos) {
    const std::string_view segment = segments[segmentPos];
    const SegmentKind kind = ClassifySegment(segment);
    if (kind != SegmentKind::Static) {
      const std::string_view name = segment.substr(1);
      if (name.empty()) {
        throw ConfigError("Missing capture name after '{}' in route pattern '{}'", segment.front(), pattern);
      }
      if (kind == SegmentKind::CatchAll && segmentPos + 1U != segments.size()) {
        throw ConfigError("Catch-all segment '{}' must be the last segment of route pattern '{}'", segment,
                          pattern);
      }
      for (std::size_t prevPos = 0; prevPos < segmentPos; ++prevPos) {
        const std::string_view prev = segments[prevPos];
        if (ClassifySegment(prev) != SegmentKind::Static && prev.substr(1) == name) {
          throw ConfigError("Capture name '{}' used more than once in route pattern '{}'", name, pattern);
        }
      }
    }
    normalizedPattern.push_back('/');
    normalizedPattern.append(segment);
  }
  if (normalizedPattern.empty()) {
    normalizedPattern.push_back('/');
  }

  // Conflicts are checked on the existing branch before creating any node: a rejected route leaves the tree
  // unchanged.
  const Node* existing = &_root;
  for (std::string_view segment : segments) {
    const SegmentKind kind = ClassifySegment(segment);
    const Node* child = findChild(*existing, kind, segment);
    if (child == nullptr) {
      if (kind == SegmentKind::CatchAll && !existing->children.empty() &&
          existing->children.back()->kind == SegmentKind::CatchAll) {
        throw ConfigError("Catch-all segment '{}' conflicts with existing catch-all '{}'", segment,
                          existing->children.back()->text);
      }
      existing = nullptr;
      break;
    }
    existing = child;
  }
  if (existing != nullptr && http::IsMethodSet(existing->methods, method)) {
    throw ConfigError("Route {} {} is already registered", http::MethodToStr(method), normalizedPattern);
  }

  Node* node = &_root;
  for (std::string_view segment : segments) {
    node = &ensureChild(*node, ClassifySegment(segment), segment);
  }

  node->targets[http::MethodToIdx(method)] =
      std::make_unique<RouteTarget>(RouteTarget{std::move(handler), std::move(middleware)});
  node->methods = node->methods | method;
  if (node->pattern.empty()) {
    node->pattern = std::move(normalizedPattern);
  }
  ++_nbRoutes;
}

namespace {

template <class Children>
auto ChildLowerBound(Children& children, PathTree::SegmentKind kind, std::string_view text) {
  return std::lower_bound(children.begin(), children.end(), std::make_pair(kind, text),
                          [](const auto& child, std::pair<PathTree::SegmentKind, std::string_view> key) {
                            return std::make_pair(child->kind, std::string_view(child->text)) < key;
                          });
}

}  // namespace

const PathTree::Node* PathTree::findChild(const Node& node, SegmentKind kind, std::string_view text) noexcept {
  const auto it = ChildLowerBound(node.children, kind, text);
  if (it != node.children.end() && (*it)->kind == kind && (*it)->text == text) {
    return it->get();
  }
  return nullptr;
}

PathTree::Node& PathTree::ensureChild(Node& node, SegmentKind kind, std::string_view text) {
  auto it = ChildLowerBound(node.children, kind, text);
  if (it != node.children.end() && (*it)->kind == kind && (*it)->text == text) {
    return **it;
  }

  auto child = std::make_unique<Node>();
  child->text.assign(text);
  child->kind = kind;
  it = node.children.insert(it, std::move(child));
  return **it;
}

std::size_t PathTree::nbNodes() const {
  std::size_t nbNodes = 0;
  vector<const Node*> toVisit;
  toVisit.push_back(&_root);
  while (!toVisit.empty()) {
    const Node* node = toVisit.back();
    toVisit.pop_back();
    ++nbNodes;
    for (const auto& child : node->children) {
      toVisit.push_back(child.get());
    }
  }
  return nbNodes;
}

PathTree::RouteMatch PathTree::find(http::Method method, std::string_view path) const {
  return findImpl(method, path);
}

PathTree::RouteMatch PathTree::find(std::string_view method, std::string_view path) const {
  return findImpl(http::MethodStrToOptEnum(method), path);
}

PathTree::RouteMatch PathTree::findImpl(std::optional<http::Method> method, std::string_view path) const {
  struct StackFrame {
    const Node* node;
    uint32_t segmentIndex;
    uint32_t childIdx;
    uint32_t paramsSize;
  };

  RouteMatch result;

  SegmentsBuffer segments;
  SplitPathSegments(path, segments);

  // All lookup state is local so that concurrent lookups never share anything mutable.
  amc::SmallVector<StackFrame, 16> stack;
  PathParams& params = result.params;
  const Node* matchedNode = nullptr;

  stack.push_back(StackFrame{&_root, 0, 0, 0});

  while (!stack.empty() && matchedNode == nullptr) {
    StackFrame frame = stack.back();
    stack.pop_back();

    // Terminal: all segments matched
    if (frame.segmentIndex == segments.size()) {
      if (frame.node->methods != 0) {
        matchedNode = frame.node;
      }
      continue;
    }

    // Drop captures bound by previously explored siblings.
    params.resize(frame.paramsSize);

    const std::string_view segment = segments[frame.segmentIndex];
    const auto& children = frame.node->children;
    while (frame.childIdx < children.size()) {
      const Node& child = *children[frame.childIdx];
      ++frame.childIdx;

      switch (child.kind) {
        case SegmentKind::Static:
          if (child.text != segment) {
            continue;
          }
          break;
        case SegmentKind::Param:
          params.push_back(PathParam{child.captureName(), std::string(segment)});
          break;
        case SegmentKind::CatchAll:
          if (child.methods == 0) {
            continue;
          }
          params.push_back(PathParam{child.captureName(),
                                     JoinSegments(std::span<const std::string_view>(
                                         segments.data() + frame.segmentIndex, segments.size() - frame.segmentIndex))});
          matchedNode = &child;
          break;
      }
      if (matchedNode != nullptr) {
        break;
      }

      // Push current frame back for later retry of the next siblings, then descend.
      stack.push_back(frame);
      stack.push_back(StackFrame{&child, frame.segmentIndex + 1U, 0, static_cast<uint32_t>(params.size())});
      break;
    }
  }

  if (matchedNode == nullptr) {
    params.clear();
    return result;
  }

  result.allowedMethodsBmp = matchedNode->methods;
  if (method && http::IsMethodSet(matchedNode->methods, *method)) {
    const RouteTarget& target = *matchedNode->targets[http::MethodToIdx(*method)];
    result.handler = &target.handler;
    result.middleware = std::span<const Middleware>(target.middleware.data(), target.middleware.size());
  }
  return result;
}

vector<PathTree::RouteInfo> PathTree::routes() const {
  vector<RouteInfo> routes;
  vector<const Node*> toVisit;
  toVisit.push_back(&_root);
  while (!toVisit.empty()) {
    const Node* node = toVisit.back();
    toVisit.pop_back();
    for (http::MethodIdx methodIdx : http::kMethodIdxByName) {
      if (http::IsMethodIdxSet(node->methods, methodIdx)) {
        routes.push_back(RouteInfo{http::MethodFromIdx(methodIdx), node->pattern});
      }
    }
    // Reverse push so that children are visited in priority order.
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      toVisit.push_back(it->get());
    }
  }
  return routes;
}

void PathTree::printRoutes(const FieldLogger& logger) const {
  logger.debug("Registered routes ({}) in {} nodes:", _nbRoutes, nbNodes());
  for (const RouteInfo& route : routes()) {
    logger.debug("  {:<7} {}", http::MethodToStr(route.method), route.pattern);
  }
}

}  // namespace xylium
