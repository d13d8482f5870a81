#include "xylium/path-tree.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "xylium/config-error.hpp"
#include "xylium/context-pool.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/http-method.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/middleware.hpp"

namespace xylium {

namespace {

using http::Method;

// Handler reporting its tag through the response status, so that tests can tell which route matched.
Handler TaggedHandler(http::StatusCode tag) {
  return [tag](ExecutionContext& ctx) -> HandlerResult {
    ctx.status(tag);
    return {};
  };
}

Handler NoopHandler() {
  return [](ExecutionContext&) -> HandlerResult { return {}; };
}

Middleware NoopMiddleware() {
  return [](Handler next) { return next; };
}

}  // namespace

class PathTreeTest : public ::testing::Test {
 protected:
  // Returns the tag of the matched handler, or 0 if no handler matched.
  http::StatusCode matchedTag(Method method, std::string_view path) {
    const PathTree::RouteMatch match = tree.find(method, path);
    if (!match.found()) {
      return 0;
    }
    HttpRequest request(method, path);
    HttpResponse response(0);
    ContextPool::Lease ctx(pool, request, response);
    EXPECT_TRUE((*match.handler)(*ctx).ok());
    return response.status();
  }

  PathTree tree;
  ContextPool pool;
};

TEST_F(PathTreeTest, EmptyTree) {
  EXPECT_TRUE(tree.empty());
  const auto match = tree.find(Method::GET, "/");
  EXPECT_TRUE(match.notFound());
  EXPECT_FALSE(match.found());
  EXPECT_FALSE(match.methodNotAllowed());
  EXPECT_TRUE(match.params.empty());
  EXPECT_TRUE(match.allowedMethods().empty());
}

TEST_F(PathTreeTest, EveryRegisteredRouteIsFound) {
  const std::vector<std::string_view> patterns = {"/",           "/users",           "/users/:id",
                                                  "/users/new",  "/users/:id/posts", "/files/*rest",
                                                  "/a/b/c/d/e/f", "/api/v1/items/:item/tags/:tag"};
  http::StatusCode tag = 200;
  for (std::string_view pattern : patterns) {
    tree.add(Method::GET, pattern, TaggedHandler(tag++));
  }
  EXPECT_EQ(tree.size(), patterns.size());

  tag = 200;
  for (std::string_view pattern : patterns) {
    EXPECT_EQ(matchedTag(Method::GET, pattern), tag++) << pattern;
  }
}

TEST_F(PathTreeTest, StaticHasPriorityOverParam) {
  tree.add(Method::GET, "/users/:id", TaggedHandler(201));
  tree.add(Method::GET, "/users/new", TaggedHandler(202));

  EXPECT_EQ(matchedTag(Method::GET, "/users/new"), 202);
  EXPECT_EQ(matchedTag(Method::GET, "/users/42"), 201);

  const auto match = tree.find(Method::GET, "/users/42");
  ASSERT_EQ(match.params.size(), 1U);
  EXPECT_EQ(match.params[0].name, "id");
  EXPECT_EQ(match.params[0].value, "42");
  EXPECT_TRUE(tree.find(Method::GET, "/users/new").params.empty());
}

TEST_F(PathTreeTest, ParamHasPriorityOverCatchAll) {
  tree.add(Method::GET, "/files/*rest", TaggedHandler(201));
  tree.add(Method::GET, "/files/:name", TaggedHandler(202));

  EXPECT_EQ(matchedTag(Method::GET, "/files/readme"), 202);
  EXPECT_EQ(matchedTag(Method::GET, "/files/docs/readme"), 201);
}

TEST_F(PathTreeTest, CatchAllCapturesRemainingSegments) {
  tree.add(Method::GET, "/files/*rest", NoopHandler());

  const auto match = tree.find(Method::GET, "/files/a/b/c");
  ASSERT_TRUE(match.found());
  ASSERT_EQ(match.params.size(), 1U);
  EXPECT_EQ(match.params[0].name, "rest");
  EXPECT_EQ(match.params[0].value, "a/b/c");

  // One or more segments
  EXPECT_TRUE(tree.find(Method::GET, "/files").notFound());
  EXPECT_TRUE(tree.find(Method::GET, "/files/").notFound());
}

TEST_F(PathTreeTest, BacktrackingDropsCapturesOfFailedBranch) {
  tree.add(Method::GET, "/shop/:category/items", TaggedHandler(201));
  tree.add(Method::GET, "/shop/sale/:item/details", TaggedHandler(202));

  // 'sale' first descends into the static branch, which fails on 'items', then the param branch matches.
  const auto match = tree.find(Method::GET, "/shop/sale/items");
  ASSERT_TRUE(match.found());
  ASSERT_EQ(match.params.size(), 1U);
  EXPECT_EQ(match.params[0].name, "category");
  EXPECT_EQ(match.params[0].value, "sale");

  const auto detailsMatch = tree.find(Method::GET, "/shop/sale/shoes/details");
  ASSERT_TRUE(detailsMatch.found());
  ASSERT_EQ(detailsMatch.params.size(), 1U);
  EXPECT_EQ(detailsMatch.params[0].name, "item");
  EXPECT_EQ(detailsMatch.params[0].value, "shoes");
}

TEST_F(PathTreeTest, BacktrackingIntoCatchAll) {
  tree.add(Method::GET, "/assets/:version/app.js", TaggedHandler(201));
  tree.add(Method::GET, "/assets/*path", TaggedHandler(202));

  EXPECT_EQ(matchedTag(Method::GET, "/assets/v2/app.js"), 201);
  EXPECT_EQ(matchedTag(Method::GET, "/assets/v2/style.css"), 202);

  const auto match = tree.find(Method::GET, "/assets/v2/style.css");
  ASSERT_EQ(match.params.size(), 1U);
  EXPECT_EQ(match.params[0].name, "path");
  EXPECT_EQ(match.params[0].value, "v2/style.css");
}

TEST_F(PathTreeTest, IntermediateNodeWithoutRouteIsNotFound) {
  tree.add(Method::GET, "/a/b/c", NoopHandler());

  EXPECT_TRUE(tree.find(Method::GET, "/a").notFound());
  EXPECT_TRUE(tree.find(Method::GET, "/a/b").notFound());
  EXPECT_TRUE(tree.find(Method::GET, "/a/b/c/d").notFound());
  EXPECT_TRUE(tree.find(Method::GET, "/a/b/c").found());
}

TEST_F(PathTreeTest, TrailingSlashIsNormalized) {
  tree.add(Method::GET, "/users/", TaggedHandler(201));
  tree.add(Method::GET, "/", TaggedHandler(202));

  EXPECT_EQ(matchedTag(Method::GET, "/users"), 201);
  EXPECT_EQ(matchedTag(Method::GET, "/users/"), 201);
  EXPECT_EQ(matchedTag(Method::GET, "//users//"), 201);
  EXPECT_EQ(matchedTag(Method::GET, "/"), 202);

  // '/users' and '/users/' are the same route.
  EXPECT_THROW(tree.add(Method::GET, "/users", NoopHandler()), ConfigError);
}

TEST_F(PathTreeTest, MethodNotAllowedReportsSortedMethods) {
  tree.add(Method::GET, "/ping", NoopHandler());

  auto match = tree.find(Method::POST, "/ping");
  EXPECT_FALSE(match.found());
  EXPECT_TRUE(match.methodNotAllowed());
  EXPECT_FALSE(match.notFound());
  EXPECT_EQ(match.allowedMethods(), vector<std::string_view>{"GET"});

  tree.add(Method::PUT, "/ping", NoopHandler());
  tree.add(Method::DELETE, "/ping", NoopHandler());
  tree.add(Method::OPTIONS, "/ping", NoopHandler());

  match = tree.find(Method::PATCH, "/ping");
  EXPECT_TRUE(match.methodNotAllowed());
  EXPECT_EQ(match.allowedMethods(), (vector<std::string_view>{"DELETE", "GET", "OPTIONS", "PUT"}));

  // A found route also reports all its methods.
  match = tree.find(Method::GET, "/ping");
  EXPECT_TRUE(match.found());
  EXPECT_EQ(match.allowedMethods().size(), 4U);
}

TEST_F(PathTreeTest, MethodNotAllowedKeepsParams) {
  tree.add(Method::GET, "/users/:id", NoopHandler());

  const auto match = tree.find(Method::DELETE, "/users/7");
  EXPECT_TRUE(match.methodNotAllowed());
  ASSERT_EQ(match.params.size(), 1U);
  EXPECT_EQ(match.params[0].value, "7");
}

TEST_F(PathTreeTest, MethodTokens) {
  tree.add("get", "/ping", NoopHandler());
  tree.add("POST", "/ping", NoopHandler());

  EXPECT_TRUE(tree.find("GET", "/ping").found());
  EXPECT_TRUE(tree.find("post", "/ping").found());

  const auto match = tree.find("BREW", "/ping");
  EXPECT_TRUE(match.methodNotAllowed());
  EXPECT_EQ(match.allowedMethods(), (vector<std::string_view>{"GET", "POST"}));

  EXPECT_TRUE(tree.find("BREW", "/coffee").notFound());
  EXPECT_THROW(tree.add("BREW", "/coffee", NoopHandler()), ConfigError);
}

TEST_F(PathTreeTest, RouteMiddlewareIsReturned) {
  tree.add(Method::GET, "/a", NoopHandler(), {NoopMiddleware(), NoopMiddleware()});
  tree.add(Method::POST, "/a", NoopHandler());

  EXPECT_EQ(tree.find(Method::GET, "/a").middleware.size(), 2U);
  EXPECT_TRUE(tree.find(Method::POST, "/a").middleware.empty());
  EXPECT_TRUE(tree.find(Method::PUT, "/a").middleware.empty());
}

TEST_F(PathTreeTest, SameMethodAndPathIsRejected) {
  tree.add(Method::GET, "/users/:id", NoopHandler());
  EXPECT_THROW(tree.add(Method::GET, "/users/:id", NoopHandler()), ConfigError);
  EXPECT_NO_THROW(tree.add(Method::POST, "/users/:id", NoopHandler()));
  EXPECT_EQ(tree.size(), 2U);
}

TEST_F(PathTreeTest, InvalidPatternsAreRejected) {
  EXPECT_THROW(tree.add(Method::GET, "", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "users", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/users/:", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/files/*", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/files/*rest/more", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/a/:id/b/:id", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/ok", Handler{}), ConfigError);
  EXPECT_TRUE(tree.empty());
}

TEST_F(PathTreeTest, ConflictingCatchAllNamesAreRejected) {
  tree.add(Method::GET, "/files/*rest", NoopHandler());
  EXPECT_NO_THROW(tree.add(Method::POST, "/files/*rest", NoopHandler()));
  EXPECT_THROW(tree.add(Method::PUT, "/files/*path", NoopHandler()), ConfigError);
}

TEST_F(PathTreeTest, RejectedRoutesLeaveTreeUnchanged) {
  tree.add(Method::GET, "/users/:id", NoopHandler());
  tree.add(Method::GET, "/files/*rest", NoopHandler());
  const std::size_t nbNodes = tree.nbNodes();
  EXPECT_EQ(nbNodes, 5U);

  EXPECT_THROW(tree.add(Method::GET, "/users/:id/posts/:", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/orders/:id/lines/:id", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/orders/*all/lines", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/users/:id", NoopHandler()), ConfigError);
  EXPECT_THROW(tree.add(Method::GET, "/files/*path", NoopHandler()), ConfigError);
  EXPECT_EQ(tree.nbNodes(), nbNodes);
  EXPECT_EQ(tree.size(), 2U);

  tree.add(Method::GET, "/users/:id/posts", NoopHandler());
  EXPECT_EQ(tree.nbNodes(), nbNodes + 1U);
}

TEST_F(PathTreeTest, SiblingParamsAreTriedInNameOrder) {
  tree.add(Method::GET, "/x/:zeta", TaggedHandler(201));
  tree.add(Method::POST, "/x/:alpha", TaggedHandler(202));

  // Both branches match '/x/1' but only the first one in (kind, text) order is considered.
  const auto match = tree.find(Method::GET, "/x/1");
  EXPECT_TRUE(match.methodNotAllowed());
  EXPECT_EQ(match.allowedMethods(), vector<std::string_view>{"POST"});
}

TEST_F(PathTreeTest, RoutesAreListedInTreeOrder) {
  tree.add(Method::POST, "/users", NoopHandler());
  tree.add(Method::GET, "/users/:id", NoopHandler());
  tree.add(Method::GET, "/users", NoopHandler());
  tree.add(Method::GET, "/users/new", NoopHandler());

  const auto routes = tree.routes();
  ASSERT_EQ(routes.size(), 4U);
  EXPECT_EQ(routes[0].method, Method::GET);
  EXPECT_EQ(routes[0].pattern, "/users");
  EXPECT_EQ(routes[1].method, Method::POST);
  EXPECT_EQ(routes[1].pattern, "/users");
  EXPECT_EQ(routes[2].pattern, "/users/new");
  EXPECT_EQ(routes[3].pattern, "/users/:id");
}

TEST_F(PathTreeTest, ConcurrentFindsMatchSingleThreadedResults) {
  tree.add(Method::GET, "/users/:id", NoopHandler());
  tree.add(Method::GET, "/users/new", NoopHandler());
  tree.add(Method::GET, "/files/*rest", NoopHandler());
  tree.add(Method::POST, "/users/:id/posts/:post", NoopHandler());

  const std::vector<std::string> paths = {"/users/1", "/users/new", "/files/a/b", "/users/9/posts/3", "/nope",
                                          "/users/9/posts"};
  std::vector<PathTree::RouteMatch> expected;
  for (const std::string& path : paths) {
    expected.push_back(tree.find(Method::POST, path));
  }

  static constexpr int kNbThreads = 8;
  static constexpr int kNbIterations = 2000;
  std::atomic<int> nbMismatches{0};
  std::vector<std::jthread> threads;
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&] {
      for (int iter = 0; iter < kNbIterations; ++iter) {
        const std::size_t pathPos = static_cast<std::size_t>(iter) % paths.size();
        const auto match = tree.find(Method::POST, paths[pathPos]);
        const auto& ref = expected[pathPos];
        if (match.handler != ref.handler || match.params != ref.params ||
            match.allowedMethodsBmp != ref.allowedMethodsBmp) {
          ++nbMismatches;
        }
      }
    });
  }
  threads.clear();

  EXPECT_EQ(nbMismatches.load(), 0);
}

}  // namespace xylium
