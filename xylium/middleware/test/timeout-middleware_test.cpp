#include "xylium/timeout-middleware.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/config-error.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/middleware.hpp"
#include "xylium/mode.hpp"
#include "xylium/router-config.hpp"
#include "xylium/router.hpp"
#include "xylium/timedef.hpp"

namespace xylium {

namespace {

using std::chrono::milliseconds;

constexpr auto kSafetyLimit = std::chrono::seconds(5);

// Polls its cancellation token until it is cancelled, recording the reason.
Handler CooperativeSlowHandler(CancellationToken::Reason& reason) {
  return [&reason](ExecutionContext& ctx) -> HandlerResult {
    const auto start = SteadyClock::now();
    while (!ctx.cancellationToken().isCancelled() && SteadyClock::now() - start < kSafetyLimit) {
      std::this_thread::sleep_for(milliseconds(1));
    }
    reason = ctx.cancellationToken().reason();
    return {};
  };
}

}  // namespace

class TimeoutMiddlewareTest : public ::testing::Test {
 protected:
  HttpResponse serve(std::string_view target, CancellationToken parent = {}) {
    HttpRequest request("GET", target);
    HttpResponse response;
    router.handle(request, response, std::move(parent));
    return response;
  }

  Router router{RouterConfig{}.withMode(Mode::Test)};
  CancellationToken::Reason reason{CancellationToken::Reason::None};
};

TEST(TimeoutConfigTest, Validate) {
  EXPECT_THROW(static_cast<void>(Timeout(Duration::zero())), ConfigError);
  EXPECT_THROW(static_cast<void>(Timeout(milliseconds(-1))), ConfigError);
  EXPECT_THROW(static_cast<void>(Timeout(TimeoutConfig{})), ConfigError);
  EXPECT_NO_THROW(static_cast<void>(Timeout(milliseconds(1))));
}

TEST_F(TimeoutMiddlewareTest, FastHandlerIsUntouched) {
  router.get("/fast", [](ExecutionContext& ctx) { return ctx.string(http::StatusCodeOK, "fast"); },
             {Timeout(std::chrono::seconds(1))});
  const HttpResponse response = serve("/fast");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "fast");
}

TEST_F(TimeoutMiddlewareTest, FastHandlerErrorIsPropagated) {
  router.get("/teapot", [](ExecutionContext&) -> HandlerResult { return HttpError(http::StatusCodeConflict); },
             {Timeout(std::chrono::seconds(1))});
  EXPECT_EQ(serve("/teapot").status(), http::StatusCodeConflict);
}

TEST_F(TimeoutMiddlewareTest, SlowHandlerYields503) {
  router.get("/slow", CooperativeSlowHandler(reason), {Timeout(milliseconds(50))});
  const auto start = SteadyClock::now();
  const HttpResponse response = serve("/slow");
  EXPECT_LT(SteadyClock::now() - start, kSafetyLimit);

  EXPECT_EQ(response.status(), http::StatusCodeServiceUnavailable);
  EXPECT_EQ(response.body(), R"({"error":"Request processing timed out after 50ms."})");
  EXPECT_EQ(reason, CancellationToken::Reason::DeadlineExceeded);
}

TEST_F(TimeoutMiddlewareTest, TimeoutFormatting) {
  router.get("/slow", CooperativeSlowHandler(reason), {Timeout(std::chrono::microseconds(1500))});
  EXPECT_EQ(serve("/slow").body(), R"({"error":"Request processing timed out after 1ms."})");
}

TEST_F(TimeoutMiddlewareTest, CustomMessage) {
  router.get("/slow", CooperativeSlowHandler(reason),
             {Timeout(TimeoutConfig{}.withTimeout(milliseconds(20)).withMessage("too slow"))});
  const HttpResponse response = serve("/slow");
  EXPECT_EQ(response.status(), http::StatusCodeServiceUnavailable);
  EXPECT_EQ(response.body(), R"({"error":"too slow"})");
}

TEST_F(TimeoutMiddlewareTest, CustomErrorHandler) {
  bool workerResultOk = false;
  router.get("/slow", CooperativeSlowHandler(reason),
             {Timeout(TimeoutConfig{}
                          .withTimeout(milliseconds(20))
                          .withErrorHandler([&workerResultOk](ExecutionContext& ctx, HandlerResult workerResult) {
                            workerResultOk = workerResult.ok();
                            return ctx.string(http::StatusCodeGatewayTimeout, "custom");
                          }))});
  const HttpResponse response = serve("/slow");
  EXPECT_EQ(response.status(), http::StatusCodeGatewayTimeout);
  EXPECT_EQ(response.body(), "custom");
  EXPECT_TRUE(workerResultOk);
}

TEST_F(TimeoutMiddlewareTest, CommittedResponseIsKept) {
  router.get("/partial",
             [this](ExecutionContext& ctx) -> HandlerResult {
               static_cast<void>(ctx.write("partial"));
               return CooperativeSlowHandler(reason)(ctx);
             },
             {Timeout(milliseconds(20))});
  const HttpResponse response = serve("/partial");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "partial");
  EXPECT_EQ(reason, CancellationToken::Reason::DeadlineExceeded);
}

TEST_F(TimeoutMiddlewareTest, ExceptionOfTheWorkerIsRethrown) {
  router.get("/boom", [](ExecutionContext&) -> HandlerResult { throw std::runtime_error("boom"); },
             {Timeout(std::chrono::seconds(1))});
  EXPECT_EQ(serve("/boom").status(), http::StatusCodeInternalServerError);
}

TEST_F(TimeoutMiddlewareTest, WorkerSharesTheStoreButNotTheToken) {
  bool workerHasNoDeadline = true;
  router.use([](Handler next) -> Handler {
    return [next = std::move(next)](ExecutionContext& ctx) -> HandlerResult {
      HandlerResult result = next(ctx);
      static_cast<void>(ctx.string(http::StatusCodeOK, ctx.getAs<std::string>("worker").value_or("missing")));
      return result;
    };
  });
  router.get("/store",
             [&workerHasNoDeadline](ExecutionContext& ctx) -> HandlerResult {
               workerHasNoDeadline = !ctx.cancellationToken().deadline().has_value();
               ctx.set("worker", std::string("was here"));
               return {};
             },
             {Timeout(std::chrono::seconds(1))});
  EXPECT_EQ(serve("/store").body(), "was here");
  EXPECT_FALSE(workerHasNoDeadline);
}

TEST_F(TimeoutMiddlewareTest, ParentCancellationReachesTheWorker) {
  router.get("/slow", CooperativeSlowHandler(reason), {Timeout(std::chrono::seconds(10))});
  const CancellationToken parent = CancellationToken::WithCancel(CancellationToken::Background());
  parent.cancel();

  const auto start = SteadyClock::now();
  const HttpResponse response = serve("/slow", parent);
  EXPECT_LT(SteadyClock::now() - start, kSafetyLimit);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(reason, CancellationToken::Reason::Cancelled);
}

}  // namespace xylium
