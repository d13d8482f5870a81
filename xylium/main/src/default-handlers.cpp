#include "xylium/default-handlers.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xylium/execution-context.hpp"
#include "xylium/http-constants.hpp"
#include "xylium/http-error.hpp"
#include "xylium/http-status-code.hpp"
#include "xylium/middleware.hpp"
#include "xylium/mode.hpp"
#include "xylium/string-trim.hpp"

namespace xylium {

namespace {

constexpr std::string_view kPanicClientMessage =
    "An unexpected server error occurred. Please try again later or contact support.";

struct DebugInfo {
  std::string internal_error_details;
};

// Null members are not serialized.
struct ErrorPayload {
  std::string error;
  std::optional<std::vector<std::string>> allowed_methods;
  std::optional<DebugInfo> _debug_info;
};

std::vector<std::string> SplitAllowHeader(std::string_view allow) {
  std::vector<std::string> methods;
  while (!allow.empty()) {
    const auto commaPos = allow.find(',');
    const std::string_view method = TrimOws(allow.substr(0, commaPos));
    if (!method.empty()) {
      methods.emplace_back(method);
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    allow.remove_prefix(commaPos + 1U);
  }
  return methods;
}

}  // namespace

HandlerResult DefaultNotFoundHandler(ExecutionContext& ctx) {
  return HttpError(http::StatusCodeNotFound,
                   fmt::format("The requested resource at '{}' could not be found on this server.", ctx.path()));
}

HandlerResult DefaultMethodNotAllowedHandler(ExecutionContext& ctx) {
  return HttpError(http::StatusCodeMethodNotAllowed,
                   fmt::format("The method '{}' is not supported for the resource at '{}'.", ctx.method(), ctx.path()));
}

HandlerResult DefaultPanicHandler(ExecutionContext& ctx, std::string_view cause) {
  ctx.logger().error("Recovered from exception during {} {} (mode {}): {}", ctx.method(), ctx.path(),
                     ModeToStr(ctx.mode()), cause);
  return HttpError(http::StatusCodeInternalServerError, std::string(kPanicClientMessage))
      .withInternal(fmt::format("panic recovery: {}", cause));
}

HandlerResult DefaultErrorHandler(ExecutionContext& ctx, const HttpError& error) {
  ErrorPayload payload{std::string(error.message()), std::nullopt, std::nullopt};
  if (error.code() == http::StatusCodeMethodNotAllowed) {
    payload.allowed_methods = SplitAllowHeader(ctx.response().headerValueOrEmpty(http::Allow));
  }
  if (error.hasInternal() && ctx.mode() == Mode::Debug) {
    payload._debug_info = DebugInfo{std::string(error.internal())};
  }

  const FieldLogger logger = ctx.logger().withFields(
      {{"status_code", std::to_string(error.code())}, {"internal_error_details", std::string(error.internal())}});
  if (error.code() >= http::StatusCodeInternalServerError) {
    logger.error("HttpError handled for {} {}: {}", ctx.method(), ctx.path(), error.message());
  } else {
    logger.debug("HttpError handled for {} {}: {}", ctx.method(), ctx.path(), error.message());
  }

  return ctx.json(error.code(), payload);
}

}  // namespace xylium
