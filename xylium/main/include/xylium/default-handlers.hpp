#pragma once

#include <string_view>

#include "xylium/execution-context.hpp"
#include "xylium/http-error.hpp"
#include "xylium/middleware.hpp"

namespace xylium {

// Returns a 404 error naming the requested path.
HandlerResult DefaultNotFoundHandler(ExecutionContext& ctx);

// Returns a 405 error naming the method and the path. The router sets the Allow header beforehand.
HandlerResult DefaultMethodNotAllowedHandler(ExecutionContext& ctx);

// Returns a generic 500 error, with cause attached as internal error.
HandlerResult DefaultPanicHandler(ExecutionContext& ctx, std::string_view cause);

// Writes error as a JSON object {"error": message}.
// A 405 error also lists the allowed methods (read back from the Allow response header) under
// "allowed_methods". In debug mode, the internal cause is exposed under "_debug_info".
HandlerResult DefaultErrorHandler(ExecutionContext& ctx, const HttpError& error);

}  // namespace xylium
