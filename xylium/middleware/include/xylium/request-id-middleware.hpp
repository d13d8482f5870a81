#pragma once

#include <functional>
#include <string>

#include "xylium/http-constants.hpp"
#include "xylium/middleware.hpp"

namespace xylium {

struct RequestIdConfig {
  // Generates an id for requests that do not carry one. Default: GenerateUuidV4.
  std::function<std::string()> generator;

  // Header read from the request and written to the response.
  std::string headerName{http::XRequestId};

  RequestIdConfig& withGenerator(std::function<std::string()> newGenerator);

  RequestIdConfig& withHeaderName(std::string newHeaderName);

  // Throws ConfigError if headerName is empty.
  void validate() const;
};

// Returns a random RFC 4122 version 4 UUID, in its canonical lowercase 36 chars form.
[[nodiscard]] std::string GenerateUuidV4();

// Reuses the request id header of the incoming request, or generates a new one.
// The id is stored in the request store under kRequestIdStoreKey (so that ExecutionContext::logger() adds it
// as a 'request_id' field) and echoed in the response headers.
// Throws ConfigError if config is invalid.
[[nodiscard]] Middleware RequestId(RequestIdConfig config = {});

}  // namespace xylium
