#pragma once

#include <string_view>

#include "xylium/http-status-code.hpp"

namespace xylium::http {

// Header field names are case-insensitive (RFC 9110 §5.1). They are stored here in their conventional
// canonical form for emission, lookups in HttpRequest and HttpResponse compare them case-insensitively.
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view RetryAfter = "Retry-After";
inline constexpr std::string_view XForwardedFor = "X-Forwarded-For";
inline constexpr std::string_view XRealIp = "X-Real-IP";
inline constexpr std::string_view XRequestId = "X-Request-ID";
inline constexpr std::string_view XRateLimitLimit = "X-RateLimit-Limit";
inline constexpr std::string_view XRateLimitRemaining = "X-RateLimit-Remaining";
inline constexpr std::string_view XRateLimitReset = "X-RateLimit-Reset";

// Content type
inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJsonUtf8 = "application/json; charset=utf-8";

// Reason Phrases (only those returned by the default error policies)
inline constexpr std::string_view ReasonOK = "OK";                                    // 200
inline constexpr std::string_view ReasonNoContent = "No Content";                     // 204
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                   // 400
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";                // 401
inline constexpr std::string_view ReasonForbidden = "Forbidden";                      // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                       // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";      // 405
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";           // 408
inline constexpr std::string_view ReasonConflict = "Conflict";                        // 409
inline constexpr std::string_view ReasonUnprocessableEntity = "Unprocessable Entity";  // 422
inline constexpr std::string_view ReasonTooManyRequests = "Too Many Requests";        // 429
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";           // 501
inline constexpr std::string_view ReasonBadGateway = "Bad Gateway";                   // 502
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";   // 503
inline constexpr std::string_view ReasonGatewayTimeout = "Gateway Timeout";           // 504

constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRequestTimeout:
      return ReasonRequestTimeout;
    case StatusCodeConflict:
      return ReasonConflict;
    case StatusCodeUnprocessableEntity:
      return ReasonUnprocessableEntity;
    case StatusCodeTooManyRequests:
      return ReasonTooManyRequests;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeBadGateway:
      return ReasonBadGateway;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeGatewayTimeout:
      return ReasonGatewayTimeout;
    default:
      return {};
  }
}

}  // namespace xylium::http
