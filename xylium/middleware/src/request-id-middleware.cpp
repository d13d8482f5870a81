#include "xylium/request-id-middleware.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/config-error.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/middleware.hpp"

namespace xylium {

RequestIdConfig& RequestIdConfig::withGenerator(std::function<std::string()> newGenerator) {
  generator = std::move(newGenerator);
  return *this;
}

RequestIdConfig& RequestIdConfig::withHeaderName(std::string newHeaderName) {
  headerName = std::move(newHeaderName);
  return *this;
}

void RequestIdConfig::validate() const {
  if (headerName.empty()) {
    throw ConfigError("Request id header name cannot be empty");
  }
}

std::string GenerateUuidV4() {
  static constexpr std::string_view kHexDigits = "0123456789abcdef";

  thread_local std::mt19937_64 gen(std::random_device{}());

  std::array<uint8_t, 16> bytes;
  for (std::size_t pos = 0; pos < bytes.size(); pos += sizeof(uint64_t)) {
    uint64_t rnd = gen();
    for (std::size_t byteIdx = 0; byteIdx < sizeof(uint64_t); ++byteIdx) {
      bytes[pos + byteIdx] = static_cast<uint8_t>(rnd & 0xFFU);
      rnd >>= 8;
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0FU) | 0x40U);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3FU) | 0x80U);  // RFC 4122 variant

  std::string uuid;
  uuid.reserve(36);
  for (std::size_t byteIdx = 0; byteIdx < bytes.size(); ++byteIdx) {
    if (byteIdx == 4 || byteIdx == 6 || byteIdx == 8 || byteIdx == 10) {
      uuid.push_back('-');
    }
    uuid.push_back(kHexDigits[bytes[byteIdx] >> 4]);
    uuid.push_back(kHexDigits[bytes[byteIdx] & 0x0FU]);
  }
  return uuid;
}

Middleware RequestId(RequestIdConfig config) {
  config.validate();
  if (!config.generator) {
    config.generator = GenerateUuidV4;
  }
  auto pConfig = std::make_shared<const RequestIdConfig>(std::move(config));
  return [pConfig](Handler next) -> Handler {
    return [pConfig, next = std::move(next)](ExecutionContext& ctx) -> HandlerResult {
      std::string requestId(ctx.header(pConfig->headerName));
      if (requestId.empty()) {
        requestId = pConfig->generator();
      }
      ctx.setHeader(pConfig->headerName, requestId);
      ctx.set(kRequestIdStoreKey, std::move(requestId));
      return next(ctx);
    };
  };
}

}  // namespace xylium
