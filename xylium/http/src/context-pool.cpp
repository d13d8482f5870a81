#include "xylium/context-pool.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/log.hpp"
#include "xylium/mode.hpp"

namespace xylium {

ContextPool::ContextPool(std::size_t initialCapacity, FieldLogger logger, Mode mode)
    : _nbCreated(initialCapacity), _logger(std::move(logger)), _mode(mode) {
  _free.reserve(initialCapacity);
  for (std::size_t ctxPos = 0; ctxPos < initialCapacity; ++ctxPos) {
    _free.push_back(std::make_unique<ExecutionContext>());
  }
}

std::unique_ptr<ExecutionContext> ContextPool::acquire(const HttpRequest& request, HttpResponse& response,
                                                       CancellationToken parent) {
  std::unique_ptr<ExecutionContext> ctx;
  {
    std::lock_guard lock(_mutex);
    if (_free.empty()) {
      ++_nbCreated;
    } else {
      ctx = std::move(_free.back());
      _free.pop_back();
    }
  }
  if (!ctx) {
    ctx = std::make_unique<ExecutionContext>();
  }
  // A child of the parent, so that cancelling the context token never reaches the caller.
  CancellationToken token =
      parent.isNull() ? CancellationToken::Background() : CancellationToken::WithCancel(parent);
  ctx->attach(&request, &response, std::move(token), _logger, _mode);
  return ctx;
}

void ContextPool::release(std::unique_ptr<ExecutionContext> ctx) noexcept {
  if (!ctx) {
    return;
  }
  try {
    ctx->reset();
    std::lock_guard lock(_mutex);
    _free.push_back(std::move(ctx));
  } catch (const std::exception& ex) {
    // The context is simply dropped, the next acquire allocates a fresh one.
    log::error("Unable to recycle execution context: {}", ex.what());
  }
}

std::size_t ContextPool::nbIdle() const {
  std::lock_guard lock(_mutex);
  return _free.size();
}

std::size_t ContextPool::nbCreated() const {
  std::lock_guard lock(_mutex);
  return _nbCreated;
}

}  // namespace xylium
