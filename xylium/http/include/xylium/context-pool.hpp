#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

#include "xylium/cancellation-token.hpp"
#include "xylium/execution-context.hpp"
#include "xylium/field-logger.hpp"
#include "xylium/http-request.hpp"
#include "xylium/http-response.hpp"
#include "xylium/mode.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Reuse pool of ExecutionContext objects.
// Contexts are heap allocated once and recycled: their containers keep their capacity between requests.
// acquire() and release() are thread safe, a checked-out context is exclusively owned by its request.
class ContextPool {
 public:
  // Scoped checkout of a context, released on destruction on every exit path.
  class Lease {
   public:
    Lease(ContextPool& pool, const HttpRequest& request, HttpResponse& response, CancellationToken parent = {})
        : _pool(&pool), _ctx(pool.acquire(request, response, std::move(parent))) {}

    Lease(const Lease&) = delete;
    Lease(Lease&& other) noexcept : _pool(other._pool), _ctx(std::move(other._ctx)) {}
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;

    ~Lease() {
      if (_ctx) {
        _pool->release(std::move(_ctx));
      }
    }

    ExecutionContext& operator*() const noexcept { return *_ctx; }
    ExecutionContext* operator->() const noexcept { return _ctx.get(); }

   private:
    ContextPool* _pool;
    std::unique_ptr<ExecutionContext> _ctx;
  };

  // Creates a pool with initialCapacity contexts already allocated.
  explicit ContextPool(std::size_t initialCapacity = 0, FieldLogger logger = {}, Mode mode = Mode::Release);

  // Checks out a context attached to given transport handles. Its cancellation token is a new child of parent,
  // or the Background token if parent is null. The context has an empty chain, store and params and its cursor is before
  // the first step.
  [[nodiscard]] std::unique_ptr<ExecutionContext> acquire(const HttpRequest& request, HttpResponse& response,
                                                          CancellationToken parent = {});

  // Resets ctx and puts it back in the free list. Must be called exactly once per acquired context.
  void release(std::unique_ptr<ExecutionContext> ctx) noexcept;

  // Number of contexts ready to be acquired.
  [[nodiscard]] std::size_t nbIdle() const;

  // Number of contexts created by this pool since its construction.
  [[nodiscard]] std::size_t nbCreated() const;

  [[nodiscard]] const FieldLogger& logger() const noexcept { return _logger; }

  [[nodiscard]] Mode mode() const noexcept { return _mode; }

 private:
  mutable std::mutex _mutex;
  vector<std::unique_ptr<ExecutionContext>> _free;
  std::size_t _nbCreated{};
  FieldLogger _logger;
  Mode _mode;
};

}  // namespace xylium
