#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

#include "internal/util/result.hpp"

namespace strata::migration {

/*
  Per-run context handed to every Up()/Down() call.

  Carries an optional cancellation flag owned by the caller. The runner
  checks it between steps; long-running migrations may poll it too.
*/
class Context {
 public:
  Context() = default;
  explicit Context(std::shared_ptr<const std::atomic<bool>> cancelled) : cancelled_(std::move(cancelled)) {
  }

  bool Cancelled() const {
    return cancelled_ && cancelled_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<const std::atomic<bool>> cancelled_;
};

/*
  A versioned, reversible unit of work.

  Version() must be unique within a registry and must never change once the
  migration has been applied anywhere (conventionally the unix time in
  seconds at which the migration was created).

  Each migration owns its own atomicity: the runner never compensates a
  failed step.
*/
class Migration {
 public:
  virtual ~Migration() = default;

  virtual std::uint64_t Version() const = 0;

  virtual util::Result Up(const Context& ctx)   = 0;
  virtual util::Result Down(const Context& ctx) = 0;
};

} // namespace strata::migration
