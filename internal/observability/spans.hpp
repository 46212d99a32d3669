#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace strata::runtime::config {
class RuntimeConfig;
}

namespace strata::observability {

// Span names emitted by the runner.
inline constexpr std::string_view kRunUpSpan        = "strata.run.up";
inline constexpr std::string_view kRunDownSpan      = "strata.run.down";
inline constexpr std::string_view kRunForceUpSpan   = "strata.run.force_up";
inline constexpr std::string_view kRunForceDownSpan = "strata.run.force_down";
inline constexpr std::string_view kStepSpan         = "strata.step";

// Attribute keys.
inline constexpr std::string_view kVersionAttr   = "strata.migration.version";
inline constexpr std::string_view kDirectionAttr = "strata.migration.direction";
inline constexpr std::string_view kStepsAttr     = "strata.run.steps";
inline constexpr std::string_view kCompletedAttr = "strata.run.completed";

// Returns false when tracing is disabled in config or compiled out.
bool InitializeTracing(const strata::runtime::config::RuntimeConfig& config);
// Flushes pending spans. The process is about to exit after a run.
void ShutdownTracing();

/*
  RAII span, active for its lifetime. Without ENABLE_OTEL every member is an
  inline no-op, so call sites need no guards.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::uint64_t value);

  // Error status plus an "exception" event carrying the cause.
  void Fail(std::string_view cause);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const strata::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::uint64_t) {
}

inline void SpanScope::Fail(std::string_view) {
}
#endif

} // namespace strata::observability
