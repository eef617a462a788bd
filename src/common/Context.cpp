#include "common/Context.hpp"

#include "common/Errors.hpp"

#include <algorithm>

namespace zonesync::common {

Context::Context() = default;

Context Context::withTimeout(std::chrono::milliseconds durTimeout) {
  Context ctx;
  ctx._oDeadline = Clock::now() + durTimeout;
  return ctx;
}

Context Context::childWithTimeout(std::chrono::milliseconds durTimeout) const {
  Context ctxChild = *this;
  const auto tpDeadline = Clock::now() + durTimeout;
  ctxChild._oDeadline = _oDeadline ? std::min(*_oDeadline, tpDeadline) : tpDeadline;
  return ctxChild;
}

void Context::cancel() { _ssCancel.request_stop(); }

bool Context::cancelled() const { return _ssCancel.stop_requested(); }

bool Context::expired() const { return _oDeadline && Clock::now() >= *_oDeadline; }

std::optional<std::chrono::milliseconds> Context::remaining() const {
  if (!_oDeadline) {
    return std::nullopt;
  }
  auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(*_oDeadline - Clock::now());
  return std::max(durLeft, std::chrono::milliseconds{0});
}

void Context::throwIfDone() const {
  if (cancelled()) {
    throw CancelledError("cancelled", "operation cancelled by caller");
  }
  if (expired()) {
    throw CancelledError("deadline_exceeded", "operation deadline exceeded");
  }
}

}  // namespace zonesync::common
