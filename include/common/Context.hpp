#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

namespace zonesync::common {

/// Cancellation signal and optional deadline passed to every outbound call.
/// Copies share the cancellation state; a child created with childWithTimeout()
/// is cancelled together with its parent.
/// Class abbreviation: ctx
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  Context();

  /// Root context that expires after durTimeout.
  static Context withTimeout(std::chrono::milliseconds durTimeout);

  /// Child sharing this context's cancellation, with the earlier of the two deadlines.
  Context childWithTimeout(std::chrono::milliseconds durTimeout) const;

  void cancel();
  bool cancelled() const;
  bool expired() const;
  bool isDone() const { return cancelled() || expired(); }

  /// Time left before the deadline, or nullopt when there is none.
  std::optional<std::chrono::milliseconds> remaining() const;

  /// Throws CancelledError if the context is done.
  void throwIfDone() const;

  std::stop_token stopToken() const { return _ssCancel.get_token(); }

 private:
  std::stop_source _ssCancel;
  std::optional<Clock::time_point> _oDeadline;
};

}  // namespace zonesync::common
