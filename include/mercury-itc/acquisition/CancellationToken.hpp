#pragma once
#include "mercury-itc/export.h"
#include "mercury-itc/transport/Clock.hpp"
#include <atomic>
#include <chrono>

namespace mercuryitc {
namespace acquisition {

/// Cooperative stop flag for long-running acquisition loops.
/// cancel() is a single lock-free store and may be called from a signal
/// handler.
class MERCURY_ITC_API CancellationToken {
public:
  static constexpr std::chrono::milliseconds WAIT_SLICE{50};

  void cancel() { cancelled_.store(true); }

  bool is_cancelled() const { return cancelled_.load(); }

  /// Sleep up to timeout in short slices. Returns true if cancelled.
  bool wait_for(std::chrono::milliseconds timeout,
                transport::Clock &clock) const;

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace acquisition
} // namespace mercuryitc
