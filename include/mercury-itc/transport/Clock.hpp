#pragma once
#include "mercury-itc/export.h"
#include <chrono>
#include <memory>

namespace mercuryitc {
namespace transport {

/// Sleep and time source used for settle delays, throttling and back-off
class MERCURY_ITC_API Clock {
public:
  virtual ~Clock() = default;

  virtual void sleep_for(std::chrono::milliseconds duration) = 0;

  virtual std::chrono::steady_clock::time_point now() const = 0;
};

class MERCURY_ITC_API SystemClock : public Clock {
public:
  void sleep_for(std::chrono::milliseconds duration) override;

  std::chrono::steady_clock::time_point now() const override;
};

using ClockPtr = std::shared_ptr<Clock>;

} // namespace transport
} // namespace mercuryitc
