#include "mercury-itc/transport/Clock.hpp"
#include <thread>

namespace mercuryitc {
namespace transport {

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

std::chrono::steady_clock::time_point SystemClock::now() const {
  return std::chrono::steady_clock::now();
}

} // namespace transport
} // namespace mercuryitc
