#include "mercury-itc/acquisition/CancellationToken.hpp"
#include <algorithm>

namespace mercuryitc {
namespace acquisition {

bool CancellationToken::wait_for(std::chrono::milliseconds timeout,
                                 transport::Clock &clock) const {
  auto remaining = timeout;
  while (!is_cancelled() && remaining.count() > 0) {
    auto slice = std::min(remaining, WAIT_SLICE);
    clock.sleep_for(slice);
    remaining -= slice;
  }
  return is_cancelled();
}

} // namespace acquisition
} // namespace mercuryitc
