#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace mercuryitc {
namespace transport {

/// Serial line parameters. The instrument needs a settle period after the
/// line is opened and cannot take pipelined writes.
struct SerialSettings {
  std::string device{"/dev/ttyUSB0"};
  int baud{115200};
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds settle_delay{2000};
  std::chrono::milliseconds post_write_delay{3000};
};

/// TCP parameters for the per-command connection variant
struct NetworkSettings {
  std::string host{"10.1.15.220"};
  uint16_t port{7020};
  size_t receive_buffer{4096};
  int max_attempts{5};
  std::chrono::milliseconds backoff{1000};
  std::chrono::milliseconds read_throttle{100};
  std::chrono::milliseconds io_timeout{5000};
};

} // namespace transport
} // namespace mercuryitc
