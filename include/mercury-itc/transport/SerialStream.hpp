#pragma once
#include "mercury-itc/transport/ByteStream.hpp"
#include "mercury-itc/transport/TransportSettings.hpp"

#include <termios.h> // speed_t

namespace mercuryitc {
namespace transport {

/// RAII wrapper around one /dev/tty* descriptor, raw 8N1 with one stop bit.
/// Non-copyable.
class MERCURY_ITC_API SerialStream : public ByteStream {
public:
  explicit SerialStream(const SerialSettings &settings);
  ~SerialStream() override;

  SerialStream(const SerialStream &) = delete;
  SerialStream &operator=(const SerialStream &) = delete;

  void open() override;
  void write(const std::string &data) override;
  std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) override;
  std::string read_some(size_t max_bytes) override;
  void flush() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  std::string describe() const override;

  /// termios speed constant for a numeric rate; false if unsupported
  static bool baud_to_speed(int baud, speed_t &speed);

private:
  bool wait_readable(std::chrono::milliseconds timeout);

  SerialSettings settings_;
  int fd_{-1};
  std::string rx_buffer_;
};

} // namespace transport
} // namespace mercuryitc
