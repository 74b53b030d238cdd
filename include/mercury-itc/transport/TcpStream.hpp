#pragma once
#include "mercury-itc/transport/ByteStream.hpp"
#include "mercury-itc/transport/TransportSettings.hpp"

namespace mercuryitc {
namespace transport {

/// Blocking TCP client socket with send/receive timeouts
class MERCURY_ITC_API TcpStream : public ByteStream {
public:
  TcpStream(const std::string &host, uint16_t port,
            std::chrono::milliseconds io_timeout);
  ~TcpStream() override;

  TcpStream(const TcpStream &) = delete;
  TcpStream &operator=(const TcpStream &) = delete;

  void open() override;
  void write(const std::string &data) override;
  std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) override;
  std::string read_some(size_t max_bytes) override;
  void flush() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  std::string describe() const override;

private:
  std::string host_;
  uint16_t port_;
  std::chrono::milliseconds io_timeout_;
  int fd_{-1};
  std::string rx_buffer_;
};

} // namespace transport
} // namespace mercuryitc
