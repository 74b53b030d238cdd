#pragma once
#include "mercury-itc/transport/ByteStream.hpp"
#include "mercury-itc/transport/Clock.hpp"
#include "mercury-itc/transport/Transport.hpp"
#include "mercury-itc/transport/TransportSettings.hpp"
#include <functional>

namespace mercuryitc {
namespace transport {

/// Per-call connection: a fresh stream for every command, bounded retry.
///
/// Each attempt opens, writes "<command>\r\n", performs a single receive of
/// up to receive_buffer bytes (reads only) and closes. A failed attempt is
/// discarded whole, followed by the back-off, up to max_attempts in total.
/// SET commands are written without reading a reply.
class MERCURY_ITC_API NetworkTransport : public Transport {
public:
  static constexpr const char *LINE_TERMINATOR = "\r\n";

  using StreamFactory =
      std::function<ByteStreamPtr(const NetworkSettings &settings)>;

  explicit NetworkTransport(const NetworkSettings &settings,
                            StreamFactory factory = nullptr,
                            ClockPtr clock = nullptr);

  CommandResponse execute(const Command &cmd) override;
  bool initialize() override;
  void shutdown() override {}
  std::string transport_type() const override { return "network"; }
  std::string connection_info() const override;
  bool retries_failures() const override { return true; }

  const NetworkSettings &settings() const { return settings_; }

private:
  // Throws TransportError on any failure of the single attempt
  std::string attempt(const std::string &wire, bool read_reply);

  NetworkSettings settings_;
  StreamFactory factory_;
  ClockPtr clock_;
};

} // namespace transport
} // namespace mercuryitc
