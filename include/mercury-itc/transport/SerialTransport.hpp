#pragma once
#include "mercury-itc/transport/ByteStream.hpp"
#include "mercury-itc/transport/Clock.hpp"
#include "mercury-itc/transport/Transport.hpp"
#include "mercury-itc/transport/TransportSettings.hpp"

namespace mercuryitc {
namespace transport {

/// Persistent connection: one stream held open for the transport's lifetime.
///
/// Every command is written with a "\n\r" terminator followed by the
/// post-write delay, then exactly one line is read back. SET acknowledgements
/// are read and discarded so the next command sees its own reply.
class MERCURY_ITC_API SerialTransport : public Transport {
public:
  static constexpr const char *LINE_TERMINATOR = "\n\r";

  explicit SerialTransport(const SerialSettings &settings,
                           ByteStreamPtr stream = nullptr,
                           ClockPtr clock = nullptr);
  ~SerialTransport() override;

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport &operator=(const SerialTransport &) = delete;

  CommandResponse execute(const Command &cmd) override;
  bool initialize() override;
  void shutdown() override;
  std::string transport_type() const override { return "serial"; }
  std::string connection_info() const override;
  bool retries_failures() const override { return false; }

  bool is_open() const;

private:
  SerialSettings settings_;
  ByteStreamPtr stream_;
  ClockPtr clock_;
};

} // namespace transport
} // namespace mercuryitc
