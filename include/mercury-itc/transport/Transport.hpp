#pragma once
#include "mercury-itc/Command.hpp"
#include "mercury-itc/export.h"
#include <memory>
#include <string>

namespace mercuryitc {
namespace transport {

/// Transport: carries one Command to the instrument and returns the outcome.
/// Implementations pair every command with its reply and never interleave
/// two commands. Failures are reported in the CommandResponse, not thrown.
class MERCURY_ITC_API Transport {
public:
  virtual ~Transport() = default;

  /// Execute a command and return the response
  virtual CommandResponse execute(const Command &cmd) = 0;

  /// Connect to the instrument
  virtual bool initialize() = 0;

  /// Disconnect
  virtual void shutdown() = 0;

  /// Transport type for logging ("serial", "network", ...)
  virtual std::string transport_type() const = 0;

  /// Endpoint description
  virtual std::string connection_info() const = 0;

  /// Whether exhausted retries stand behind a failed response
  virtual bool retries_failures() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

} // namespace transport
} // namespace mercuryitc
