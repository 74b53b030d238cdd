#pragma once
#include "mercury-itc/Command.hpp"
#include "mercury-itc/DeviceRegistry.hpp"
#include "mercury-itc/export.h"
#include "mercury-itc/transport/Transport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mercuryitc {

/// Electrical state of one sensor board. The values come from separate
/// READ commands and are therefore sampled at slightly different instants.
struct MERCURY_ITC_API SensorReadout {
  double voltage{0.0};
  double current{0.0};
  double resistance{0.0};
  std::optional<double> temperature;

  nlohmann::json to_json() const;
};

/// Device-level operations on a Mercury ITC.
///
/// Owns its transport exclusively; calls block until the exchange completes
/// or the transport gives up. Not safe for concurrent use.
class MERCURY_ITC_API InstrumentClient {
public:
  explicit InstrumentClient(
      transport::TransportPtr transport,
      DeviceRegistry registry = DeviceRegistry::mercury_defaults());
  ~InstrumentClient();

  InstrumentClient(const InstrumentClient &) = delete;
  InstrumentClient &operator=(const InstrumentClient &) = delete;

  /// Open the transport; throws TransportError on failure
  void connect();

  void disconnect();

  /// Raw reply to *IDN?
  std::string get_identity();

  /// Raw reply to the system catalogue query
  std::string list_devices();

  /// Decoded signal value in base SI units
  double get_signal(const std::string &device_key, const std::string &signal);

  /// SET:<payload>; the acknowledgement is not interpreted. Returns the
  /// exchange record (wire text, attempts, timing).
  CommandResponse set_raw(const std::string &payload);

  /// SET:<address>:<setting>:<bare magnitude>
  CommandResponse set_value(const std::string &device_key,
                            const std::string &setting, double value,
                            const std::string &unit = "");

  /// VOLT, CURR, RES and optionally TEMP, read in that order
  SensorReadout get_sensor_readout(const std::string &device_key,
                                   bool include_temperature = false);

  const DeviceRegistry &registry() const { return registry_; }

  transport::Transport &transport() { return *transport_; }

private:
  // Throws FatalCommunicationError or TransportError when the exchange fails
  CommandResponse exchange(const Command &cmd);

  transport::TransportPtr transport_;
  DeviceRegistry registry_;
};

} // namespace mercuryitc
