#pragma once
#include "mercury-itc/acquisition/CalibrationRecorder.hpp"
#include "mercury-itc/acquisition/TemperaturePoller.hpp"
#include "mercury-itc/DeviceRegistry.hpp"
#include "mercury-itc/export.h"
#include "mercury-itc/transport/Transport.hpp"
#include "mercury-itc/transport/TransportSettings.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace YAML {
class Node;
}

namespace mercuryitc {

enum class TransportKind { Serial, Network };

struct LoggingConfig {
  std::string file{"mercury_itc.log"};
  std::string level{"info"};
};

/// Everything needed to build a client and its acquisition loops.
/// Sections absent from a document keep their defaults.
struct MERCURY_ITC_API ClientConfig {
  TransportKind transport{TransportKind::Serial};
  transport::SerialSettings serial;
  transport::NetworkSettings network;

  std::map<std::string, std::string> devices{
      {"db7", "DEV:DB7.T1:TEMP"},
      {"db6", "DEV:DB6.T1:TEMP"},
      {"mb1", "DEV:MB1.T1:TEMP"}};

  LoggingConfig logging;
  acquisition::PollerOptions polling;
  acquisition::CalibrationOptions calibration;

  /// Throws ConfigError naming the offending key
  static ClientConfig from_yaml(const YAML::Node &root);

  /// Throws ConfigError when the file cannot be read or is invalid
  static ClientConfig load_file(const std::string &path);

  /// Transport of the configured kind over real serial/TCP streams
  transport::TransportPtr create_transport() const;

  DeviceRegistry create_registry() const { return DeviceRegistry(devices); }

  nlohmann::json to_json() const;
};

MERCURY_ITC_API std::string to_string(TransportKind kind);

} // namespace mercuryitc
