#include "mercury-itc/ClientConfig.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"
#include "mercury-itc/transport/NetworkTransport.hpp"
#include "mercury-itc/transport/SerialTransport.hpp"

#include <set>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace mercuryitc {

namespace {

std::string key_path(const std::string &section, const std::string &key) {
  return section.empty() ? key : section + "." + key;
}

template <typename T>
T read_value(const YAML::Node &node, const std::string &section,
             const std::string &key, const T &fallback) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return fallback;
  }
  try {
    return value.as<T>();
  } catch (const YAML::Exception &ex) {
    throw ConfigError("Invalid value for '" + key_path(section, key) +
                      "': " + ex.what());
  }
}

std::chrono::milliseconds read_ms(const YAML::Node &node,
                                  const std::string &section,
                                  const std::string &key,
                                  std::chrono::milliseconds fallback) {
  auto ms = read_value<int64_t>(node, section, key, fallback.count());
  if (ms < 0) {
    throw ConfigError("'" + key_path(section, key) + "' must not be negative");
  }
  return std::chrono::milliseconds(ms);
}

std::vector<std::string> read_list(const YAML::Node &node,
                                   const std::string &section,
                                   const std::string &key,
                                   const std::vector<std::string> &fallback) {
  const YAML::Node value = node[key];
  if (!value) {
    return fallback;
  }
  if (!value.IsSequence()) {
    throw ConfigError("'" + key_path(section, key) + "' must be a sequence");
  }
  return read_value<std::vector<std::string>>(node, section, key, fallback);
}

void require_map(const YAML::Node &node, const std::string &section) {
  if (node && !node.IsMap()) {
    throw ConfigError("'" + section + "' must be a map");
  }
}

void require_devices(const std::map<std::string, std::string> &devices,
                     const std::vector<std::string> &keys,
                     const std::string &section) {
  for (const auto &key : keys) {
    if (!devices.count(key)) {
      throw ConfigError("'" + section + "' references unknown device '" +
                        key + "'");
    }
  }
}

void parse_transport(const YAML::Node &node, ClientConfig &config) {
  require_map(node, "transport");
  if (!node) {
    return;
  }

  std::string type = read_value<std::string>(node, "transport", "type",
                                             to_string(config.transport));
  if (type == "serial") {
    config.transport = TransportKind::Serial;
  } else if (type == "network") {
    config.transport = TransportKind::Network;
  } else {
    throw ConfigError("Unknown transport type '" + type +
                      "' (expected 'serial' or 'network')");
  }

  auto &serial = config.serial;
  serial.device = read_value(node, "transport", "device", serial.device);
  serial.baud = read_value(node, "transport", "baud", serial.baud);
  serial.read_timeout =
      read_ms(node, "transport", "read_timeout_ms", serial.read_timeout);
  serial.settle_delay =
      read_ms(node, "transport", "settle_ms", serial.settle_delay);
  serial.post_write_delay =
      read_ms(node, "transport", "post_write_ms", serial.post_write_delay);

  auto &network = config.network;
  network.host = read_value(node, "transport", "host", network.host);
  network.port = read_value(node, "transport", "port", network.port);
  network.receive_buffer =
      read_value(node, "transport", "receive_buffer", network.receive_buffer);
  network.max_attempts =
      read_value(node, "transport", "max_attempts", network.max_attempts);
  network.backoff = read_ms(node, "transport", "backoff_ms", network.backoff);
  network.read_throttle =
      read_ms(node, "transport", "throttle_ms", network.read_throttle);
  network.io_timeout =
      read_ms(node, "transport", "io_timeout_ms", network.io_timeout);

  if (network.max_attempts < 1) {
    throw ConfigError("'transport.max_attempts' must be at least 1");
  }
  if (network.receive_buffer == 0) {
    throw ConfigError("'transport.receive_buffer' must be positive");
  }
}

void parse_devices(const YAML::Node &node, ClientConfig &config) {
  require_map(node, "devices");
  if (!node) {
    return;
  }

  std::map<std::string, std::string> devices;
  for (const auto &kv : node) {
    if (!kv.first.IsScalar()) {
      throw ConfigError("'devices' keys must be strings");
    }
    auto key = kv.first.Scalar();
    if (!kv.second.IsScalar()) {
      throw ConfigError("'devices." + key + "' must be an address string");
    }
    devices[key] = kv.second.Scalar();
  }
  if (devices.empty()) {
    throw ConfigError("'devices' must not be empty");
  }
  config.devices = std::move(devices);
}

void parse_logging(const YAML::Node &node, ClientConfig &config) {
  static const std::set<std::string> levels = {"trace", "debug", "info",
                                               "warn",  "error", "off"};
  require_map(node, "logging");
  if (!node) {
    return;
  }
  config.logging.file =
      read_value(node, "logging", "file", config.logging.file);
  config.logging.level =
      read_value(node, "logging", "level", config.logging.level);
  if (!levels.count(config.logging.level)) {
    throw ConfigError("Unknown log level '" + config.logging.level + "'");
  }
}

void parse_polling(const YAML::Node &node, ClientConfig &config) {
  require_map(node, "polling");
  if (!node) {
    return;
  }
  auto &polling = config.polling;
  polling.devices = read_list(node, "polling", "devices", polling.devices);
  polling.interval = read_ms(node, "polling", "interval_ms", polling.interval);
  polling.continue_on_error = read_value(node, "polling", "continue_on_error",
                                         polling.continue_on_error);
  polling.output_dir =
      read_value(node, "polling", "output_dir", polling.output_dir);
  if (polling.devices.empty()) {
    throw ConfigError("'polling.devices' must not be empty");
  }
}

void parse_calibration(const YAML::Node &node, ClientConfig &config) {
  require_map(node, "calibration");
  if (!node) {
    return;
  }
  auto &cal = config.calibration;
  cal.reference = read_value(node, "calibration", "reference", cal.reference);
  cal.reference_name =
      read_value(node, "calibration", "reference_name", cal.reference_name);
  cal.sensors = read_list(node, "calibration", "sensors", cal.sensors);
  cal.excitation =
      read_value(node, "calibration", "excitation", cal.excitation);
  cal.interval = read_ms(node, "calibration", "interval_ms", cal.interval);
  cal.continue_on_error = read_value(node, "calibration", "continue_on_error",
                                     cal.continue_on_error);
  cal.output_dir =
      read_value(node, "calibration", "output_dir", cal.output_dir);
  if (cal.sensors.empty()) {
    throw ConfigError("'calibration.sensors' must not be empty");
  }
}

// Defaults of omitted sections are checked too, once devices is final
void check_device_references(const ClientConfig &config) {
  require_devices(config.devices, config.polling.devices, "polling.devices");
  require_devices(config.devices, {config.calibration.reference},
                  "calibration.reference");
  require_devices(config.devices, config.calibration.sensors,
                  "calibration.sensors");
}

} // namespace

std::string to_string(TransportKind kind) {
  return kind == TransportKind::Serial ? "serial" : "network";
}

ClientConfig ClientConfig::from_yaml(const YAML::Node &root) {
  ClientConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("Configuration root must be a map");
  }

  parse_transport(root["transport"], config);
  parse_devices(root["devices"], config);
  parse_logging(root["logging"], config);
  parse_polling(root["polling"], config);
  parse_calibration(root["calibration"], config);
  check_device_references(config);
  return config;
}

ClientConfig ClientConfig::load_file(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError("Failed to load config '" + path + "': " + ex.what());
  }
  auto config = from_yaml(root);
  LOG_INFO("CONFIG", "LOAD", "Loaded {} ({} transport, {} devices)", path,
           to_string(config.transport), config.devices.size());
  return config;
}

transport::TransportPtr ClientConfig::create_transport() const {
  if (transport == TransportKind::Serial) {
    return std::make_unique<transport::SerialTransport>(serial);
  }
  return std::make_unique<transport::NetworkTransport>(network);
}

nlohmann::json ClientConfig::to_json() const {
  nlohmann::json j;

  nlohmann::json t;
  t["type"] = to_string(transport);
  if (transport == TransportKind::Serial) {
    t["device"] = serial.device;
    t["baud"] = serial.baud;
    t["read_timeout_ms"] = serial.read_timeout.count();
    t["settle_ms"] = serial.settle_delay.count();
    t["post_write_ms"] = serial.post_write_delay.count();
  } else {
    t["host"] = network.host;
    t["port"] = network.port;
    t["receive_buffer"] = network.receive_buffer;
    t["max_attempts"] = network.max_attempts;
    t["backoff_ms"] = network.backoff.count();
    t["throttle_ms"] = network.read_throttle.count();
    t["io_timeout_ms"] = network.io_timeout.count();
  }
  j["transport"] = t;
  j["devices"] = devices;
  j["logging"] = {{"file", logging.file}, {"level", logging.level}};
  j["polling"] = {{"devices", polling.devices},
                  {"interval_ms", polling.interval.count()},
                  {"continue_on_error", polling.continue_on_error},
                  {"output_dir", polling.output_dir}};
  j["calibration"] = {{"reference", calibration.reference},
                      {"reference_name", calibration.reference_name},
                      {"sensors", calibration.sensors},
                      {"excitation", calibration.excitation},
                      {"interval_ms", calibration.interval.count()},
                      {"continue_on_error", calibration.continue_on_error},
                      {"output_dir", calibration.output_dir}};
  return j;
}

} // namespace mercuryitc
