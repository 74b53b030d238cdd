#include "mercury-itc/DeviceRegistry.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"
#include <utility>

namespace mercuryitc {

DeviceRegistry::DeviceRegistry(std::map<std::string, std::string> devices)
    : devices_(std::move(devices)) {}

DeviceRegistry DeviceRegistry::mercury_defaults() {
  return DeviceRegistry({{"db7", "DEV:DB7.T1:TEMP"},
                         {"db6", "DEV:DB6.T1:TEMP"},
                         {"mb1", "DEV:MB1.T1:TEMP"}});
}

const std::string &DeviceRegistry::address(const std::string &key) const {
  auto it = devices_.find(key);
  if (it == devices_.end()) {
    LOG_ERROR("REGISTRY", "LOOKUP", "Unknown device key: {}", key);
    throw UnknownDeviceError(key);
  }
  return it->second;
}

bool DeviceRegistry::contains(const std::string &key) const {
  return devices_.count(key) > 0;
}

std::vector<std::string> DeviceRegistry::keys() const {
  std::vector<std::string> names;
  names.reserve(devices_.size());
  for (const auto &[key, _] : devices_) {
    names.push_back(key);
  }
  return names;
}

} // namespace mercuryitc
