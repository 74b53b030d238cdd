#pragma once
#include "mercury-itc/export.h"
#include <map>
#include <string>
#include <vector>

namespace mercuryitc {

/// Read-only mapping of short device keys to instrument addresses
class MERCURY_ITC_API DeviceRegistry {
public:
  DeviceRegistry() = default;
  explicit DeviceRegistry(std::map<std::string, std::string> devices);

  /// The three-board bench layout (DB7, DB6, MB1 temperature boards)
  static DeviceRegistry mercury_defaults();

  /// Address for a key; throws UnknownDeviceError when absent
  const std::string &address(const std::string &key) const;

  bool contains(const std::string &key) const;

  std::vector<std::string> keys() const;

  size_t size() const { return devices_.size(); }

  bool empty() const { return devices_.empty(); }

private:
  std::map<std::string, std::string> devices_;
};

} // namespace mercuryitc
