#include "mercury-itc/InstrumentClient.hpp"
#include "mercury-itc/CommandProtocol.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"
#include "mercury-itc/ValueCodec.hpp"
#include <utility>

namespace mercuryitc {

nlohmann::json SensorReadout::to_json() const {
  nlohmann::json j;
  j["voltage"] = voltage;
  j["current"] = current;
  j["resistance"] = resistance;
  if (temperature) {
    j["temperature"] = *temperature;
  }
  return j;
}

InstrumentClient::InstrumentClient(transport::TransportPtr transport,
                                   DeviceRegistry registry)
    : transport_(std::move(transport)), registry_(std::move(registry)) {
  if (!transport_) {
    throw ItcError("InstrumentClient requires a transport");
  }
}

InstrumentClient::~InstrumentClient() { disconnect(); }

void InstrumentClient::connect() {
  if (!transport_->initialize()) {
    throw TransportError("Failed to initialize " +
                         transport_->transport_type() + " transport to " +
                         transport_->connection_info());
  }
  LOG_INFO("CLIENT", "CONNECT", "Connected via {} ({})",
           transport_->transport_type(), transport_->connection_info());
}

void InstrumentClient::disconnect() {
  if (transport_) {
    transport_->shutdown();
  }
}

CommandResponse InstrumentClient::exchange(const Command &cmd) {
  CommandResponse response = transport_->execute(cmd);
  if (response.success) {
    return response;
  }

  if (transport_->retries_failures()) {
    throw FatalCommunicationError(response.command, response.attempts,
                                  response.error_message);
  }
  throw TransportError("'" + response.command +
                       "' failed: " + response.error_message);
}

std::string InstrumentClient::get_identity() {
  return exchange(CommandProtocol::build_query(CommandProtocol::IDENTITY_QUERY))
      .text_response;
}

std::string InstrumentClient::list_devices() {
  return exchange(CommandProtocol::build_query(CommandProtocol::CATALOGUE_QUERY,
                                               CommandProtocol::READ_VERB))
      .text_response;
}

double InstrumentClient::get_signal(const std::string &device_key,
                                    const std::string &signal) {
  const std::string &address = registry_.address(device_key);
  auto response = exchange(CommandProtocol::build_read(address, signal));

  std::string payload = CommandProtocol::parse_response(response.text_response);
  try {
    double value = ValueCodec::decode(payload);
    LOG_DEBUG("CLIENT", "GET_SIGNAL", "{} {} = {}", device_key, signal, value);
    return value;
  } catch (const DecodeError &ex) {
    LOG_ERROR("CLIENT", "GET_SIGNAL", "{} {}: reply '{}' not decodable: {}",
              device_key, signal, response.text_response, ex.what());
    throw;
  }
}

CommandResponse InstrumentClient::set_raw(const std::string &payload) {
  return exchange(CommandProtocol::build_set(payload));
}

CommandResponse InstrumentClient::set_value(const std::string &device_key,
                                            const std::string &setting,
                                            double value,
                                            const std::string &unit) {
  const std::string &address = registry_.address(device_key);
  return exchange(
      CommandProtocol::build_set_value(address, setting, value, unit));
}

SensorReadout InstrumentClient::get_sensor_readout(const std::string &device_key,
                                                   bool include_temperature) {
  SensorReadout readout;
  readout.voltage = get_signal(device_key, "VOLT");
  readout.current = get_signal(device_key, "CURR");
  readout.resistance = get_signal(device_key, "RES");
  if (include_temperature) {
    readout.temperature = get_signal(device_key, "TEMP");
  }
  return readout;
}

} // namespace mercuryitc
