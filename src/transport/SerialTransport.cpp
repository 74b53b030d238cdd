#include "mercury-itc/transport/SerialTransport.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"
#include "mercury-itc/transport/SerialStream.hpp"
#include <utility>

namespace mercuryitc {
namespace transport {

SerialTransport::SerialTransport(const SerialSettings &settings,
                                 ByteStreamPtr stream, ClockPtr clock)
    : settings_(settings), stream_(std::move(stream)),
      clock_(std::move(clock)) {
  if (!stream_) {
    stream_ = std::make_unique<SerialStream>(settings_);
  }
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }
}

SerialTransport::~SerialTransport() { shutdown(); }

std::string SerialTransport::connection_info() const {
  return stream_->describe();
}

bool SerialTransport::is_open() const { return stream_->is_open(); }

bool SerialTransport::initialize() {
  if (stream_->is_open()) {
    return true;
  }

  LOG_INFO("SERIAL", "INIT", "Opening {}", connection_info());
  try {
    stream_->open();
  } catch (const TransportError &ex) {
    LOG_ERROR("SERIAL", "INIT", "Failed to open {}: {}", connection_info(),
              ex.what());
    return false;
  }

  // Firmware needs time after the line comes up before it accepts commands
  clock_->sleep_for(settings_.settle_delay);
  return true;
}

void SerialTransport::shutdown() {
  if (stream_ && stream_->is_open()) {
    LOG_INFO("SERIAL", "SHUTDOWN", "Closing {}", connection_info());
    stream_->close();
  }
}

CommandResponse SerialTransport::execute(const Command &cmd) {
  CommandResponse response;
  response.command = cmd.wire_text();
  response.started = clock_->now();
  response.attempts = 1;

  if (!stream_->is_open()) {
    response.error_message = "serial port " + connection_info() + " not open";
    response.finished = clock_->now();
    LOG_ERROR("SERIAL", "EXECUTE", "{}", response.error_message);
    return response;
  }

  try {
    LOG_DEBUG("SERIAL", "SEND", "{}", cmd.to_json().dump());
    stream_->write(response.command + LINE_TERMINATOR);

    // No pipelining: the instrument is slow to digest a write
    clock_->sleep_for(settings_.post_write_delay);

    auto line = stream_->read_line(settings_.read_timeout);
    stream_->flush();

    if (cmd.kind == CommandKind::Set) {
      if (line) {
        LOG_DEBUG("SERIAL", "ACK", "{}", rstrip(*line));
      } else {
        LOG_WARN("SERIAL", "ACK", "No acknowledgement for '{}'",
                 response.command);
      }
      response.success = true;
    } else if (!line) {
      response.error_message =
          "no reply within " + std::to_string(settings_.read_timeout.count()) +
          " ms";
    } else {
      response.text_response = rstrip(*line);
      response.success = true;
      LOG_DEBUG("SERIAL", "RECV", "{}", response.text_response);
    }
  } catch (const TransportError &ex) {
    response.success = false;
    response.error_message = ex.what();
  }

  if (!response.success) {
    LOG_ERROR("SERIAL", "EXECUTE", "'{}' failed: {}", response.command,
              response.error_message);
  }
  response.finished = clock_->now();
  LOG_TRACE("SERIAL", "EXCHANGE", "{}", response.to_json().dump());
  return response;
}

} // namespace transport
} // namespace mercuryitc
