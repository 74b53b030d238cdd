#include "mercury-itc/transport/NetworkTransport.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"
#include "mercury-itc/transport/TcpStream.hpp"
#include <algorithm>
#include <utility>

namespace mercuryitc {
namespace transport {

NetworkTransport::NetworkTransport(const NetworkSettings &settings,
                                   StreamFactory factory, ClockPtr clock)
    : settings_(settings), factory_(std::move(factory)),
      clock_(std::move(clock)) {
  if (!factory_) {
    factory_ = [](const NetworkSettings &s) -> ByteStreamPtr {
      return std::make_unique<TcpStream>(s.host, s.port, s.io_timeout);
    };
  }
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }
}

std::string NetworkTransport::connection_info() const {
  return settings_.host + ":" + std::to_string(settings_.port);
}

bool NetworkTransport::initialize() {
  if (settings_.max_attempts < 1 || settings_.receive_buffer == 0) {
    LOG_ERROR("NETWORK", "INIT",
              "Invalid settings for {}: max_attempts={} receive_buffer={}",
              connection_info(), settings_.max_attempts,
              settings_.receive_buffer);
    return false;
  }
  // Connections are opened per command
  LOG_INFO("NETWORK", "INIT", "Using {} ({} attempts, {} ms back-off)",
           connection_info(), settings_.max_attempts,
           settings_.backoff.count());
  return true;
}

std::string NetworkTransport::attempt(const std::string &wire,
                                      bool read_reply) {
  ByteStreamPtr stream = factory_(settings_);
  if (!stream) {
    throw TransportError("no stream available for " + connection_info());
  }

  try {
    stream->open();
    stream->write(wire + LINE_TERMINATOR);

    std::string reply;
    if (read_reply) {
      // TODO: loop until the terminator; a single receive truncates a reply
      // split across TCP segments
      reply = rstrip(stream->read_some(settings_.receive_buffer));
      if (reply.empty()) {
        throw TransportError("empty reply from " + connection_info());
      }
    }
    stream->close();
    return reply;
  } catch (const TransportError &) {
    stream->close();
    throw;
  }
}

CommandResponse NetworkTransport::execute(const Command &cmd) {
  CommandResponse response;
  response.command = cmd.wire_text();
  response.started = clock_->now();

  const bool read_reply = cmd.kind != CommandKind::Set;
  LOG_DEBUG("NETWORK", "COMMAND", "{}", cmd.to_json().dump());
  const int max_attempts = std::max(settings_.max_attempts, 1);

  for (int n = 1; n <= max_attempts; ++n) {
    response.attempts = n;

    // Instrument response latency
    if (read_reply) {
      clock_->sleep_for(settings_.read_throttle);
    }

    try {
      LOG_TRACE("NETWORK", "SEND", "{} (attempt {})", response.command, n);
      response.text_response = attempt(response.command, read_reply);
      response.success = true;
      response.error_message.clear();
      if (read_reply) {
        LOG_DEBUG("NETWORK", "RECV", "{}", response.text_response);
      }
      break;
    } catch (const TransportError &ex) {
      response.error_message = ex.what();
      LOG_WARN("NETWORK", "RETRY",
               "Communication failed on attempt {}/{} for '{}': {}", n,
               max_attempts, response.command, ex.what());
    }

    if (n < max_attempts) {
      clock_->sleep_for(settings_.backoff);
    }
  }

  if (!response.success) {
    LOG_ERROR("NETWORK", "EXECUTE",
              "Communication failed {} times for '{}', giving up",
              response.attempts, response.command);
  }
  response.finished = clock_->now();
  LOG_TRACE("NETWORK", "EXCHANGE", "{}", response.to_json().dump());
  return response;
}

} // namespace transport
} // namespace mercuryitc
