#pragma once
#include "mercury-itc/export.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace mercuryitc {

enum class CommandKind { Query, Read, Set };

MERCURY_ITC_API std::string to_string(CommandKind kind);

/// Outbound request: verb + path, rendered to one ASCII line on the wire
struct MERCURY_ITC_API Command {
  CommandKind kind{CommandKind::Query};
  std::string verb; // "READ:", "SET:" or empty for bare queries
  std::string path; // e.g. "DEV:DB7.T1:TEMP:SIG:TEMP"

  // Whether the caller needs the reply payload. SET acknowledgements are
  // not needed even where the link delivers one.
  bool expects_response{true};

  /// Text sent to the instrument, without line terminator
  std::string wire_text() const { return verb + path; }

  nlohmann::json to_json() const;
};

/// Outcome of one command exchange over a transport
struct MERCURY_ITC_API CommandResponse {
  std::string command; // wire text of the command
  bool success{false};

  // Reply line with trailing whitespace removed (empty for unread SETs)
  std::string text_response;

  // Error info
  std::string error_message;
  int attempts{0};

  // Timing
  std::chrono::steady_clock::time_point started;
  std::chrono::steady_clock::time_point finished;

  std::chrono::microseconds duration() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(finished -
                                                                 started);
  }

  nlohmann::json to_json() const;
};

} // namespace mercuryitc
