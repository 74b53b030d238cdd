#include "mercury-itc/Command.hpp"

namespace mercuryitc {

std::string to_string(CommandKind kind) {
  switch (kind) {
  case CommandKind::Query:
    return "query";
  case CommandKind::Read:
    return "read";
  case CommandKind::Set:
    return "set";
  }
  return "unknown";
}

nlohmann::json Command::to_json() const {
  nlohmann::json j;

  j["kind"] = to_string(kind);
  j["verb"] = verb;
  j["path"] = path;
  j["wire"] = wire_text();
  j["expects_response"] = expects_response;

  return j;
}

nlohmann::json CommandResponse::to_json() const {
  nlohmann::json j;

  j["command"] = command;
  j["success"] = success;
  j["attempts"] = attempts;

  if (success) {
    j["text_response"] = text_response;
  } else {
    j["error_message"] = error_message;
  }

  j["duration_us"] = duration().count();

  return j;
}

} // namespace mercuryitc
