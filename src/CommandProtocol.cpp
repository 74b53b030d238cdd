#include "mercury-itc/CommandProtocol.hpp"
#include "mercury-itc/ValueCodec.hpp"

namespace mercuryitc {

Command CommandProtocol::build_query(const std::string &path,
                                     const std::string &verb) {
  Command cmd;
  cmd.kind = CommandKind::Query;
  cmd.verb = verb;
  cmd.path = path;
  cmd.expects_response = true;
  return cmd;
}

Command CommandProtocol::build_read(const std::string &address,
                                    const std::string &signal) {
  Command cmd;
  cmd.kind = CommandKind::Read;
  cmd.verb = READ_VERB;
  cmd.path = address + ":SIG:" + signal;
  cmd.expects_response = true;
  return cmd;
}

Command CommandProtocol::build_set(const std::string &payload) {
  Command cmd;
  cmd.kind = CommandKind::Set;
  cmd.verb = SET_VERB;
  cmd.path = payload;
  cmd.expects_response = false;
  return cmd;
}

Command CommandProtocol::build_set_value(const std::string &address,
                                         const std::string &setting,
                                         double value,
                                         const std::string &unit) {
  return build_set(address + ":" + setting + ":" +
                   ValueCodec::encode_magnitude(value, unit));
}

std::string CommandProtocol::parse_response(const std::string &raw) {
  auto pos = raw.rfind(':');
  if (pos == std::string::npos) {
    return raw;
  }
  return raw.substr(pos + 1);
}

} // namespace mercuryitc
