#pragma once
#include "mercury-itc/Command.hpp"
#include "mercury-itc/export.h"
#include <string>

namespace mercuryitc {

/// Builds Mercury command lines and extracts reply payloads.
/// All functions are pure.
class MERCURY_ITC_API CommandProtocol {
public:
  static constexpr const char *READ_VERB = "READ:";
  static constexpr const char *SET_VERB = "SET:";
  static constexpr const char *IDENTITY_QUERY = "*IDN?";
  static constexpr const char *CATALOGUE_QUERY = "SYS:CAT";

  /// Query outside the device address convention. The verb defaults to
  /// empty (`*IDN?`); the catalogue is read as `READ:SYS:CAT`.
  static Command build_query(const std::string &path,
                             const std::string &verb = "");

  /// READ:<address>:SIG:<signal>
  static Command build_read(const std::string &address,
                            const std::string &signal);

  /// SET:<payload>, payload supplied verbatim by the caller
  static Command build_set(const std::string &payload);

  /// SET:<address>:<setting>:<bare magnitude>
  static Command build_set_value(const std::string &address,
                                 const std::string &setting, double value,
                                 const std::string &unit);

  /// Last ':'-separated field of a reply line. The echoed prefix is not
  /// checked.
  static std::string parse_response(const std::string &raw);
};

} // namespace mercuryitc
