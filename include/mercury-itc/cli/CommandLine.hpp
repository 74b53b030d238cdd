#pragma once
#include "mercury-itc/ClientConfig.hpp"
#include "mercury-itc/Errors.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <vector>

namespace mercuryitc {
namespace cli {

/// Malformed command line; the caller prints usage and exits with 1
class UsageError : public ItcError {
public:
  using ItcError::ItcError;
};

struct GlobalOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> serial_device;
  std::optional<int> baud;
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  bool json{false};
};

struct CommandLine {
  GlobalOptions options;
  bool help{false};
  std::string command;
  std::vector<std::string> args;
};

/// Subcommands understood by mercury-itc
const std::vector<std::string> &commands();

/// Split argv (without the program name) into global options, command and
/// command arguments. Throws UsageError.
CommandLine parse_command_line(const std::vector<std::string> &argv);

/// Whole decimal number within [min, max]; nullopt otherwise
std::optional<long> parse_integer(const std::string &text, long min,
                                  long max);

/// Decimal number, fully consumed
std::optional<double> parse_number(const std::string &text);

/// nullopt for names other than trace|debug|info|warn|error|off
std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &level);

/// Removes "--samples N" from args. Throws UsageError on a bad count.
std::optional<size_t> take_samples(std::vector<std::string> &args);

/// Configuration file (if any) with command-line overrides applied
ClientConfig build_config(const GlobalOptions &opts);

/// Whether the command runs until interrupted
bool is_long_running(const std::string &command);

} // namespace cli
} // namespace mercuryitc
