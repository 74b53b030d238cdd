#include "mercury-itc/cli/CommandLine.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <limits>

namespace mercuryitc {
namespace cli {

const std::vector<std::string> &commands() {
  static const std::vector<std::string> names = {
      "idn",       "devices", "read",      "readout", "set",
      "set-value", "poll",    "calibrate", "config"};
  return names;
}

std::optional<long> parse_integer(const std::string &text, long min,
                                  long max) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_number(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    return std::nullopt;
  }
  return value;
}

std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return std::nullopt;
}

std::optional<size_t> take_samples(std::vector<std::string> &args) {
  auto it = std::find(args.begin(), args.end(), "--samples");
  if (it == args.end()) {
    return std::nullopt;
  }
  if (it + 1 == args.end()) {
    throw UsageError("--samples expects a positive integer");
  }
  auto n = parse_integer(*(it + 1), 1, LONG_MAX);
  if (!n) {
    throw UsageError("--samples expects a positive integer, got '" +
                     *(it + 1) + "'");
  }
  args.erase(it, it + 2);
  return static_cast<size_t>(*n);
}

CommandLine parse_command_line(const std::vector<std::string> &argv) {
  CommandLine line;
  auto &opts = line.options;

  size_t i = 0;
  for (; i < argv.size(); ++i) {
    const std::string &arg = argv[i];
    bool has_value = i + 1 < argv.size();

    if (arg == "--help" || arg == "-h") {
      line.help = true;
      return line;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--config" && has_value) {
      opts.config_path = argv[++i];
    } else if (arg == "--serial" && has_value) {
      opts.serial_device = argv[++i];
    } else if (arg == "--host" && has_value) {
      opts.host = argv[++i];
    } else if (arg == "--log-file" && has_value) {
      opts.log_file = argv[++i];
    } else if (arg == "--log-level" && has_value) {
      const std::string &level = argv[++i];
      if (!parse_log_level(level)) {
        throw UsageError("Invalid value for --log-level: " + level +
                         " (expected trace|debug|info|warn|error|off)");
      }
      opts.log_level = level;
    } else if (arg == "--port" && has_value) {
      auto port =
          parse_integer(argv[++i], 1, std::numeric_limits<uint16_t>::max());
      if (!port) {
        throw UsageError("Invalid value for --port: " + argv[i] +
                         " (expected 1-65535)");
      }
      opts.port = static_cast<uint16_t>(*port);
    } else if (arg == "--baud" && has_value) {
      auto baud = parse_integer(argv[++i], 1, INT_MAX);
      if (!baud) {
        throw UsageError("Invalid value for --baud: " + argv[i]);
      }
      opts.baud = static_cast<int>(*baud);
    } else if (arg.rfind("--", 0) == 0) {
      throw UsageError("Unknown option or missing value: " + arg);
    } else {
      break;
    }
  }

  if (i >= argv.size()) {
    throw UsageError("No command given");
  }

  line.command = argv[i];
  const auto &names = commands();
  if (std::find(names.begin(), names.end(), line.command) == names.end()) {
    throw UsageError("Unknown command: " + line.command);
  }
  line.args.assign(argv.begin() + i + 1, argv.end());
  return line;
}

ClientConfig build_config(const GlobalOptions &opts) {
  ClientConfig config = opts.config_path
                            ? ClientConfig::load_file(*opts.config_path)
                            : ClientConfig{};

  if (opts.serial_device) {
    config.transport = TransportKind::Serial;
    config.serial.device = *opts.serial_device;
  }
  if (opts.baud) {
    config.serial.baud = *opts.baud;
  }
  if (opts.host) {
    config.transport = TransportKind::Network;
    config.network.host = *opts.host;
  }
  if (opts.port) {
    config.network.port = *opts.port;
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.log_file) {
    config.logging.file = *opts.log_file;
  }
  return config;
}

bool is_long_running(const std::string &command) {
  return command == "poll" || command == "calibrate";
}

} // namespace cli
} // namespace mercuryitc
