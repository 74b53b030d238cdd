#include "mercury-itc/ClientConfig.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/InstrumentClient.hpp"
#include "mercury-itc/Logger.hpp"
#include "mercury-itc/acquisition/CalibrationRecorder.hpp"
#include "mercury-itc/acquisition/CancellationToken.hpp"
#include "mercury-itc/acquisition/TemperaturePoller.hpp"
#include "mercury-itc/cli/CommandLine.hpp"

#include <csignal>
#include <cstdlib>
#include <fmt/format.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mercuryitc;
using namespace mercuryitc::cli;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CLIENT_ERROR = 2;
constexpr int EXIT_COMMUNICATION = 3;

acquisition::CancellationToken g_cancel;

using Args = std::vector<std::string>;

} // namespace

void signal_handler(int sig) {
  (void)sig;
  g_cancel.cancel();
}

void print_usage() {
  std::cout << "Usage: mercury-itc [options] <command> [args]\n\n";
  std::cout << "Connection:\n";
  std::cout << "  --config <file>        YAML configuration\n";
  std::cout << "  --serial <dev>         Serial device (e.g. /dev/ttyUSB0)\n";
  std::cout << "  --baud <rate>          Serial baud rate (default 115200)\n";
  std::cout << "  --host <ip>            Network host\n";
  std::cout << "  --port <port>          Network port (default 7020)\n";
  std::cout << "\nOutput:\n";
  std::cout << "  --json                 Print results as JSON\n";
  std::cout << "  --log-level <level>    trace|debug|info|warn|error|off\n";
  std::cout << "  --log-file <file>      Log file (empty disables)\n";
  std::cout << "\nCommands:\n";
  std::cout << "  idn                                Firmware identity\n";
  std::cout << "  devices                            System catalogue\n";
  std::cout << "  read <device> <signal>             Decoded signal value\n";
  std::cout
      << "  readout <device> [--temp]          Voltage, current, resistance\n";
  std::cout << "  set <payload>                      Raw SET command\n";
  std::cout << "  set-value <device> <setting> <value> [unit]\n";
  std::cout
      << "  poll [--samples N]                 Temperature log until Ctrl-C\n";
  std::cout
      << "  calibrate <name>... [--samples N]  Calibration log until Ctrl-C\n";
  std::cout << "  config                             Print effective config\n";
  std::cout << "\nExamples:\n";
  std::cout << "  mercury-itc --serial /dev/ttyUSB0 read db7 TEMP\n";
  std::cout << "  mercury-itc --host 10.1.15.220 readout db6 --temp\n";
  std::cout << "  mercury-itc --config bench.yaml calibrate PT1 PT2\n";
}

void print_text(const GlobalOptions &opts, const std::string &key,
                const std::string &value) {
  if (opts.json) {
    std::cout << nlohmann::json{{key, value}}.dump() << "\n";
  } else {
    std::cout << value << "\n";
  }
}

int cmd_idn(InstrumentClient &client, const GlobalOptions &opts) {
  print_text(opts, "identity", client.get_identity());
  return EXIT_OK;
}

int cmd_devices(InstrumentClient &client, const GlobalOptions &opts) {
  print_text(opts, "devices", client.list_devices());
  return EXIT_OK;
}

int cmd_read(InstrumentClient &client, const GlobalOptions &opts,
             const Args &args) {
  if (args.size() != 2) {
    std::cerr << "Usage: mercury-itc read <device> <signal>\n";
    return EXIT_USAGE;
  }
  double value = client.get_signal(args[0], args[1]);
  if (opts.json) {
    std::cout << nlohmann::json{{"device", args[0]},
                                {"signal", args[1]},
                                {"value", value}}
                     .dump()
              << "\n";
  } else {
    std::cout << fmt::format("{:.6e}", value) << "\n";
  }
  return EXIT_OK;
}

int cmd_readout(InstrumentClient &client, const GlobalOptions &opts,
                const Args &args) {
  if (args.empty() || args.size() > 2 ||
      (args.size() == 2 && args[1] != "--temp")) {
    std::cerr << "Usage: mercury-itc readout <device> [--temp]\n";
    return EXIT_USAGE;
  }
  auto readout = client.get_sensor_readout(args[0], args.size() == 2);
  if (opts.json) {
    auto j = readout.to_json();
    j["device"] = args[0];
    std::cout << j.dump() << "\n";
  } else {
    std::cout << fmt::format("V {:.6e}  I {:.6e}  R {:.6e}", readout.voltage,
                             readout.current, readout.resistance);
    if (readout.temperature) {
      std::cout << fmt::format("  T {:.6e}", *readout.temperature);
    }
    std::cout << "\n";
  }
  return EXIT_OK;
}

void print_exchange(const GlobalOptions &opts,
                    const CommandResponse &response) {
  if (opts.json) {
    std::cout << response.to_json().dump() << "\n";
  }
}

int cmd_set(InstrumentClient &client, const GlobalOptions &opts,
            const Args &args) {
  if (args.size() != 1) {
    std::cerr << "Usage: mercury-itc set <payload>\n";
    return EXIT_USAGE;
  }
  print_exchange(opts, client.set_raw(args[0]));
  return EXIT_OK;
}

int cmd_set_value(InstrumentClient &client, const GlobalOptions &opts,
                  const Args &args) {
  if (args.size() < 3 || args.size() > 4) {
    std::cerr << "Usage: mercury-itc set-value <device> <setting> <value> "
                 "[unit]\n";
    return EXIT_USAGE;
  }
  auto value = parse_number(args[2]);
  if (!value) {
    std::cerr << "Not a number: " << args[2] << "\n";
    return EXIT_USAGE;
  }
  print_exchange(opts, client.set_value(args[0], args[1], *value,
                                        args.size() == 4 ? args[3] : ""));
  return EXIT_OK;
}

int cmd_poll(InstrumentClient &client, const ClientConfig &config,
             Args args) {
  auto options = config.polling;
  options.max_samples = take_samples(args);
  if (!args.empty()) {
    std::cerr << "Usage: mercury-itc poll [--samples N]\n";
    return EXIT_USAGE;
  }

  acquisition::TemperaturePoller poller(client, options);
  size_t samples = poller.run(g_cancel);
  std::cout << "Recorded " << samples << " samples to "
            << poller.output_path() << "\n";
  return EXIT_OK;
}

int cmd_calibrate(InstrumentClient &client, const ClientConfig &config,
                  Args args) {
  auto options = config.calibration;
  options.max_samples = take_samples(args);
  if (args.size() != options.sensors.size()) {
    std::cerr << "Usage: mercury-itc calibrate <name>... [--samples N]\n";
    std::cerr << "Expected one name per configured sensor ("
              << options.sensors.size() << ")\n";
    return EXIT_USAGE;
  }

  acquisition::CalibrationRecorder recorder(client, options);
  size_t rows = recorder.run(args, g_cancel);
  std::cout << "Recorded " << rows << " calibration rows\n";
  return EXIT_OK;
}

int main(int argc, char **argv) {
  CommandLine line;
  try {
    line = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const UsageError &ex) {
    std::cerr << ex.what() << "\n\n";
    print_usage();
    return EXIT_USAGE;
  }
  if (line.help) {
    print_usage();
    return EXIT_OK;
  }

  const GlobalOptions &opts = line.options;
  const std::string &command = line.command;
  Args &args = line.args;

  try {
    ClientConfig config = build_config(opts);
    auto level = parse_log_level(config.logging.level);
    ClientLogger::instance().init(config.logging.file,
                                  level.value_or(spdlog::level::info));
    if (!ClientLogger::instance().is_initialized()) {
      std::cerr << "Warning: logging unavailable, continuing without it\n";
    }

    if (command == "config") {
      std::cout << config.to_json().dump(2) << "\n";
      return EXIT_OK;
    }

    // One-shot commands keep the default handlers so Ctrl-C aborts retries
    if (is_long_running(command)) {
      std::signal(SIGINT, signal_handler);
      std::signal(SIGTERM, signal_handler);
    }

    InstrumentClient client(config.create_transport(),
                            config.create_registry());
    client.connect();

    if (command == "idn") {
      return cmd_idn(client, opts);
    } else if (command == "devices") {
      return cmd_devices(client, opts);
    } else if (command == "read") {
      return cmd_read(client, opts, args);
    } else if (command == "readout") {
      return cmd_readout(client, opts, args);
    } else if (command == "set") {
      return cmd_set(client, opts, args);
    } else if (command == "set-value") {
      return cmd_set_value(client, opts, args);
    } else if (command == "poll") {
      return cmd_poll(client, config, args);
    }
    return cmd_calibrate(client, config, args);
  } catch (const UsageError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_USAGE;
  } catch (const FatalCommunicationError &ex) {
    LOG_ERROR("MAIN", command, "{}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_COMMUNICATION;
  } catch (const TransportError &ex) {
    LOG_ERROR("MAIN", command, "{}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_COMMUNICATION;
  } catch (const ItcError &ex) {
    LOG_ERROR("MAIN", command, "{}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_CLIENT_ERROR;
  } catch (const std::exception &ex) {
    LOG_ERROR("MAIN", command, "Unexpected error: {}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_CLIENT_ERROR;
  }
}
