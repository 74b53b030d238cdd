#include "mercury-itc/acquisition/TemperaturePoller.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

namespace mercuryitc {
namespace acquisition {

namespace {

std::string to_upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

} // namespace

TemperaturePoller::TemperaturePoller(InstrumentClient &client,
                                     PollerOptions options,
                                     transport::ClockPtr clock)
    : client_(client), options_(std::move(options)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = std::make_shared<transport::SystemClock>();
  }
  if (options_.devices.empty()) {
    throw ItcError("Temperature poller needs at least one device");
  }
}

std::string TemperaturePoller::header() const {
  std::string header = "Time";
  for (size_t i = 1; i <= options_.devices.size(); ++i) {
    header += fmt::format("\tT{}", i);
  }
  return header;
}

std::optional<DataRow> TemperaturePoller::poll_once(double elapsed_s) {
  DataRow row{elapsed_s};
  std::string line;

  try {
    for (const auto &device : options_.devices) {
      double t = client_.get_signal(device, "TEMP");
      row.push_back(t);
      if (!line.empty()) {
        line += "    ";
      }
      line += fmt::format("{} {:.3f} K", to_upper(device), t);
    }
  } catch (const UnknownDeviceError &) {
    throw;
  } catch (const ItcError &ex) {
    if (!options_.continue_on_error) {
      throw;
    }
    LOG_ERROR("POLLER", "CYCLE", "Skipping cycle at {:.1f} s: {}", elapsed_s,
              ex.what());
    return std::nullopt;
  }

  LOG_INFO("POLLER", "SAMPLE", "{}", line);
  return row;
}

size_t TemperaturePoller::run(const CancellationToken &token) {
  rows_.clear();

  const auto epoch_s = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  output_path_ = (std::filesystem::path(options_.output_dir) /
                  fmt::format("tempLog_{}.txt", epoch_s))
                     .string();

  LOG_INFO("POLLER", "START", "Polling {} every {} ms into {}",
           fmt::join(options_.devices, ", "), options_.interval.count(),
           output_path_);

  const auto start = clock_->now();
  size_t cycles = 0;
  while (!token.is_cancelled()) {
    ++cycles;
    double elapsed =
        std::chrono::duration<double>(clock_->now() - start).count();

    if (auto row = poll_once(elapsed)) {
      rows_.push_back(std::move(*row));
      DataFileWriter::write(output_path_, header(), rows_);
    }

    if (options_.max_samples && cycles >= *options_.max_samples) {
      break;
    }
    if (token.wait_for(options_.interval, *clock_)) {
      break;
    }
  }

  LOG_INFO("POLLER", "STOP", "Recorded {} samples in {} cycles", rows_.size(),
           cycles);
  return rows_.size();
}

} // namespace acquisition
} // namespace mercuryitc
