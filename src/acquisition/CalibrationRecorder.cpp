#include "mercury-itc/acquisition/CalibrationRecorder.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <utility>

namespace mercuryitc {
namespace acquisition {

namespace fs = std::filesystem;

CalibrationRecorder::CalibrationRecorder(InstrumentClient &client,
                                         CalibrationOptions options,
                                         transport::ClockPtr clock)
    : client_(client), options_(std::move(options)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = std::make_shared<transport::SystemClock>();
  }
  if (options_.sensors.empty()) {
    throw ItcError("Calibration needs at least one sensor to calibrate");
  }
}

std::string CalibrationRecorder::log_header(
    const std::vector<std::string> &sensor_names) const {
  std::string header = "######################################\n\n"
                       "  Calibration Log\n\n";
  header += fmt::format("  Calibrated sensor: {}\n", options_.reference_name);
  header += "  (Columns 1 to 4: Voltage, Current, Resistance, Temperature)\n";

  for (size_t i = 0; i < sensor_names.size(); ++i) {
    size_t first = REFERENCE_COLUMNS + i * SENSOR_COLUMNS + 1;
    header += fmt::format("\n  Sensor {} to calibrate: {}\n", i + 1,
                          sensor_names[i]);
    header += fmt::format("  (Columns {} to {}: Voltage, Current, Resistance)\n",
                          first, first + SENSOR_COLUMNS - 1);
  }

  header += "\n######################################";
  return header;
}

std::string CalibrationRecorder::sensor_header() const {
  return "Temperature (K)\t Resistance (Ohm)\nExcitation: " +
         options_.excitation;
}

std::optional<DataRow> CalibrationRecorder::record_once() {
  DataRow row;
  row.reserve(REFERENCE_COLUMNS + options_.sensors.size() * SENSOR_COLUMNS);

  try {
    auto reference = client_.get_sensor_readout(options_.reference, true);
    row.insert(row.end(), {reference.voltage, reference.current,
                           reference.resistance, *reference.temperature});

    for (const auto &sensor : options_.sensors) {
      auto readout = client_.get_sensor_readout(sensor);
      row.insert(row.end(),
                 {readout.voltage, readout.current, readout.resistance});
    }
  } catch (const UnknownDeviceError &) {
    throw;
  } catch (const ItcError &ex) {
    if (!options_.continue_on_error) {
      throw;
    }
    LOG_ERROR("CALIBRATION", "CYCLE", "Skipping cycle: {}", ex.what());
    return std::nullopt;
  }

  std::string summary = fmt::format("Rc: {:.6e}  T: {:.6e}", row[2],
                                    row[TEMPERATURE_COLUMN]);
  for (size_t i = 0; i < options_.sensors.size(); ++i) {
    summary += fmt::format("  R{}: {:.6e}", i + 1, row[resistance_column(i)]);
  }
  LOG_INFO("CALIBRATION", "SAMPLE", "{}", summary);
  return row;
}

void CalibrationRecorder::write_files(
    const std::vector<std::string> &sensor_names) const {
  const fs::path dir(options_.output_dir);

  DataFileWriter::write((dir / LOG_FILE).string(), log_header(sensor_names),
                        rows_);

  for (size_t i = 0; i < sensor_names.size(); ++i) {
    auto pairs = DataFileWriter::select_columns(
        rows_, {TEMPERATURE_COLUMN, resistance_column(i)});
    DataFileWriter::write((dir / (sensor_names[i] + ".dat")).string(),
                          sensor_header(), pairs);
  }
}

size_t CalibrationRecorder::run(const std::vector<std::string> &sensor_names,
                                const CancellationToken &token) {
  if (sensor_names.size() != options_.sensors.size()) {
    throw ItcError(fmt::format("Expected {} sensor names, got {}",
                               options_.sensors.size(), sensor_names.size()));
  }

  rows_.clear();
  LOG_INFO("CALIBRATION", "START", "Reference {} ({}), {} sensor(s)",
           options_.reference, options_.reference_name,
           options_.sensors.size());

  size_t cycles = 0;
  while (!token.is_cancelled()) {
    ++cycles;
    if (auto row = record_once()) {
      rows_.push_back(std::move(*row));
      write_files(sensor_names);
    }

    if (options_.max_samples && cycles >= *options_.max_samples) {
      break;
    }
    if (token.wait_for(options_.interval, *clock_)) {
      break;
    }
  }

  LOG_INFO("CALIBRATION", "STOP",
           "Finishing calibration after {} rows in {} cycles", rows_.size(),
           cycles);
  if (!rows_.empty()) {
    LOG_INFO("CALIBRATION", "STOP", "Minimum temperature achieved: {:.6e}",
             DataFileWriter::column_min(rows_, TEMPERATURE_COLUMN));
    LOG_INFO("CALIBRATION", "STOP", "Maximum temperature achieved: {:.6e}",
             DataFileWriter::column_max(rows_, TEMPERATURE_COLUMN));
  }
  return rows_.size();
}

} // namespace acquisition
} // namespace mercuryitc
