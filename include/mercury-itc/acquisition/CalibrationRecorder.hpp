#pragma once
#include "mercury-itc/InstrumentClient.hpp"
#include "mercury-itc/acquisition/CancellationToken.hpp"
#include "mercury-itc/acquisition/DataFileWriter.hpp"
#include "mercury-itc/transport/Clock.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mercuryitc {
namespace acquisition {

struct CalibrationOptions {
  std::string reference{"db7"};
  std::string reference_name{"X_____.dat"};
  std::vector<std::string> sensors{"db6", "mb1"};
  std::string excitation{"Constant Voltage, 7mV"};
  std::chrono::milliseconds interval{1000};
  bool continue_on_error{true};
  std::string output_dir{"."};
  // Cycles to attempt; a skipped cycle counts
  std::optional<size_t> max_samples;
};

/// Records a calibrated reference sensor against sensors being calibrated.
///
/// Each cycle appends one row: reference V, C, R, T, then V, C, R for every
/// sensor. calibration.txt receives the full table; <sensor name>.dat the
/// (T, R) pairs of that sensor. The temperature sweep itself is driven by
/// other equipment.
class MERCURY_ITC_API CalibrationRecorder {
public:
  static constexpr const char *LOG_FILE = "calibration.txt";
  static constexpr size_t REFERENCE_COLUMNS = 4;
  static constexpr size_t SENSOR_COLUMNS = 3;
  static constexpr size_t TEMPERATURE_COLUMN = 3;

  CalibrationRecorder(InstrumentClient &client, CalibrationOptions options,
                      transport::ClockPtr clock = nullptr);

  /// Record until cancelled or max_samples cycles. sensor_names label the
  /// configured sensors, in order. Returns the number of rows recorded.
  size_t run(const std::vector<std::string> &sensor_names,
             const CancellationToken &token);

  const std::vector<DataRow> &rows() const { return rows_; }

  std::string log_header(const std::vector<std::string> &sensor_names) const;

  std::string sensor_header() const;

  /// Column of the resistance of the index-th sensor in a row
  static size_t resistance_column(size_t sensor_index) {
    return REFERENCE_COLUMNS + sensor_index * SENSOR_COLUMNS + 2;
  }

private:
  std::optional<DataRow> record_once();
  void write_files(const std::vector<std::string> &sensor_names) const;

  InstrumentClient &client_;
  CalibrationOptions options_;
  transport::ClockPtr clock_;
  std::vector<DataRow> rows_;
};

} // namespace acquisition
} // namespace mercuryitc
