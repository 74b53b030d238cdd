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

struct PollerOptions {
  std::vector<std::string> devices{"mb1", "db6", "db7"};
  std::chrono::milliseconds interval{1000};
  bool continue_on_error{true};
  std::string output_dir{"."};
  // Cycles to attempt; a skipped cycle counts
  std::optional<size_t> max_samples;
};

/// Periodic temperature log. Each cycle reads TEMP from every configured
/// device and rewrites tempLog_<start>.txt with one row per cycle:
/// elapsed seconds followed by the temperatures in device order.
class MERCURY_ITC_API TemperaturePoller {
public:
  TemperaturePoller(InstrumentClient &client, PollerOptions options,
                    transport::ClockPtr clock = nullptr);

  /// Poll until cancelled or max_samples cycles were attempted.
  /// Returns the number of rows recorded.
  size_t run(const CancellationToken &token);

  const std::vector<DataRow> &rows() const { return rows_; }

  const std::string &output_path() const { return output_path_; }

  std::string header() const;

private:
  // Nullopt when the cycle failed and errors are tolerated
  std::optional<DataRow> poll_once(double elapsed_s);

  InstrumentClient &client_;
  PollerOptions options_;
  transport::ClockPtr clock_;
  std::vector<DataRow> rows_;
  std::string output_path_;
};

} // namespace acquisition
} // namespace mercuryitc
