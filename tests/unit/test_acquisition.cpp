#include "../test_utils/MockStream.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/acquisition/CalibrationRecorder.hpp"
#include "mercury-itc/acquisition/CancellationToken.hpp"
#include "mercury-itc/acquisition/TemperaturePoller.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace mercuryitc;
using namespace mercuryitc::acquisition;
using namespace mercuryitc::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class AcquisitionTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mercury_itc_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);

    auto transport = std::make_unique<MockTransport>();
    transport_ = transport.get();
    client_ = std::make_unique<InstrumentClient>(std::move(transport));
    clock_ = std::make_shared<FakeClock>();
  }

  void TearDown() override { fs::remove_all(dir_); }

  void reply(const std::string &address, const std::string &signal,
             const std::string &value) {
    transport_->set_response("READ:" + address + ":SIG:" + signal,
                             "STAT:" + address + ":SIG:" + signal + ":" +
                                 value);
  }

  static std::string read_file(const fs::path &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path dir_;
  MockTransport *transport_;
  std::unique_ptr<InstrumentClient> client_;
  std::shared_ptr<FakeClock> clock_;
};

TEST(CancellationToken, WaitSleepsInSlices) {
  FakeClock clock;
  CancellationToken token;
  EXPECT_FALSE(token.wait_for(120ms, clock));
  ASSERT_EQ(clock.sleeps.size(), 3u);
  EXPECT_EQ(clock.sleeps[0], 50ms);
  EXPECT_EQ(clock.sleeps[2], 20ms);
}

TEST(CancellationToken, CancelInterruptsWait) {
  FakeClock clock;
  CancellationToken token;
  clock.on_sleep = [&token](size_t n) {
    if (n == 2) {
      token.cancel();
    }
  };
  EXPECT_TRUE(token.wait_for(10s, clock));
  EXPECT_EQ(clock.sleeps.size(), 2u);
  EXPECT_TRUE(token.is_cancelled());
}

TEST_F(AcquisitionTest, PollerRecordsRows) {
  reply("DEV:MB1.T1:TEMP", "TEMP", "4.200000K");
  reply("DEV:DB6.T1:TEMP", "TEMP", "3.100000K");
  reply("DEV:DB7.T1:TEMP", "TEMP", "1.500000K");

  PollerOptions options;
  options.output_dir = dir_.string();
  options.max_samples = 3;
  TemperaturePoller poller(*client_, options, clock_);

  CancellationToken token;
  EXPECT_EQ(poller.run(token), 3u);

  const auto &rows = poller.rows();
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0], (DataRow{0.0, 4.2, 3.1, 1.5}));
  EXPECT_DOUBLE_EQ(rows[1][0], 1.0);
  EXPECT_DOUBLE_EQ(rows[2][0], 2.0);

  EXPECT_EQ(poller.header(), "Time\tT1\tT2\tT3");
  fs::path output(poller.output_path());
  EXPECT_EQ(output.parent_path().string(), dir_.string());
  EXPECT_EQ(output.filename().string().rfind("tempLog_", 0), 0u);

  std::string content = read_file(poller.output_path());
  EXPECT_EQ(content.rfind("#Time\tT1\tT2\tT3\n", 0), 0u);
  EXPECT_NE(content.find("2.000000e+00 4.200000e+00 3.100000e+00 "
                         "1.500000e+00\n"),
            std::string::npos);
}

TEST_F(AcquisitionTest, PollerStopsWhenCancelled) {
  reply("DEV:DB7.T1:TEMP", "TEMP", "1.500000K");

  PollerOptions options;
  options.devices = {"db7"};
  options.output_dir = dir_.string();
  TemperaturePoller poller(*client_, options, clock_);

  CancellationToken token;
  // 20 slices of 50 ms per one-second interval; stop during the second wait
  clock_->on_sleep = [&token](size_t n) {
    if (n == 25) {
      token.cancel();
    }
  };
  EXPECT_EQ(poller.run(token), 2u);
}

TEST_F(AcquisitionTest, PollerSkipsFailedCycles) {
  reply("DEV:DB7.T1:TEMP", "TEMP", "1.500000K");
  transport_->set_error("READ:DEV:DB6.T1:TEMP:SIG:TEMP", "timed out");

  PollerOptions options;
  options.devices = {"db7", "db6"};
  options.output_dir = dir_.string();
  options.max_samples = 3;
  TemperaturePoller poller(*client_, options, clock_);

  // Skipped cycles count toward the limit, so no cancel is needed
  CancellationToken token;
  EXPECT_EQ(poller.run(token), 0u);
  EXPECT_TRUE(poller.rows().empty());
  EXPECT_FALSE(token.is_cancelled());
  ASSERT_EQ(transport_->history.size(), 6u);
  EXPECT_EQ(transport_->history[5].path, "DEV:DB6.T1:TEMP:SIG:TEMP");
}

TEST_F(AcquisitionTest, PollerPropagatesWhenErrorsNotTolerated) {
  transport_->set_error("READ:DEV:DB7.T1:TEMP:SIG:TEMP", "timed out");

  PollerOptions options;
  options.devices = {"db7"};
  options.output_dir = dir_.string();
  options.continue_on_error = false;
  TemperaturePoller poller(*client_, options, clock_);

  CancellationToken token;
  EXPECT_THROW(poller.run(token), FatalCommunicationError);
}

TEST_F(AcquisitionTest, PollerUnknownDeviceAlwaysThrows) {
  PollerOptions options;
  options.devices = {"db9"};
  options.output_dir = dir_.string();
  TemperaturePoller poller(*client_, options, clock_);

  CancellationToken token;
  EXPECT_THROW(poller.run(token), UnknownDeviceError);
}

TEST_F(AcquisitionTest, CalibrationWritesLogAndSensorFiles) {
  reply("DEV:DB7.T1:TEMP", "VOLT", "7.000000mV");
  reply("DEV:DB7.T1:TEMP", "CURR", "7.000000nA");
  reply("DEV:DB7.T1:TEMP", "RES", "1.000000MO");
  reply("DEV:DB7.T1:TEMP", "TEMP", "1.500000K");
  reply("DEV:DB6.T1:TEMP", "VOLT", "7.000000mV");
  reply("DEV:DB6.T1:TEMP", "CURR", "3.500000nA");
  reply("DEV:DB6.T1:TEMP", "RES", "2.000000MO");
  reply("DEV:MB1.T1:TEMP", "VOLT", "7.000000mV");
  reply("DEV:MB1.T1:TEMP", "CURR", "1.400000nA");
  reply("DEV:MB1.T1:TEMP", "RES", "5.000000MO");

  CalibrationOptions options;
  options.output_dir = dir_.string();
  options.max_samples = 2;
  CalibrationRecorder recorder(*client_, options, clock_);

  CancellationToken token;
  EXPECT_EQ(recorder.run({"S1", "S2"}, token), 2u);

  const auto &row = recorder.rows()[0];
  ASSERT_EQ(row.size(), 10u);
  EXPECT_DOUBLE_EQ(row[CalibrationRecorder::TEMPERATURE_COLUMN], 1.5);
  EXPECT_DOUBLE_EQ(row[CalibrationRecorder::resistance_column(0)], 2.0e6);
  EXPECT_DOUBLE_EQ(row[CalibrationRecorder::resistance_column(1)], 5.0e6);

  std::string log = read_file(dir_ / CalibrationRecorder::LOG_FILE);
  EXPECT_NE(log.find("#  Calibrated sensor: X_____.dat"), std::string::npos);
  EXPECT_NE(log.find("#  Sensor 2 to calibrate: S2"), std::string::npos);
  EXPECT_NE(log.find("#  (Columns 8 to 10: Voltage, Current, Resistance)"),
            std::string::npos);

  std::string s1 = read_file(dir_ / "S1.dat");
  EXPECT_EQ(s1, "#Temperature (K)\t Resistance (Ohm)\n"
                "#Excitation: Constant Voltage, 7mV\n"
                "1.500000e+00 2.000000e+06\n"
                "1.500000e+00 2.000000e+06\n");
  std::string s2 = read_file(dir_ / "S2.dat");
  EXPECT_NE(s2.find("1.500000e+00 5.000000e+06\n"), std::string::npos);
}

TEST_F(AcquisitionTest, CalibrationRequiresOneNamePerSensor) {
  CalibrationOptions options;
  options.output_dir = dir_.string();
  CalibrationRecorder recorder(*client_, options, clock_);

  CancellationToken token;
  EXPECT_THROW(recorder.run({"only-one"}, token), ItcError);
  EXPECT_TRUE(transport_->history.empty());
}

TEST_F(AcquisitionTest, CalibrationReadsReferenceFirst) {
  reply("DEV:DB7.T1:TEMP", "VOLT", "1.0mV");
  reply("DEV:DB7.T1:TEMP", "CURR", "1.0nA");
  reply("DEV:DB7.T1:TEMP", "RES", "1.0MO");
  reply("DEV:DB7.T1:TEMP", "TEMP", "4.200000K");
  reply("DEV:DB6.T1:TEMP", "VOLT", "1.0mV");
  reply("DEV:DB6.T1:TEMP", "CURR", "1.0nA");
  reply("DEV:DB6.T1:TEMP", "RES", "1.0MO");

  CalibrationOptions options;
  options.sensors = {"db6"};
  options.output_dir = dir_.string();
  options.max_samples = 1;
  CalibrationRecorder recorder(*client_, options, clock_);

  CancellationToken token;
  ASSERT_EQ(recorder.run({"S1"}, token), 1u);

  ASSERT_EQ(transport_->history.size(), 7u);
  EXPECT_EQ(transport_->history[3].path, "DEV:DB7.T1:TEMP:SIG:TEMP");
  EXPECT_EQ(transport_->history[4].path, "DEV:DB6.T1:TEMP:SIG:VOLT");
}

TEST_F(AcquisitionTest, CalibrationStopsAfterFailedCycles) {
  reply("DEV:DB7.T1:TEMP", "VOLT", "1.0mV");
  reply("DEV:DB7.T1:TEMP", "CURR", "1.0nA");
  reply("DEV:DB7.T1:TEMP", "RES", "1.0MO");
  reply("DEV:DB7.T1:TEMP", "TEMP", "4.200000K");
  transport_->set_error("READ:DEV:DB6.T1:TEMP:SIG:VOLT", "timed out");

  CalibrationOptions options;
  options.sensors = {"db6"};
  options.output_dir = dir_.string();
  options.max_samples = 2;
  CalibrationRecorder recorder(*client_, options, clock_);

  CancellationToken token;
  EXPECT_EQ(recorder.run({"S1"}, token), 0u);
  EXPECT_TRUE(recorder.rows().empty());
  EXPECT_EQ(transport_->history.size(), 10u);
  EXPECT_FALSE(clock_->sleeps.empty());
  EXPECT_FALSE(fs::exists(dir_ / CalibrationRecorder::LOG_FILE));
}
