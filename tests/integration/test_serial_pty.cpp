#include "mercury-itc/Errors.hpp"
#include "mercury-itc/InstrumentClient.hpp"
#include "mercury-itc/transport/SerialStream.hpp"
#include "mercury-itc/transport/SerialTransport.hpp"

#include <cstring>
#include <gtest/gtest.h>
#include <pty.h> // openpty
#include <unistd.h>

using namespace mercuryitc;
using namespace mercuryitc::transport;
using namespace std::chrono_literals;

namespace {

// Pseudo terminal standing in for the instrument's USB serial port
class PtyPair {
public:
  PtyPair() {
    char name[64] = {0};
    if (openpty(&master_, &slave_, name, nullptr, nullptr) == 0) {
      slave_name_ = name;
    }
  }
  ~PtyPair() {
    if (master_ >= 0)
      ::close(master_);
    if (slave_ >= 0)
      ::close(slave_);
  }

  bool ok() const { return !slave_name_.empty(); }
  const std::string &slave_name() const { return slave_name_; }

  void send(const std::string &text) {
    ASSERT_EQ(::write(master_, text.data(), text.size()),
              static_cast<ssize_t>(text.size()));
  }

  std::string receive() {
    char buf[256] = {0};
    ssize_t n = ::read(master_, buf, sizeof(buf) - 1);
    return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
  }

private:
  int master_{-1};
  int slave_{-1};
  std::string slave_name_;
};

SerialSettings fast_settings(const std::string &device) {
  SerialSettings settings;
  settings.device = device;
  settings.baud = 115200;
  settings.read_timeout = 500ms;
  settings.settle_delay = 0ms;
  settings.post_write_delay = 0ms;
  return settings;
}

} // namespace

TEST(SerialStreamPty, OpenWriteReadLine) {
  PtyPair pty;
  ASSERT_TRUE(pty.ok());

  SerialStream stream(fast_settings(pty.slave_name()));
  stream.open();
  ASSERT_TRUE(stream.is_open());

  pty.send("STAT:DEV:DB7.T1:TEMP:SIG:TEMP:1.500000K\r\n");
  auto line = stream.read_line(500ms);
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(rstrip(*line), "STAT:DEV:DB7.T1:TEMP:SIG:TEMP:1.500000K");

  stream.write("*IDN?\n\r");
  EXPECT_EQ(pty.receive(), "*IDN?\n\r");

  stream.close();
  EXPECT_FALSE(stream.is_open());
}

TEST(SerialStreamPty, ReadLineTimesOut) {
  PtyPair pty;
  ASSERT_TRUE(pty.ok());

  SerialStream stream(fast_settings(pty.slave_name()));
  stream.open();
  EXPECT_FALSE(stream.read_line(50ms).has_value());
}

TEST(SerialStreamPty, LeadingCarriageReturnIsDropped) {
  PtyPair pty;
  ASSERT_TRUE(pty.ok());

  SerialStream stream(fast_settings(pty.slave_name()));
  stream.open();

  // Replies terminated "\n\r" leave the '\r' ahead of the next line
  pty.send("first\n\rsecond\n\r");
  EXPECT_EQ(stream.read_line(500ms).value_or(""), "first");
  EXPECT_EQ(stream.read_line(500ms).value_or(""), "second");
}

TEST(SerialStreamPty, OpenMissingDeviceThrows) {
  SerialStream stream(fast_settings("/dev/does-not-exist"));
  EXPECT_THROW(stream.open(), TransportError);
}

TEST(SerialStreamPty, UnsupportedBaudThrows) {
  PtyPair pty;
  ASSERT_TRUE(pty.ok());

  auto settings = fast_settings(pty.slave_name());
  settings.baud = 12345;
  SerialStream stream(settings);
  EXPECT_THROW(stream.open(), TransportError);
}

TEST(SerialTransportPty, ClientReadsSignal) {
  PtyPair pty;
  ASSERT_TRUE(pty.ok());

  InstrumentClient client(std::make_unique<SerialTransport>(
      fast_settings(pty.slave_name())));
  client.connect();

  pty.send("STAT:DEV:DB6.T1:TEMP:SIG:VOLT:7.000000mV\n\r");
  EXPECT_DOUBLE_EQ(client.get_signal("db6", "VOLT"), 7.0e-3);
  EXPECT_EQ(pty.receive(), "READ:DEV:DB6.T1:TEMP:SIG:VOLT\n\r");
}
