#include "../test_utils/MockStream.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/InstrumentClient.hpp"
#include "mercury-itc/transport/NetworkTransport.hpp"
#include "mercury-itc/transport/SerialTransport.hpp"

#include <gtest/gtest.h>

using namespace mercuryitc;
using namespace mercuryitc::test;
using namespace std::chrono_literals;

class InstrumentClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto transport = std::make_unique<MockTransport>();
    transport_ = transport.get();
    client_ = std::make_unique<InstrumentClient>(std::move(transport));
  }

  MockTransport *transport_;
  std::unique_ptr<InstrumentClient> client_;
};

TEST_F(InstrumentClientTest, RequiresTransport) {
  EXPECT_THROW(InstrumentClient(nullptr), ItcError);
}

TEST_F(InstrumentClientTest, ConnectInitializesTransport) {
  client_->connect();
  EXPECT_TRUE(transport_->initialized());
  client_->disconnect();
  EXPECT_FALSE(transport_->initialized());
}

TEST_F(InstrumentClientTest, ConnectFailureThrows) {
  transport_->set_initialize_result(false);
  EXPECT_THROW(client_->connect(), TransportError);
}

TEST_F(InstrumentClientTest, GetSignalDecodesPayload) {
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:VOLT",
                           "STAT:DEV:DB7.T1:TEMP:SIG:VOLT:7.000000mV");
  EXPECT_DOUBLE_EQ(client_->get_signal("db7", "VOLT"), 7.0e-3);
}

TEST_F(InstrumentClientTest, GetSignalUnknownDeviceSendsNothing) {
  EXPECT_THROW(client_->get_signal("db9", "VOLT"), UnknownDeviceError);
  EXPECT_TRUE(transport_->history.empty());
}

TEST_F(InstrumentClientTest, GetSignalUndecodableReply) {
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:VOLT",
                           "STAT:DEV:DB7.T1:TEMP:SIG:VOLT:NOT_FOUND");
  try {
    client_->get_signal("db7", "VOLT");
    FAIL() << "expected DecodeError";
  } catch (const DecodeError &ex) {
    EXPECT_EQ(ex.token(), "NOT_FOUND");
  }
}

TEST_F(InstrumentClientTest, ExhaustedRetriesAreFatal) {
  transport_->set_retrying(true, 5);
  transport_->set_error("READ:DEV:DB6.T1:TEMP:SIG:TEMP", "timed out");
  try {
    client_->get_signal("db6", "TEMP");
    FAIL() << "expected FatalCommunicationError";
  } catch (const FatalCommunicationError &ex) {
    EXPECT_EQ(ex.attempts(), 5);
    EXPECT_EQ(ex.command(), "READ:DEV:DB6.T1:TEMP:SIG:TEMP");
  }
}

TEST_F(InstrumentClientTest, SingleShotFailureIsTransportError) {
  transport_->set_retrying(false, 1);
  transport_->set_error("*IDN?", "no reply within 1000 ms");
  try {
    client_->get_identity();
    FAIL() << "expected TransportError";
  } catch (const FatalCommunicationError &) {
    FAIL() << "serial failures are not fatal";
  } catch (const TransportError &ex) {
    EXPECT_NE(std::string(ex.what()).find("*IDN?"), std::string::npos);
  }
}

TEST_F(InstrumentClientTest, IdentityAndCatalogueIgnoreRegistry) {
  auto transport = std::make_unique<MockTransport>();
  auto *raw = transport.get();
  raw->set_response("*IDN?", "IDN:OXFORD INSTRUMENTS:MERCURY ITC:123:2.5");
  raw->set_response("READ:SYS:CAT", "STAT:SYS:CAT:DEV:DB7.T1:TEMP");
  InstrumentClient client(std::move(transport), DeviceRegistry());

  EXPECT_EQ(client.get_identity(), "IDN:OXFORD INSTRUMENTS:MERCURY ITC:123:2.5");
  EXPECT_EQ(client.list_devices(), "STAT:SYS:CAT:DEV:DB7.T1:TEMP");
  ASSERT_EQ(raw->history.size(), 2u);
  EXPECT_EQ(raw->history[1].wire_text(), "READ:SYS:CAT");
}

TEST_F(InstrumentClientTest, SetValueSendsBareMagnitude) {
  client_->set_value("mb1", "EXCT:MAG", 7.0, "mV");
  ASSERT_EQ(transport_->history.size(), 1u);
  EXPECT_EQ(transport_->history[0].kind, CommandKind::Set);
  EXPECT_EQ(transport_->history[0].wire_text(),
            "SET:DEV:MB1.T1:TEMP:EXCT:MAG:7");
}

TEST_F(InstrumentClientTest, SetRawPassesPayload) {
  auto response = client_->set_raw("DEV:DB6.T1:TEMP:LOOP:ENAB:ON");
  ASSERT_EQ(transport_->history.size(), 1u);
  EXPECT_EQ(transport_->history[0].wire_text(),
            "SET:DEV:DB6.T1:TEMP:LOOP:ENAB:ON");

  auto j = response.to_json();
  EXPECT_EQ(j["command"], "SET:DEV:DB6.T1:TEMP:LOOP:ENAB:ON");
  EXPECT_TRUE(j["success"].get<bool>());
  EXPECT_EQ(j["attempts"], 1);
  EXPECT_FALSE(j.contains("error_message"));
}

TEST_F(InstrumentClientTest, SetValueReturnsExchange) {
  transport_->set_response("SET:DEV:MB1.T1:TEMP:EXCT:MAG:7",
                           "STAT:SET:DEV:MB1.T1:TEMP:EXCT:MAG:7:VALID");
  auto response = client_->set_value("mb1", "EXCT:MAG", 7.0, "mV");
  EXPECT_TRUE(response.success);
  EXPECT_EQ(response.to_json()["text_response"],
            "STAT:SET:DEV:MB1.T1:TEMP:EXCT:MAG:7:VALID");
}

TEST_F(InstrumentClientTest, SensorReadoutOrder) {
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:VOLT", "SIG:VOLT:7.0mV");
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:CURR", "SIG:CURR:3.5nA");
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:RES", "SIG:RES:2.0MO");
  transport_->set_response("READ:DEV:DB7.T1:TEMP:SIG:TEMP",
                           "SIG:TEMP:1.500000K");

  auto readout = client_->get_sensor_readout("db7");
  EXPECT_DOUBLE_EQ(readout.voltage, 7.0e-3);
  EXPECT_DOUBLE_EQ(readout.current, 3.5e-9);
  EXPECT_DOUBLE_EQ(readout.resistance, 2.0e6);
  EXPECT_FALSE(readout.temperature.has_value());
  ASSERT_EQ(transport_->history.size(), 3u);

  transport_->history.clear();
  readout = client_->get_sensor_readout("db7", true);
  ASSERT_TRUE(readout.temperature.has_value());
  EXPECT_DOUBLE_EQ(*readout.temperature, 1.5);

  ASSERT_EQ(transport_->history.size(), 4u);
  EXPECT_EQ(transport_->history[0].path, "DEV:DB7.T1:TEMP:SIG:VOLT");
  EXPECT_EQ(transport_->history[1].path, "DEV:DB7.T1:TEMP:SIG:CURR");
  EXPECT_EQ(transport_->history[2].path, "DEV:DB7.T1:TEMP:SIG:RES");
  EXPECT_EQ(transport_->history[3].path, "DEV:DB7.T1:TEMP:SIG:TEMP");

  auto j = readout.to_json();
  EXPECT_DOUBLE_EQ(j["temperature"].get<double>(), 1.5);
}

// Full stack: client over the retrying transport over scripted streams
TEST(InstrumentClientNetwork, RecoversAfterFourFailures) {
  auto script = std::make_shared<StreamScript>();
  script->fail_opens = 4;
  script->chunks.push_back("STAT:DEV:DB7.T1:TEMP:SIG:VOLT:7.000000mV\r\n");
  auto clock = std::make_shared<FakeClock>();

  transport::NetworkSettings settings;
  InstrumentClient client(std::make_unique<transport::NetworkTransport>(
      settings, MockStream::factory(script), clock));
  client.connect();

  EXPECT_DOUBLE_EQ(client.get_signal("db7", "VOLT"), 7.0e-3);
  EXPECT_EQ(script->open_calls, 5);
}

TEST(InstrumentClientNetwork, FiveFailuresAreFatal) {
  auto script = std::make_shared<StreamScript>();
  script->fail_opens = 5;
  auto clock = std::make_shared<FakeClock>();

  transport::NetworkSettings settings;
  InstrumentClient client(std::make_unique<transport::NetworkTransport>(
      settings, MockStream::factory(script), clock));

  try {
    client.get_signal("db7", "VOLT");
    FAIL() << "expected FatalCommunicationError";
  } catch (const FatalCommunicationError &ex) {
    EXPECT_EQ(ex.attempts(), 5);
  }
  EXPECT_EQ(script->open_calls, 5);
}

TEST(InstrumentClientSerial, ReadOverPersistentStream) {
  auto script = std::make_shared<StreamScript>();
  script->lines.push_back(
      std::string("STAT:DEV:MB1.T1:TEMP:SIG:RES:1.234000kO\r\n"));
  auto clock = std::make_shared<FakeClock>();

  transport::SerialSettings settings;
  InstrumentClient client(std::make_unique<transport::SerialTransport>(
      settings, std::make_unique<MockStream>(script), clock));
  client.connect();

  EXPECT_DOUBLE_EQ(client.get_signal("mb1", "RES"), 1234.0);
  EXPECT_EQ(script->written[0], "READ:DEV:MB1.T1:TEMP:SIG:RES\n\r");
}
