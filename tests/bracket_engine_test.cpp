// =============================================================================
// bracket_engine_test.cpp
// =============================================================================
// End-to-end tests for bracket::BracketEngine with the paper venue and no
// sockets: messages are pushed directly and operator commands are executed
// through executeCommand().
//
// Validates:
//   - PING / STATUS / FLATTEN / HALT / RESUME / unknown command replies
//   - Signal -> bracket -> venue fill -> tracked position
//   - A bar crossing the target closes the trade and clears the bundle
//   - Messages for other symbols are ignored
//   - The same commands answered over the ipc:// REP endpoint
// =============================================================================

#include "bracket/engine/bracket_engine.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <zmq.hpp>

#include <chrono>
#include <string>

using bracket::BracketEngine;
using bracket::DirectionalSignal;
using bracket::EngineConfig;
using bracket::PriceBar;
using bracket::SignalDirection;
using namespace std::chrono_literals;

namespace {

EngineConfig offlineConfig() {
  EngineConfig config;
  config.signal_endpoint.clear();
  config.command_endpoint.clear();
  config.telemetry_endpoint.clear();
  config.risk.max_risk_per_trade = 500.0;
  config.risk.trade_lots = 1;
  config.risk.stop_multiplier = 2.0;
  config.risk.target_multiplier = 2.0;
  config.risk.trailing_enabled = true;
  return config;
}

DirectionalSignal signalOf(SignalDirection direction, double price,
                           const std::string& symbol = "ES") {
  DirectionalSignal signal;
  signal.symbol = symbol;
  signal.direction = direction;
  signal.price = price;
  signal.volatility = 3.0;
  return signal;
}

PriceBar barOf(double price) {
  PriceBar bar;
  bar.symbol = "ES";
  bar.price = price;
  bar.volatility = 3.0;
  return bar;
}

}  // namespace

class BracketEngineTest : public ::testing::Test {
 protected:
  BracketEngineTest() : engine(offlineConfig()) {}

  void SetUp() override { engine.start(); }
  void TearDown() override { engine.stop(); }

  nlohmann::json command(const std::string& cmd) {
    return nlohmann::json::parse(engine.executeCommand(cmd));
  }

  void settle() {
    ASSERT_TRUE(engine.executionGateway().waitUntilIdle(2000ms));
  }

  BracketEngine engine;
};

// -----------------------------------------------------------------------------
// 1. Simple commands.
// -----------------------------------------------------------------------------
TEST_F(BracketEngineTest, PingAndUnknownCommand) {
  const auto ping = command("PING");
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  const auto unknown = command("REBOOT");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: REBOOT");
}

TEST_F(BracketEngineTest, StatusWhenFlat) {
  const auto status = command("STATUS");
  EXPECT_EQ(status["status"], "ok");
  EXPECT_FALSE(status["halted"].get<bool>());
  EXPECT_EQ(status["position"]["direction"], "FLAT");
  EXPECT_TRUE(status["orders"].empty());
}

// -----------------------------------------------------------------------------
// 2. LONG signal: 6 point stop, 1 lot (300 risk within 500 budget).
// -----------------------------------------------------------------------------
TEST_F(BracketEngineTest, SignalOpensBracketAtVenue) {
  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  settle();

  const auto status = command("STATUS");
  EXPECT_EQ(status["position"]["direction"], "LONG");
  EXPECT_EQ(status["position"]["quantity"], 1);
  EXPECT_DOUBLE_EQ(status["position"]["stop_price"].get<double>(), 4494.0);
  EXPECT_DOUBLE_EQ(status["position"]["target_price"].get<double>(), 4512.0);
  ASSERT_EQ(status["orders"].size(), 3u);
  EXPECT_EQ(status["orders"][0]["role"], "Entry");
  EXPECT_EQ(status["orders"][0]["status"], "Filled");

  // Stop and target are working at the paper venue.
  EXPECT_EQ(engine.executionGateway().workingOrders().size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Bar through the target: venue fills the limit, manager goes flat and
//    cancels the stop.
// -----------------------------------------------------------------------------
TEST_F(BracketEngineTest, BarThroughTargetClosesTrade) {
  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  settle();

  engine.pushMessage(barOf(4513.0));
  settle();

  EXPECT_FALSE(engine.positionManager().hasPosition());
  EXPECT_TRUE(engine.positionManager().getTrackedOrders().empty());
  EXPECT_TRUE(engine.executionGateway().workingOrders().empty());
}

TEST_F(BracketEngineTest, BarTrailsStopBeforeStopOut) {
  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  settle();

  engine.pushMessage(barOf(4508.0));  // trail to 4502
  EXPECT_DOUBLE_EQ(engine.positionManager().getCurrentPosition().stop_price,
                   4502.0);

  engine.pushMessage(barOf(4501.0));  // through the trailed stop
  settle();
  EXPECT_FALSE(engine.positionManager().hasPosition());
}

// -----------------------------------------------------------------------------
// 4. Reversal through the engine.
// -----------------------------------------------------------------------------
TEST_F(BracketEngineTest, OppositeSignalReverses) {
  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  settle();
  engine.pushMessage(signalOf(SignalDirection::Short, 4503.0));
  settle();

  EXPECT_TRUE(engine.positionManager().isShort());
  EXPECT_EQ(engine.executionGateway().workingOrders().size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. FLATTEN / HALT / RESUME.
// -----------------------------------------------------------------------------
TEST_F(BracketEngineTest, FlattenClosesPosition) {
  EXPECT_EQ(command("FLATTEN")["status"], "error");

  engine.pushMessage(signalOf(SignalDirection::Short, 4500.0));
  settle();
  const auto reply = command("FLATTEN");
  settle();

  EXPECT_EQ(reply["status"], "ok");
  EXPECT_FALSE(engine.positionManager().hasPosition());
  EXPECT_TRUE(engine.executionGateway().workingOrders().empty());
}

TEST_F(BracketEngineTest, HaltAndResume) {
  EXPECT_EQ(command("HALT")["status"], "ok");
  EXPECT_TRUE(command("STATUS")["halted"].get<bool>());

  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  EXPECT_FALSE(engine.positionManager().hasPosition());

  EXPECT_EQ(command("RESUME")["status"], "ok");
  engine.pushMessage(signalOf(SignalDirection::Long, 4500.0));
  settle();
  EXPECT_TRUE(engine.positionManager().isLong());
}

TEST_F(BracketEngineTest, OtherSymbolIgnored) {
  engine.pushMessage(signalOf(SignalDirection::Long, 15000.0, "NQ"));
  EXPECT_FALSE(engine.positionManager().hasPosition());
  EXPECT_EQ(engine.executionGateway().submitCount(), 0u);
}

// -----------------------------------------------------------------------------
// Commands over the REP socket reach the same handlers as executeCommand().
// -----------------------------------------------------------------------------
TEST(BracketEngineSocketTest, StatusOverCommandEndpoint) {
  const std::string dir = ::testing::TempDir();
  EngineConfig config = offlineConfig();
  config.command_endpoint = "ipc://" + dir + "bracket-engine-cmd";
  config.telemetry_endpoint = "ipc://" + dir + "bracket-engine-telemetry";

  BracketEngine engine(config);
  engine.start();

  zmq::context_t context{1};
  zmq::socket_t client(context, zmq::socket_type::req);
  client.set(zmq::sockopt::linger, 0);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.connect(config.command_endpoint);

  const std::string request = "halt";
  ASSERT_TRUE(client.send(zmq::buffer(request), zmq::send_flags::none));
  zmq::message_t reply;
  ASSERT_TRUE(client.recv(reply, zmq::recv_flags::none));
  const auto json = nlohmann::json::parse(reply.to_string());
  EXPECT_EQ(json["status"], "ok");
  EXPECT_EQ(json["response"], "Trading halted");
  EXPECT_TRUE(engine.trader().isHalted());

  client.close();
  engine.stop();
}
