// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for bracket::IpcServer: the command table on its own, then the
// REP and PUB sockets over inproc:// endpoints sharing the test's context.
//
// Validates:
//   - PING / HELP built-ins, case and whitespace normalization, arguments
//   - Unknown and empty commands, handler exceptions, reply wrapping
//   - A REQ client gets the registered handler's reply over the socket
//   - Telemetry arrives as a "position" topic frame plus JSON with seq
//   - start() refuses empty endpoints
// =============================================================================

#include "bracket/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using bracket::IpcServer;
using bracket::domain::Direction;
using bracket::domain::Position;

namespace {

Position longPosition() {
  Position p;
  p.symbol = "ES";
  p.direction = Direction::Long;
  p.quantity = 2;
  p.entry_price = 4500.0;
  p.stop_price = 4495.0;
  p.target_price = 4520.0;
  return p;
}

class IpcServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server.registerCommand("status", [](const std::string& args) {
      nlohmann::json reply;
      reply["halted"] = false;
      reply["args"] = args;
      return reply;
    });
  }

  nlohmann::json reply(const std::string& request) {
    return nlohmann::json::parse(server.dispatch(request));
  }

  zmq::context_t context{1};
  IpcServer server{context, "inproc://bracket-test-cmd",
                   "inproc://bracket-test-telemetry"};
};

}  // namespace

// 1. PING is answered without registration.
TEST_F(IpcServerTest, PingIsBuiltIn) {
  const auto pong = reply("PING");
  EXPECT_EQ(pong["status"], "ok");
  EXPECT_EQ(pong["response"], "PONG");
}

// 2. Verbs are trimmed and matched case-insensitively; the rest is args.
TEST_F(IpcServerTest, VerbNormalizationAndArgs) {
  const auto bare = reply("  Status \n");
  EXPECT_EQ(bare["status"], "ok");
  EXPECT_FALSE(bare["halted"].get<bool>());
  EXPECT_EQ(bare["args"], "");

  const auto with_args = reply("STATUS   orders only ");
  EXPECT_EQ(with_args["args"], "orders only");
}

// 3. Unknown verbs echo what was sent; empty requests are errors.
TEST_F(IpcServerTest, UnknownAndEmptyCommands) {
  const auto unknown = reply("reboot now");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: reboot");

  const auto empty = reply("   ");
  EXPECT_EQ(empty["status"], "error");
  EXPECT_EQ(empty["response"], "Empty command");
}

// 4. A throwing handler becomes an error reply; the server keeps serving.
TEST_F(IpcServerTest, HandlerExceptionBecomesError) {
  server.registerCommand("FLATTEN", [](const std::string&) -> nlohmann::json {
    throw std::runtime_error("venue unavailable");
  });

  const auto failed = reply("FLATTEN");
  EXPECT_EQ(failed["status"], "error");
  EXPECT_EQ(failed["response"], "venue unavailable");
  EXPECT_EQ(reply("PING")["status"], "ok");
}

// 5. Scalar results are wrapped; an explicit status is kept.
TEST_F(IpcServerTest, ReplyWrapping) {
  server.registerCommand("HALT", [](const std::string&) {
    return nlohmann::json("Trading halted");
  });
  server.registerCommand("RESUME", [](const std::string&) {
    nlohmann::json r;
    r["status"] = "error";
    r["response"] = "Not halted";
    return r;
  });

  const auto halted = reply("HALT");
  EXPECT_EQ(halted["status"], "ok");
  EXPECT_EQ(halted["response"], "Trading halted");

  EXPECT_EQ(reply("RESUME")["status"], "error");
}

// 6. HELP lists built-ins and registered verbs; PING cannot be replaced.
TEST_F(IpcServerTest, HelpListsCommands) {
  server.registerCommand("ping", [](const std::string&) {
    return nlohmann::json("hijacked");
  });

  const auto help = reply("help");
  const auto verbs = help["commands"].get<std::vector<std::string>>();
  EXPECT_EQ(verbs, (std::vector<std::string>{"HELP", "PING", "STATUS"}));
  EXPECT_EQ(reply("PING")["response"], "PONG");
}

// 7. A REQ client reaches the handler through the REP socket.
TEST_F(IpcServerTest, RequestReplyOverSocket) {
  ASSERT_TRUE(server.start());
  EXPECT_TRUE(server.isRunning());

  zmq::socket_t client(context, zmq::socket_type::req);
  client.set(zmq::sockopt::linger, 0);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.connect("inproc://bracket-test-cmd");

  const std::string request = "status";
  ASSERT_TRUE(client.send(zmq::buffer(request), zmq::send_flags::none));

  zmq::message_t response;
  ASSERT_TRUE(client.recv(response, zmq::recv_flags::none));
  const auto json = nlohmann::json::parse(response.to_string());
  EXPECT_EQ(json["status"], "ok");
  EXPECT_FALSE(json["halted"].get<bool>());

  client.close();
  server.stop();
  EXPECT_FALSE(server.isRunning());
}

// 8. Position snapshots are published under the "position" topic.
TEST_F(IpcServerTest, TelemetryPublishedWithTopicAndSequence) {
  ASSERT_TRUE(server.start());

  zmq::socket_t subscriber(context, zmq::socket_type::sub);
  subscriber.set(zmq::sockopt::linger, 0);
  subscriber.set(zmq::sockopt::rcvtimeo, 100);
  subscriber.set(zmq::sockopt::subscribe, IpcServer::kTelemetryTopic);
  subscriber.connect("inproc://bracket-test-telemetry");

  // Subscriptions propagate asynchronously; publish until one arrives.
  zmq::message_t topic;
  bool received = false;
  for (int attempt = 0; attempt < 50 && !received; ++attempt) {
    server.pushTelemetry(longPosition());
    received = subscriber.recv(topic, zmq::recv_flags::none).has_value();
  }
  ASSERT_TRUE(received);
  EXPECT_EQ(topic.to_string(), "position");
  ASSERT_TRUE(topic.more());

  zmq::message_t payload;
  ASSERT_TRUE(subscriber.recv(payload, zmq::recv_flags::none));
  const auto json = nlohmann::json::parse(payload.to_string());
  EXPECT_EQ(json["type"], "position_update");
  EXPECT_EQ(json["symbol"], "ES");
  EXPECT_EQ(json["direction"], "LONG");
  EXPECT_EQ(json["quantity"], 2);
  EXPECT_DOUBLE_EQ(json["stop_price"].get<double>(), 4495.0);
  EXPECT_GE(json["seq"].get<std::uint64_t>(), 1u);

  subscriber.close();
  server.stop();
}

// 9. Both endpoints are required; nothing is queued while stopped.
TEST(IpcServerStartTest, EmptyEndpointRefused) {
  zmq::context_t context{1};
  IpcServer server(context, "", "inproc://bracket-unused");
  EXPECT_FALSE(server.start());
  EXPECT_FALSE(server.isRunning());
  server.pushTelemetry(longPosition());
  server.stop();
}

// 10. formatPosition carries the flat direction and the given sequence.
TEST(IpcServerFormatTest, FlatPosition) {
  const auto json = nlohmann::json::parse(IpcServer::formatPosition(Position{}, 7));
  EXPECT_EQ(json["seq"], 7);
  EXPECT_EQ(json["direction"], "FLAT");
  EXPECT_EQ(json["quantity"], 0);
}
