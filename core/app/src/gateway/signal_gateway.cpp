#include "bracket/gateway/signal_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace bracket {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
SignalGateway::SignalGateway(MessageSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void SignalGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      // SIGINT interrupts the blocking recv; the stop flag decides.
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    if (auto decoded = decode(msg.to_string(), next_sequence_)) {
      ++next_sequence_;
      sink_(std::move(*decoded));
    }
  }
}

void SignalGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// decode(): JSON payload -> DirectionalSignal | PriceBar
// -----------------------------------------------------------------------------
std::optional<SignalMessage> SignalGateway::decode(const std::string& payload,
                                                   std::uint64_t sequence_id) {
  try {
    const auto json = nlohmann::json::parse(payload);
    const std::string type = json.value("type", std::string{"signal"});

    const std::string symbol = json.at("symbol").get<std::string>();
    const double price = json.at("price").get<double>();
    const double volatility = json.value("volatility", 0.0);
    const Timestamp ts =
        json.contains("timestamp_ms")
            ? ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>())
            : now();

    if (type == "bar") {
      PriceBar bar;
      bar.symbol = symbol;
      bar.price = price;
      bar.volatility = volatility;
      bar.timestamp = ts;
      bar.sequence_id = sequence_id;
      return SignalMessage{bar};
    }

    if (type != "signal") {
      std::cerr << "[SignalGateway] unknown message type '" << type
                << "', payload: " << payload << "\n";
      return std::nullopt;
    }

    const std::string direction = json.at("direction").get<std::string>();
    DirectionalSignal signal;
    if (direction == "LONG") {
      signal.direction = SignalDirection::Long;
    } else if (direction == "SHORT") {
      signal.direction = SignalDirection::Short;
    } else {
      std::cerr << "[SignalGateway] unknown direction '" << direction
                << "', payload: " << payload << "\n";
      return std::nullopt;
    }
    signal.symbol = symbol;
    signal.price = price;
    signal.volatility = volatility;
    signal.timestamp = ts;
    signal.sequence_id = sequence_id;
    return SignalMessage{signal};

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SignalGateway] JSON parse error: " << e.what()
              << ", payload: " << payload << "\n";
    return std::nullopt;
  }
}

}  // namespace bracket
