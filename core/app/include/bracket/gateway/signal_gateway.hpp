#pragma once

#include "bracket/strategy/signal.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bracket {

// -----------------------------------------------------------------------------
// SignalGateway: ZeroMQ SUB ingress for signals and price bars
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON messages from an external signal source and hands
//         them, decoded, to a sink callback.
//
// @details
// Wire format (one JSON object per ZMQ message):
//
//   {"type":"signal","symbol":"ES","direction":"LONG","price":4500.25,
//    "volatility":3.5,"timestamp_ms":1700000000000}
//   {"type":"bar","symbol":"ES","price":4501.0,"volatility":3.4,
//    "timestamp_ms":1700000060000}
//
// "type" defaults to "signal". Malformed payloads are logged to stderr and
// skipped; the loop keeps running.
//
// Thread model:
//   run() blocks on the calling thread (main() uses the main thread, which
//   makes it the signal thread). stop() may be called from any thread,
//   including a signal handler; run() notices within kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using MessageSink = std::function<void(SignalMessage)>;

  explicit SignalGateway(MessageSink sink,
                         const std::string& endpoint = "tcp://127.0.0.1:5555");
  ~SignalGateway() = default;

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // decode(payload, sequence_id)
  // -------------------------------------------------------------------------
  // @brief  Parses one wire message. No socket involved.
  //
  // @return The decoded message, or std::nullopt (with a log line) if the
  //         payload is not valid JSON, misses a field, or carries an unknown
  //         type or direction.
  // -------------------------------------------------------------------------
  static std::optional<SignalMessage> decode(const std::string& payload,
                                             std::uint64_t sequence_id = 0);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  MessageSink sink_;
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
  std::atomic<bool> running_{false};
  std::uint64_t next_sequence_{1};
};

}  // namespace bracket
