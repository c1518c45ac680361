#pragma once

#include "bracket/concurrent/thread_safe_queue.hpp"
#include "bracket/domain/position.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bracket {

// -----------------------------------------------------------------------------
// IpcServer: operator command channel and position telemetry
// -----------------------------------------------------------------------------
//
// @brief  Routes operator commands received on a ZeroMQ REP socket to
//         registered handlers and publishes position snapshots on a PUB
//         socket.
//
// @details
// Request format: a verb, optionally followed by arguments, e.g.
// "STATUS" or "flatten now". The verb is matched case-insensitively after
// trimming; the rest of the line is passed to the handler as `args`.
//
// Every reply is one JSON object with a "status" field:
//   PING             {"status":"ok","response":"PONG"}   (built in)
//   HELP             {"status":"ok","commands":[...]}    (built in)
//   unknown verb     {"status":"error","response":"Unknown command: X"}
//   handler throws   {"status":"error","response":"<what()>"}
// A handler's object is sent as-is, with "status":"ok" added if it set
// none; a non-object result is wrapped as {"response": <value>}.
//
// Telemetry is a two-frame message so subscribers can filter on the topic:
//   frame 1  "position"
//   frame 2  {"type":"position_update","seq":N,"symbol":"ES",
//             "direction":"LONG","quantity":2,"entry_price":4500.0,
//             "stop_price":4495.0,"target_price":4520.0}
// `seq` starts at 1 and increases by one per published snapshot, so a
// subscriber can detect drops.
//
// Thread model:
//   registerCommand() may be called at any time; the table is guarded.
//   dispatch() is usable without sockets (the engine answers in-process
//   commands through it). start() spawns one worker that owns both sockets,
//   polls the REP socket for kPollTimeoutMs and drains telemetry between
//   polls. Handlers run on the worker thread.
//
// Ownership:
//   The zmq::context_t is borrowed and must outlive the server. The
//   destructor calls stop(), which closes both sockets with zero linger.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<nlohmann::json(const std::string& args)>;

  static constexpr const char* kTelemetryTopic = "position";

  IpcServer(zmq::context_t& context, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Verbs are stored upper-case; registering a verb again replaces it.
  // PING and HELP are answered by the server and cannot be overridden.
  void registerCommand(const std::string& verb, CommandHandler handler);
  std::vector<std::string> commands() const;

  // Parses one request line and returns the serialized JSON reply.
  std::string dispatch(const std::string& request) const;

  // Binds both sockets and starts the worker. Returns false (and logs) if
  // either endpoint is empty or cannot be bound.
  bool start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // Queues a snapshot for publication; dropped while the server is stopped.
  void pushTelemetry(domain::Position position);

  static std::string formatPosition(const domain::Position& position,
                                    std::uint64_t sequence);

 private:
  static constexpr int kPollTimeoutMs = 20;

  void run();
  void publishPending();
  void serveOneRequest();

  zmq::context_t& context_;
  const std::string cmd_endpoint_;
  const std::string pub_endpoint_;

  mutable std::mutex handlers_mutex_;
  std::map<std::string, CommandHandler> handlers_;

  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<domain::Position> telemetry_queue_;
  std::uint64_t published_{0};  // worker thread only

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace bracket
