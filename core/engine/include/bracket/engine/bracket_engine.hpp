#pragma once

#include "bracket/concurrent/order_id_generator.hpp"
#include "bracket/config/config_loader.hpp"
#include "bracket/execution/paper_execution_gateway.hpp"
#include "bracket/gateway/signal_gateway.hpp"
#include "bracket/network/ipc_server.hpp"
#include "bracket/position/position_manager.hpp"
#include "bracket/risk/position_sizer.hpp"
#include "bracket/strategy/signal.hpp"
#include "bracket/strategy/signal_trader.hpp"

#include <memory>
#include <string>
#include <thread>

namespace bracket {

// -----------------------------------------------------------------------------
// BracketEngine: top-level wiring for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Owns the paper gateway, sizer, PositionManager, SignalTrader and
//         the optional ZeroMQ surfaces, and starts/stops them in order.
//
// @details
// Threads after start():
//
//   signal thread     SignalGateway::run()  → pushMessage() → SignalTrader
//   fill thread       PaperExecutionGateway → PositionManager::onFill()
//   ipc thread        IpcServer             → registered command handlers
//
// An empty endpoint in the config disables that surface; unit tests build
// the engine with all endpoints empty and drive it through pushMessage()
// and executeCommand().
//
// Commands (plain-text request, JSON reply; IpcServer answers PING/HELP):
//   STATUS    position, tracked orders, halt flag
//   FLATTEN   exits the open position
//   HALT      stops acting on new signals
//   RESUME    clears HALT
//
// Construction throws std::invalid_argument if the instrument cannot be
// sized (see PositionSizer).
// -----------------------------------------------------------------------------
class BracketEngine {
 public:
  explicit BracketEngine(const EngineConfig& config);
  ~BracketEngine();

  BracketEngine(const BracketEngine&) = delete;
  BracketEngine& operator=(const BracketEngine&) = delete;
  BracketEngine(BracketEngine&&) = delete;
  BracketEngine& operator=(BracketEngine&&) = delete;

  void start();
  void stop();
  bool isRunning() const { return running_; }

  // Feeds one decoded message on the calling thread: the simulated venue
  // sees the price first, then the strategy acts on it.
  void pushMessage(const SignalMessage& message);

  // Answers a command in-process through the same table the REP socket uses.
  std::string executeCommand(const std::string& cmd);

  PositionManager& positionManager() { return manager_; }
  PaperExecutionGateway& executionGateway() { return gateway_; }
  SignalTrader& trader() { return trader_; }

 private:
  const EngineConfig config_;

  OrderIdGenerator id_gen_;
  PaperExecutionGateway gateway_;
  PositionSizer sizer_;
  PositionManager manager_;
  SignalTrader trader_;

  void registerCommands();

  // Declared before ipc_server_ so sockets close before the context.
  zmq::context_t ipc_context_{1};
  IpcServer ipc_server_;
  std::unique_ptr<SignalGateway> signal_gateway_;
  std::thread signal_thread_;

  bool running_{false};
};

}  // namespace bracket
