#include "bracket/engine/bracket_engine.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace bracket {

namespace {

nlohmann::json positionToJson(const domain::Position& pos) {
  nlohmann::json p;
  p["symbol"] = pos.symbol;
  p["direction"] = domain::toString(pos.direction);
  p["quantity"] = pos.quantity;
  p["entry_price"] = pos.entry_price;
  p["stop_price"] = pos.stop_price;
  p["target_price"] = pos.target_price;
  return p;
}

nlohmann::json orderToJson(const domain::TrackedOrder& order) {
  nlohmann::json o;
  o["id"] = order.id;
  o["role"] = domain::toString(order.role);
  o["tag"] = order.tag;
  o["status"] = domain::toString(order.status);
  o["price"] = order.price;
  o["quantity"] = order.quantity;
  return o;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components in dependency order
// -----------------------------------------------------------------------------
BracketEngine::BracketEngine(const EngineConfig& config)
    : config_(config),
      id_gen_(config.order_id_prefix),
      gateway_(config.paper_oco),
      sizer_(config.instrument),
      manager_(gateway_, id_gen_, config.instrument),
      trader_(manager_, sizer_, config.risk),
      ipc_server_(ipc_context_, config.command_endpoint,
                  config.telemetry_endpoint) {
  gateway_.setFillHandler(
      [this](const FillDetails& fill) { manager_.onFill(fill); });
  registerCommands();
}

BracketEngine::~BracketEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): fills first, then telemetry/commands, then signal ingress last
// -----------------------------------------------------------------------------
void BracketEngine::start() {
  if (running_) {
    return;
  }

  gateway_.start();

  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty() && ipc_server_.start()) {
    manager_.setPositionListener([this](const domain::Position& pos) {
      ipc_server_.pushTelemetry(pos);
    });
  }

  if (!config_.signal_endpoint.empty()) {
    signal_gateway_ = std::make_unique<SignalGateway>(
        [this](SignalMessage message) { pushMessage(message); },
        config_.signal_endpoint);
    signal_thread_ = std::thread([this] { signal_gateway_->run(); });
  }

  running_ = true;

  std::cout << "[BracketEngine] started for " << config_.instrument.symbol
            << ". Threads: fills" << (ipc_server_.isRunning() ? ", ipc" : "")
            << (signal_gateway_ ? ", signals" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): reverse order of start()
// -----------------------------------------------------------------------------
void BracketEngine::stop() {
  if (!running_) {
    return;
  }

  if (signal_gateway_) {
    signal_gateway_->stop();
  }
  if (signal_thread_.joinable()) {
    signal_thread_.join();
  }
  signal_gateway_.reset();

  manager_.setPositionListener(nullptr);
  ipc_server_.stop();

  gateway_.stop();

  running_ = false;

  std::cout << "[BracketEngine] stopped. " << manager_.getOrderStatus();
}

// -----------------------------------------------------------------------------
// pushMessage(): dispatch signal / bar
// -----------------------------------------------------------------------------
void BracketEngine::pushMessage(const SignalMessage& message) {
  if (const auto* signal = std::get_if<DirectionalSignal>(&message)) {
    if (signal->symbol != config_.instrument.symbol) {
      std::cerr << "[BracketEngine] ignoring signal for " << signal->symbol
                << "\n";
      return;
    }
    gateway_.onPrice(signal->price);
    const TradeAction action = trader_.onSignal(*signal);
    std::cout << "[BracketEngine] signal #" << signal->sequence_id << " "
              << toString(signal->direction) << " -> " << toString(action)
              << "\n";
    return;
  }

  if (const auto* bar = std::get_if<PriceBar>(&message)) {
    if (bar->symbol != config_.instrument.symbol) {
      return;
    }
    gateway_.onPrice(bar->price);
    trader_.onBar(*bar);
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string BracketEngine::executeCommand(const std::string& cmd) {
  return ipc_server_.dispatch(cmd);
}

void BracketEngine::registerCommands() {
  ipc_server_.registerCommand("STATUS", [this](const std::string&) {
    nlohmann::json response;
    response["halted"] = trader_.isHalted();
    response["position"] = positionToJson(manager_.getCurrentPosition());

    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : manager_.getTrackedOrders()) {
      orders.push_back(orderToJson(order));
    }
    response["orders"] = std::move(orders);
    return response;
  });

  ipc_server_.registerCommand("FLATTEN", [this](const std::string&) {
    const bool flattened = manager_.exitPosition();
    nlohmann::json response;
    response["status"] = flattened ? "ok" : "error";
    response["response"] = flattened ? "Position closed" : "No position closed";
    return response;
  });

  ipc_server_.registerCommand("HALT", [this](const std::string&) {
    trader_.haltTrading();
    return nlohmann::json("Trading halted");
  });

  ipc_server_.registerCommand("RESUME", [this](const std::string&) {
    trader_.resumeTrading();
    return nlohmann::json("Trading resumed");
  });
}

}  // namespace bracket
