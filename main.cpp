// -----------------------------------------------------------------------------
// bracket_engine: single executable entry point.
//
//   1) Load the JSON configuration (path from argv[1], default
//      config/bracket_config.json).
//   2) Build the BracketEngine: paper execution gateway, position sizer,
//      PositionManager and SignalTrader for the configured instrument.
//   3) start(): fill thread, IPC server (commands + telemetry) and the
//      signal gateway thread that receives JSON signals over ZeroMQ.
//   4) Sleep until SIGINT, then stop() in reverse order.
//
// Exit status: 0 on clean shutdown, 1 on a configuration error.
// -----------------------------------------------------------------------------

#include "bracket/config/config_loader.hpp"
#include "bracket/engine/bracket_engine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by main(). Lock-free atomic<bool> is
// async-signal-safe to store to.
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/bracket_config.json";

  bracket::EngineConfig config;
  try {
    config = bracket::ConfigLoader::loadFromFile(config_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] " << config.instrument.symbol
            << " point_value=" << config.instrument.point_value
            << " max_risk=" << config.risk.max_risk_per_trade
            << " trailing=" << (config.risk.trailing_enabled ? "on" : "off")
            << "\n";

  std::unique_ptr<bracket::BracketEngine> engine;
  try {
    engine = std::make_unique<bracket::BracketEngine>(config);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  engine->start();

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine->stop();
  return 0;
}
