#include "bracket/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bracket {

namespace {

[[noreturn]] void invalid(const std::string& key, const std::string& why) {
  throw std::invalid_argument("config: " + key + " " + why);
}

void requirePositive(double value, const std::string& key) {
  if (!std::isfinite(value) || value <= 0.0) {
    invalid(key, "must be positive");
  }
}

// -----------------------------------------------------------------------------
// validate: range checks that the JSON schema cannot express
// -----------------------------------------------------------------------------
void validate(const EngineConfig& config) {
  requirePositive(config.instrument.point_value, "instrument.point_value");
  if (config.instrument.quantity_step < 1) {
    invalid("instrument.quantity_step", "must be >= 1");
  }
  if (config.instrument.symbol.empty()) {
    invalid("instrument.symbol", "must not be empty");
  }

  const domain::RiskConfig& r = config.risk;
  if (!std::isfinite(r.max_risk_per_trade) || r.max_risk_per_trade < 0.0) {
    invalid("risk.max_risk_per_trade", "must be >= 0");
  }
  if (r.position_size_factor < 1) {
    invalid("risk.position_size_factor", "must be >= 1");
  }
  if (r.trade_lots < 1) {
    invalid("risk.trade_lots", "must be >= 1");
  }
  requirePositive(r.stop_multiplier, "risk.stop_multiplier");
  requirePositive(r.target_multiplier, "risk.target_multiplier");
  requirePositive(r.min_stop_points, "risk.min_stop_points");
  requirePositive(r.max_stop_points, "risk.max_stop_points");
  if (r.min_stop_points > r.max_stop_points) {
    invalid("risk.min_stop_points", "must not exceed risk.max_stop_points");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parse: JSON text -> validated EngineConfig
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::parse(const std::string& json_text) {
  EngineConfig config;

  try {
    const auto json = nlohmann::json::parse(json_text);

    const auto& instrument = json.at("instrument");
    config.instrument.point_value =
        instrument.at("point_value").get<double>();
    config.instrument.symbol =
        instrument.value("symbol", config.instrument.symbol);
    config.instrument.quantity_step =
        instrument.value("quantity_step", config.instrument.quantity_step);

    const auto& risk = json.at("risk");
    domain::RiskConfig& r = config.risk;
    r.max_risk_per_trade = risk.at("max_risk_per_trade").get<double>();
    r.position_size_factor =
        risk.value("position_size_factor", r.position_size_factor);
    r.trade_lots = risk.value("trade_lots", r.trade_lots);
    r.stop_multiplier = risk.value("stop_multiplier", r.stop_multiplier);
    r.target_multiplier = risk.value("target_multiplier", r.target_multiplier);
    r.min_stop_points = risk.value("min_stop_points", r.min_stop_points);
    r.max_stop_points = risk.value("max_stop_points", r.max_stop_points);
    r.trailing_enabled = risk.value("trailing_enabled", r.trailing_enabled);

    if (json.contains("endpoints")) {
      const auto& ep = json.at("endpoints");
      config.signal_endpoint = ep.value("signals", config.signal_endpoint);
      config.command_endpoint = ep.value("commands", config.command_endpoint);
      config.telemetry_endpoint =
          ep.value("telemetry", config.telemetry_endpoint);
    }

    if (json.contains("execution")) {
      const auto& ex = json.at("execution");
      config.order_id_prefix =
          ex.value("order_id_prefix", config.order_id_prefix);
      config.paper_oco = ex.value("paper_oco", config.paper_oco);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("config: ") + e.what());
  }

  validate(config);
  return config;
}

EngineConfig ConfigLoader::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

}  // namespace bracket
