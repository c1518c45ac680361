#pragma once

#include "bracket/domain/risk_config.hpp"

#include <string>

namespace bracket {

// -----------------------------------------------------------------------------
// EngineConfig: everything the bracket_engine binary is configured with
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::InstrumentSpec instrument;
  domain::RiskConfig risk;

  std::string signal_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::string order_id_prefix{"BRK"};
  bool paper_oco{false};
};

// -----------------------------------------------------------------------------
// ConfigLoader: JSON configuration parser
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document.
//
// @details
// Expected shape (only "instrument.point_value" and "risk.max_risk_per_trade"
// are required; everything else falls back to the EngineConfig defaults):
//
//   {
//     "instrument": { "symbol": "ES", "point_value": 50.0,
//                     "quantity_step": 1 },
//     "risk": { "max_risk_per_trade": 500.0, "position_size_factor": 1,
//               "trade_lots": 1, "stop_multiplier": 2.0,
//               "target_multiplier": 2.0, "min_stop_points": 2.0,
//               "max_stop_points": 40.0, "trailing_enabled": false },
//     "endpoints": { "signals": "...", "commands": "...",
//                    "telemetry": "..." },
//     "execution": { "order_id_prefix": "BRK", "paper_oco": false }
//   }
//
// Errors:
//   std::invalid_argument  malformed JSON, missing required key, wrong type,
//                          or a value outside its valid range; the message
//                          names the key
//   std::runtime_error     loadFromFile() could not open the file
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static EngineConfig parse(const std::string& json_text);
  static EngineConfig loadFromFile(const std::string& path);
};

}  // namespace bracket
