#pragma once

#include <string>

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentSpec: static metadata of the traded instrument
// -----------------------------------------------------------------------------
//
// @brief  Dollar value of one point of price movement per contract, and the
//         smallest tradable quantity increment.
//
// @details
// point_value must be strictly positive. PositionSizer refuses to be
// constructed otherwise, and ConfigLoader rejects such a document before a
// sizer is ever built.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  std::string symbol{"ES"};
  double point_value{50.0};
  int quantity_step{1};
};

// -----------------------------------------------------------------------------
// RiskConfig: per-trade sizing and bracket parameters
// -----------------------------------------------------------------------------
//
// @brief  Read-only parameters handed to PositionSizer and SignalTrader.
//
// @details
// Loaded once at startup by ConfigLoader and copied by value into the
// components that need them. No component mutates them afterwards.
//
//   max_risk_per_trade    dollar budget one trade may lose at its stop;
//                         0 disables the risk cap
//   position_size_factor  base quantity multiplier
//   trade_lots            lots per unit of position_size_factor
//   stop_multiplier       stop distance = volatility * stop_multiplier
//   target_multiplier     target distance = stop distance * target_multiplier
//   min/max_stop_points   clamp applied to the volatility stop distance
//   trailing_enabled      SignalTrader trails the stop on every bar
// -----------------------------------------------------------------------------
struct RiskConfig {
  double max_risk_per_trade{500.0};
  int position_size_factor{1};
  int trade_lots{1};
  double stop_multiplier{2.0};
  double target_multiplier{2.0};
  double min_stop_points{2.0};
  double max_stop_points{40.0};
  bool trailing_enabled{false};
};

}  // namespace domain
}  // namespace bracket
