#pragma once

#include "bracket/domain/risk_config.hpp"
#include "bracket/position/position_manager.hpp"
#include "bracket/risk/position_sizer.hpp"
#include "bracket/strategy/signal.hpp"

#include <atomic>

namespace bracket {

// What onSignal() did with a signal.
enum class TradeAction {
  Entered,                  // Was flat, bracket placed
  Reversed,                 // Opposite position closed and new one placed
  Ignored,                  // Already positioned in the signal's direction
  Halted,                   // Trading halted by the operator
  SizingRejected,           // Sizer refused the inputs (validation error)
  EntryRejected,            // Gateway rejected the bracket; still flat
  ReversalFailed,           // Exit rejected; old position kept
  FlatAfterFailedReversal,  // Exit done, new entry rejected; now flat
};

const char* toString(TradeAction action);

// -----------------------------------------------------------------------------
// SignalTrader
// -----------------------------------------------------------------------------
// Responsibility: Turns edge-triggered directional signals into position
// lifecycle calls. Flat enters, an opposite signal reverses, a repeated
// signal is ignored. Quantity and bracket prices come from PositionSizer's
// volatility sizing with the configured RiskConfig.
//
// Trailing: when risk.trailing_enabled, onBar() moves the stop to
// price -/+ clamp(volatility * stop_multiplier) whenever that tightens it.
//
// Thread model: onSignal() and onBar() run on the signal thread.
// haltTrading()/resumeTrading() may be called from any thread (IPC).
// -----------------------------------------------------------------------------
class SignalTrader {
 public:
  SignalTrader(PositionManager& manager, const PositionSizer& sizer,
               const domain::RiskConfig& risk);

  SignalTrader(const SignalTrader&) = delete;
  SignalTrader& operator=(const SignalTrader&) = delete;
  SignalTrader(SignalTrader&&) = delete;
  SignalTrader& operator=(SignalTrader&&) = delete;

  TradeAction onSignal(const DirectionalSignal& signal);

  // Returns true if the stop was trailed.
  bool onBar(const PriceBar& bar);

  void haltTrading();
  void resumeTrading();
  bool isHalted() const;

 private:
  PositionManager& manager_;
  const PositionSizer& sizer_;
  const domain::RiskConfig risk_;
  std::atomic<bool> halt_trading_{false};
};

}  // namespace bracket
