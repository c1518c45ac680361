#include "bracket/strategy/signal_trader.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace bracket {

const char* toString(TradeAction action) {
  switch (action) {
    case TradeAction::Entered:                 return "Entered";
    case TradeAction::Reversed:                return "Reversed";
    case TradeAction::Ignored:                 return "Ignored";
    case TradeAction::Halted:                  return "Halted";
    case TradeAction::SizingRejected:          return "SizingRejected";
    case TradeAction::EntryRejected:           return "EntryRejected";
    case TradeAction::ReversalFailed:          return "ReversalFailed";
    case TradeAction::FlatAfterFailedReversal: return "FlatAfterFailedReversal";
  }
  return "Unknown";
}

SignalTrader::SignalTrader(PositionManager& manager, const PositionSizer& sizer,
                           const domain::RiskConfig& risk)
    : manager_(manager), sizer_(sizer), risk_(risk) {}

// -----------------------------------------------------------------------------
// onSignal: enter, reverse or ignore
// -----------------------------------------------------------------------------
TradeAction SignalTrader::onSignal(const DirectionalSignal& signal) {
  if (halt_trading_.load()) {
    std::cout << "[SignalTrader] halted, ignoring " << toString(signal.direction)
              << " signal\n";
    return TradeAction::Halted;
  }

  manager_.updateMarkPrice(signal.price);

  const bool want_long = signal.direction == SignalDirection::Long;
  if ((want_long && manager_.isLong()) || (!want_long && manager_.isShort())) {
    return TradeAction::Ignored;
  }

  const domain::Direction direction =
      want_long ? domain::Direction::Long : domain::Direction::Short;

  std::optional<PositionPlan> plan;
  try {
    plan = sizer_.planFromVolatility(risk_, signal.volatility);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[SignalTrader] sizing rejected " << toString(signal.direction)
              << " signal @ " << signal.price << ": " << e.what() << "\n";
    return TradeAction::SizingRejected;
  }

  if (plan->exceedsRiskBudget()) {
    std::cerr << "[SignalTrader] WARNING: minimum quantity risks "
              << plan->totalRisk() << " > budget " << risk_.max_risk_per_trade
              << "\n";
  }

  const double stop = plan->stopPriceFor(direction, signal.price);
  const double target =
      plan->targetPriceFor(direction, signal.price, risk_.target_multiplier);
  const int quantity = plan->finalQuantity();

  std::cout << "[SignalTrader] " << toString(signal.direction) << " @ "
            << signal.price << " qty=" << quantity << " stop=" << stop
            << " target=" << target
            << (plan->wasRiskAdjusted() ? " (risk-adjusted)" : "") << "\n";

  if (!manager_.hasPosition()) {
    const auto info =
        want_long ? manager_.enterLong(signal.price, stop, target, quantity)
                  : manager_.enterShort(signal.price, stop, target, quantity);
    return info ? TradeAction::Entered : TradeAction::EntryRejected;
  }

  const domain::ReversalResult result =
      manager_.reversePosition(signal.price, stop, target, quantity);
  switch (result.status) {
    case domain::ReversalStatus::Reversed:
      return TradeAction::Reversed;
    case domain::ReversalStatus::FlatAfterFailedEntry:
      return TradeAction::FlatAfterFailedReversal;
    case domain::ReversalStatus::NoPosition: {
      // A protective fill closed the position between the check and the
      // reversal; enter fresh instead.
      const auto info =
          want_long ? manager_.enterLong(signal.price, stop, target, quantity)
                    : manager_.enterShort(signal.price, stop, target, quantity);
      return info ? TradeAction::Entered : TradeAction::EntryRejected;
    }
    case domain::ReversalStatus::InvalidRequest:
    case domain::ReversalStatus::ExitFailed:
      return TradeAction::ReversalFailed;
  }
  return TradeAction::ReversalFailed;
}

// -----------------------------------------------------------------------------
// onBar: mark price and volatility trailing stop
// -----------------------------------------------------------------------------
bool SignalTrader::onBar(const PriceBar& bar) {
  manager_.updateMarkPrice(bar.price);

  if (!risk_.trailing_enabled || halt_trading_.load()) {
    return false;
  }

  const domain::Position pos = manager_.getCurrentPosition();
  if (pos.isFlat()) {
    return false;
  }

  double distance = 0.0;
  try {
    distance = PositionSizer::clampStopDistance(
        bar.volatility, risk_.stop_multiplier, risk_.min_stop_points,
        risk_.max_stop_points);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[SignalTrader] trailing skipped: " << e.what() << "\n";
    return false;
  }

  const bool is_long = pos.direction == domain::Direction::Long;
  const double candidate = is_long ? bar.price - distance : bar.price + distance;
  const bool tightens =
      is_long ? candidate > pos.stop_price : candidate < pos.stop_price;
  if (!tightens) {
    return false;
  }
  return manager_.trailStop(candidate);
}

void SignalTrader::haltTrading() {
  halt_trading_.store(true);
  std::cerr << "[SignalTrader] trading HALTED\n";
}

void SignalTrader::resumeTrading() {
  halt_trading_.store(false);
  std::cout << "[SignalTrader] trading resumed\n";
}

bool SignalTrader::isHalted() const { return halt_trading_.load(); }

}  // namespace bracket
