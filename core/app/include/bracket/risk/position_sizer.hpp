#pragma once

#include "bracket/domain/direction.hpp"
#include "bracket/domain/risk_config.hpp"

namespace bracket {

// -----------------------------------------------------------------------------
// PositionPlan: output of one sizing calculation
// -----------------------------------------------------------------------------
//
// @brief  Bounded order quantity plus the risk figures it was derived from.
//
// @details
// All distances are in price points; all money figures are in account
// currency (points * point_value * quantity). Plans are immutable values
// produced only by PositionSizer.
// -----------------------------------------------------------------------------
class PositionPlan {
 public:
  PositionPlan(int final_quantity, int requested_quantity,
               double stop_distance_points, double point_value,
               double max_risk_dollars)
      : final_quantity_(final_quantity),
        requested_quantity_(requested_quantity),
        stop_distance_points_(stop_distance_points),
        point_value_(point_value),
        max_risk_dollars_(max_risk_dollars) {}

  int finalQuantity() const { return final_quantity_; }
  int requestedQuantity() const { return requested_quantity_; }
  double stopDistancePoints() const { return stop_distance_points_; }
  double pointValue() const { return point_value_; }

  // Money lost per contract if the stop is hit.
  double unitRisk() const { return stop_distance_points_ * point_value_; }
  double totalRisk() const { return unitRisk() * final_quantity_; }

  // True iff the risk cap reduced the requested quantity.
  bool wasRiskAdjusted() const { return final_quantity_ < requested_quantity_; }

  // True when even the one-contract floor costs more than the budget. The
  // plan is still returned; the caller decides whether to trade it.
  bool exceedsRiskBudget() const {
    return max_risk_dollars_ > 0.0 && totalRisk() > max_risk_dollars_;
  }

  double targetDistance(double target_multiplier) const {
    return stop_distance_points_ * target_multiplier;
  }
  double potentialReward(double target_multiplier) const {
    return targetDistance(target_multiplier) * point_value_ * final_quantity_;
  }
  double riskRewardRatio(double target_multiplier) const {
    const double risk = totalRisk();
    return risk > 0.0 ? potentialReward(target_multiplier) / risk : 0.0;
  }

  // Stop placed stop_distance points against the direction of the trade.
  double stopPriceFor(domain::Direction direction, double entry_price) const;
  double targetPriceFor(domain::Direction direction, double entry_price,
                        double target_multiplier) const;

 private:
  int final_quantity_;
  int requested_quantity_;
  double stop_distance_points_;
  double point_value_;
  double max_risk_dollars_;
};

// -----------------------------------------------------------------------------
// PositionSizer: risk-bounded quantity calculator
// -----------------------------------------------------------------------------
//
// @brief  Converts a risk budget, instrument point value and stop distance
//         (given directly or derived from a volatility estimate) into an
//         order quantity that never exceeds the budget unless the
//         one-contract floor forces it.
//
// @details
// Sizing rule:
//
//   unit_risk    = stop_distance * point_value        (must be > 0)
//   requested    = base_qty * multiplier
//   risk_capped  = floor(max_risk / unit_risk)        (max_risk <= 0: no cap)
//   final        = max(step, round_down(min(requested, risk_capped), step))
//
// where step is the instrument's quantity_step (1 for most futures). A plan
// whose one-contract floor still breaks the budget is flagged through
// PositionPlan::exceedsRiskBudget().
//
// Validation errors throw std::invalid_argument:
//   - constructing with point_value <= 0, non-finite, or quantity_step < 1
//   - sizing with unit_risk <= 0 or any non-finite input
//   - volatility sizing with min_stop > max_stop
// They are raised before any order exists, never mid-orchestration.
//
// Thread model:
//   Stateless apart from the immutable instrument copy. Safe to share
//   between threads.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(const domain::InstrumentSpec& instrument);

  // -------------------------------------------------------------------------
  // calculatePosition(...)
  // -------------------------------------------------------------------------
  // @brief  Sizes a trade with an explicit stop distance in points.
  //
  // @param  base_qty              base lots (position_size_factor)
  // @param  multiplier            lots per base unit (trade_lots)
  // @param  max_risk_dollars      per-trade budget; <= 0 disables the cap
  // @param  stop_distance_points  distance from entry to stop
  // @param  point_value           money per point per contract
  //
  // @throws std::invalid_argument if stop_distance * point_value <= 0.
  // -------------------------------------------------------------------------
  static PositionPlan calculatePosition(int base_qty, int multiplier,
                                        double max_risk_dollars,
                                        double stop_distance_points,
                                        double point_value,
                                        int quantity_step = 1);

  // Same, using this sizer's instrument.
  PositionPlan calculatePosition(int base_qty, int multiplier,
                                 double max_risk_dollars,
                                 double stop_distance_points) const;

  // -------------------------------------------------------------------------
  // calculatePositionWithWatr(...)
  // -------------------------------------------------------------------------
  // @brief  Derives the stop distance from a volatility estimate:
  //         clamp(volatility * stop_multiplier, min_stop, max_stop), then
  //         sizes as calculatePosition().
  //
  // @throws std::invalid_argument on min_stop > max_stop, a non-finite
  //         volatility, or a resulting unit risk <= 0.
  // -------------------------------------------------------------------------
  static PositionPlan calculatePositionWithWatr(
      int base_qty, int multiplier, double max_risk_dollars,
      double volatility, double stop_multiplier, double min_stop_points,
      double max_stop_points, double point_value, int quantity_step = 1);

  PositionPlan calculatePositionWithWatr(int base_qty, int multiplier,
                                         double max_risk_dollars,
                                         double volatility,
                                         double stop_multiplier,
                                         double min_stop_points,
                                         double max_stop_points) const;

  // Convenience overload reading every parameter from a RiskConfig.
  PositionPlan planFromVolatility(const domain::RiskConfig& risk,
                                  double volatility) const;

  static double clampStopDistance(double volatility, double stop_multiplier,
                                  double min_stop_points,
                                  double max_stop_points);

  const domain::InstrumentSpec& instrument() const { return instrument_; }

 private:
  const domain::InstrumentSpec instrument_;
};

}  // namespace bracket
