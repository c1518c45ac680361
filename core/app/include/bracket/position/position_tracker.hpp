#pragma once

#include "bracket/domain/direction.hpp"
#include "bracket/domain/position.hpp"

#include <string>

namespace bracket {

// -----------------------------------------------------------------------------
// PositionTracker: scalar state of the managed position
// -----------------------------------------------------------------------------
//
// @brief  Holds direction, entry, stop, target and quantity of the current
//         position and answers P&L and proximity questions about it.
//
// @details
// Flat means quantity 0 and every price at the 0.0 sentinel. Direction only
// changes through updatePosition() and reset(); the single-field mutators
// are ignored while flat.
//
// updatePosition() also records the initial risk (|entry - stop|) and
// initial reward (|target - entry|). Proximity checks measure against these
// recorded distances, so trailing the stop or price drifting toward the
// target does not shrink the reference:
//
//   isNearStop(p, f)    |p - stop|   <= f * initial_risk
//   isNearTarget(p, f)  |p - target| <= f * initial_reward
//
// Unrealized P&L is in price points times quantity; the caller applies the
// instrument point value.
//
// Thread model:
//   Not synchronised. PositionManager owns the tracker and serialises every
//   access under its state lock.
// -----------------------------------------------------------------------------
class PositionTracker {
 public:
  PositionTracker() = default;

  // Overwrites every field at once. quantity must be >= 1 for a real
  // position; the sign is ignored.
  void updatePosition(double entry_price, double stop_price,
                      double target_price, bool is_long, int quantity = 1);

  void updateEntryPrice(double price);
  void updateStopPrice(double price);
  void updateTargetPrice(double price);
  void updateQuantity(int quantity);

  void reset();

  double calculateUnrealizedPnL(double current_price, int quantity) const;

  bool isNearStop(double current_price, double fraction) const;
  bool isNearTarget(double current_price, double fraction) const;

  // Live distances from entry, in points. Zero while flat.
  double getStopDistance() const;
  double getTargetDistance() const;
  double getRiskPerUnit(double point_value) const;
  double getRewardPerUnit(double point_value) const;
  double getRiskRewardRatio() const;

  double getInitialRisk() const { return initial_risk_; }
  double getInitialReward() const { return initial_reward_; }

  domain::Direction getDirection() const { return direction_; }
  double getEntryPrice() const { return entry_price_; }
  double getStopPrice() const { return stop_price_; }
  double getTargetPrice() const { return target_price_; }
  int getQuantity() const { return quantity_; }

  bool hasPosition() const { return direction_ != domain::Direction::Flat; }
  bool isLong() const { return direction_ == domain::Direction::Long; }
  bool isShort() const { return direction_ == domain::Direction::Short; }

  domain::Position snapshot() const;

  // One-line description for logs, e.g. "LONG 2 @ 4500 stop=4490 target=4520".
  std::string describe() const;

 private:
  domain::Direction direction_{domain::Direction::Flat};
  double entry_price_{0.0};
  double stop_price_{0.0};
  double target_price_{0.0};
  int quantity_{0};
  double initial_risk_{0.0};
  double initial_reward_{0.0};
};

}  // namespace bracket
