#include "bracket/position/position_tracker.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace bracket {

void PositionTracker::updatePosition(double entry_price, double stop_price,
                                     double target_price, bool is_long,
                                     int quantity) {
  direction_ = is_long ? domain::Direction::Long : domain::Direction::Short;
  entry_price_ = entry_price;
  stop_price_ = stop_price;
  target_price_ = target_price;
  quantity_ = std::abs(quantity);
  initial_risk_ = std::fabs(entry_price - stop_price);
  initial_reward_ = std::fabs(target_price - entry_price);
}

void PositionTracker::updateEntryPrice(double price) {
  if (hasPosition()) {
    entry_price_ = price;
  }
}

void PositionTracker::updateStopPrice(double price) {
  if (hasPosition()) {
    stop_price_ = price;
  }
}

void PositionTracker::updateTargetPrice(double price) {
  if (hasPosition()) {
    target_price_ = price;
  }
}

void PositionTracker::updateQuantity(int quantity) {
  if (hasPosition()) {
    quantity_ = std::abs(quantity);
  }
}

void PositionTracker::reset() {
  direction_ = domain::Direction::Flat;
  entry_price_ = 0.0;
  stop_price_ = 0.0;
  target_price_ = 0.0;
  quantity_ = 0;
  initial_risk_ = 0.0;
  initial_reward_ = 0.0;
}

// -----------------------------------------------------------------------------
// calculateUnrealizedPnL: points * |quantity|, sign flipped for shorts
// -----------------------------------------------------------------------------
double PositionTracker::calculateUnrealizedPnL(double current_price,
                                               int quantity) const {
  if (!hasPosition()) {
    return 0.0;
  }
  const double per_unit = isLong() ? current_price - entry_price_
                                   : entry_price_ - current_price;
  return per_unit * std::abs(quantity);
}

bool PositionTracker::isNearStop(double current_price, double fraction) const {
  if (!hasPosition() || fraction <= 0.0 || initial_risk_ <= 0.0) {
    return false;
  }
  return std::fabs(current_price - stop_price_) <= fraction * initial_risk_;
}

bool PositionTracker::isNearTarget(double current_price,
                                   double fraction) const {
  if (!hasPosition() || fraction <= 0.0 || initial_reward_ <= 0.0) {
    return false;
  }
  return std::fabs(current_price - target_price_) <=
         fraction * initial_reward_;
}

double PositionTracker::getStopDistance() const {
  return hasPosition() ? std::fabs(entry_price_ - stop_price_) : 0.0;
}

double PositionTracker::getTargetDistance() const {
  return hasPosition() ? std::fabs(target_price_ - entry_price_) : 0.0;
}

double PositionTracker::getRiskPerUnit(double point_value) const {
  return getStopDistance() * point_value;
}

double PositionTracker::getRewardPerUnit(double point_value) const {
  return getTargetDistance() * point_value;
}

double PositionTracker::getRiskRewardRatio() const {
  const double risk = getStopDistance();
  return risk > 0.0 ? getTargetDistance() / risk : 0.0;
}

domain::Position PositionTracker::snapshot() const {
  domain::Position pos;
  pos.direction = direction_;
  pos.entry_price = entry_price_;
  pos.stop_price = stop_price_;
  pos.target_price = target_price_;
  pos.quantity = quantity_;
  return pos;
}

std::string PositionTracker::describe() const {
  std::ostringstream os;
  if (!hasPosition()) {
    os << "FLAT";
    return os.str();
  }
  os << domain::toString(direction_) << ' ' << quantity_ << " @ "
     << entry_price_ << " stop=" << stop_price_ << " target=" << target_price_;
  return os.str();
}

}  // namespace bracket
