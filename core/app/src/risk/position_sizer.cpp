#include "bracket/risk/position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace bracket {

namespace {

void requireFinite(double value, const char* name) {
  if (!std::isfinite(value)) {
    std::ostringstream os;
    os << "PositionSizer: " << name << " must be finite";
    throw std::invalid_argument(os.str());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// PositionPlan price helpers
// -----------------------------------------------------------------------------
double PositionPlan::stopPriceFor(domain::Direction direction,
                                  double entry_price) const {
  return direction == domain::Direction::Short
             ? entry_price + stop_distance_points_
             : entry_price - stop_distance_points_;
}

double PositionPlan::targetPriceFor(domain::Direction direction,
                                    double entry_price,
                                    double target_multiplier) const {
  const double distance = targetDistance(target_multiplier);
  return direction == domain::Direction::Short ? entry_price - distance
                                               : entry_price + distance;
}

// -----------------------------------------------------------------------------
// Constructor: reject instruments that cannot be sized
// -----------------------------------------------------------------------------
PositionSizer::PositionSizer(const domain::InstrumentSpec& instrument)
    : instrument_(instrument) {
  if (!std::isfinite(instrument_.point_value) ||
      instrument_.point_value <= 0.0) {
    std::ostringstream os;
    os << "PositionSizer: point value must be positive for "
       << instrument_.symbol << " (got " << instrument_.point_value << ")";
    throw std::invalid_argument(os.str());
  }
  if (instrument_.quantity_step < 1) {
    throw std::invalid_argument("PositionSizer: quantity step must be >= 1");
  }
}

// -----------------------------------------------------------------------------
// calculatePosition: fixed stop distance
// -----------------------------------------------------------------------------
PositionPlan PositionSizer::calculatePosition(int base_qty, int multiplier,
                                              double max_risk_dollars,
                                              double stop_distance_points,
                                              double point_value,
                                              int quantity_step) {
  requireFinite(max_risk_dollars, "max risk");
  requireFinite(stop_distance_points, "stop distance");
  requireFinite(point_value, "point value");

  const double unit_risk = stop_distance_points * point_value;
  if (unit_risk <= 0.0) {
    std::ostringstream os;
    os << "PositionSizer: risk per contract must be positive (stop distance "
       << stop_distance_points << " * point value " << point_value << ")";
    throw std::invalid_argument(os.str());
  }

  const int step = std::max(quantity_step, 1);
  // Widen before multiplying; configured factors are not range-limited.
  const long long wide_request = static_cast<long long>(std::max(base_qty, 0)) *
                                 static_cast<long long>(std::max(multiplier, 0));
  const int requested = static_cast<int>(std::min<long long>(
      wide_request, std::numeric_limits<int>::max()));

  int capped = requested;
  if (max_risk_dollars > 0.0) {
    const double by_risk = std::floor(max_risk_dollars / unit_risk);
    // Saturate before narrowing; a tiny stop can yield an enormous cap.
    const double limit = static_cast<double>(std::numeric_limits<int>::max());
    capped = std::min(requested, static_cast<int>(std::min(by_risk, limit)));
  }

  int final_qty = (capped / step) * step;
  final_qty = std::max(final_qty, step);

  return PositionPlan(final_qty, requested, stop_distance_points, point_value,
                      max_risk_dollars);
}

PositionPlan PositionSizer::calculatePosition(
    int base_qty, int multiplier, double max_risk_dollars,
    double stop_distance_points) const {
  return calculatePosition(base_qty, multiplier, max_risk_dollars,
                           stop_distance_points, instrument_.point_value,
                           instrument_.quantity_step);
}

// -----------------------------------------------------------------------------
// calculatePositionWithWatr: volatility-derived stop distance
// -----------------------------------------------------------------------------
double PositionSizer::clampStopDistance(double volatility,
                                        double stop_multiplier,
                                        double min_stop_points,
                                        double max_stop_points) {
  requireFinite(volatility, "volatility");
  requireFinite(stop_multiplier, "stop multiplier");
  if (min_stop_points > max_stop_points) {
    std::ostringstream os;
    os << "PositionSizer: min stop " << min_stop_points
       << " exceeds max stop " << max_stop_points;
    throw std::invalid_argument(os.str());
  }
  return std::clamp(volatility * stop_multiplier, min_stop_points,
                    max_stop_points);
}

PositionPlan PositionSizer::calculatePositionWithWatr(
    int base_qty, int multiplier, double max_risk_dollars, double volatility,
    double stop_multiplier, double min_stop_points, double max_stop_points,
    double point_value, int quantity_step) {
  const double stop_distance = clampStopDistance(
      volatility, stop_multiplier, min_stop_points, max_stop_points);
  return calculatePosition(base_qty, multiplier, max_risk_dollars,
                           stop_distance, point_value, quantity_step);
}

PositionPlan PositionSizer::calculatePositionWithWatr(
    int base_qty, int multiplier, double max_risk_dollars, double volatility,
    double stop_multiplier, double min_stop_points,
    double max_stop_points) const {
  return calculatePositionWithWatr(base_qty, multiplier, max_risk_dollars,
                                   volatility, stop_multiplier,
                                   min_stop_points, max_stop_points,
                                   instrument_.point_value,
                                   instrument_.quantity_step);
}

PositionPlan PositionSizer::planFromVolatility(const domain::RiskConfig& risk,
                                               double volatility) const {
  return calculatePositionWithWatr(risk.position_size_factor, risk.trade_lots,
                                   risk.max_risk_per_trade, volatility,
                                   risk.stop_multiplier, risk.min_stop_points,
                                   risk.max_stop_points);
}

}  // namespace bracket
