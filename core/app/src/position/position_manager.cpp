#include "bracket/position/position_manager.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace bracket {

using domain::Direction;
using domain::OrderRole;
using domain::OrderType;

PositionManager::PositionManager(IExecutionGateway& gateway,
                                 OrderIdGenerator& id_gen,
                                 const domain::InstrumentSpec& instrument)
    : gateway_(gateway),
      id_gen_(id_gen),
      instrument_(instrument),
      bundle_(gateway) {}

// -----------------------------------------------------------------------------
// Entry
// -----------------------------------------------------------------------------
std::optional<domain::PositionInfo> PositionManager::enterLong(
    double entry_price, double stop_price, double target_price, int quantity) {
  std::optional<domain::PositionInfo> info;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    info = enterLocked(Direction::Long, entry_price, {{stop_price, quantity}},
                       {{target_price, quantity}}, quantity, false);
    snapshot = snapshotLocked();
  }
  if (info) {
    notify(snapshot);
  }
  return info;
}

std::optional<domain::PositionInfo> PositionManager::enterShort(
    double entry_price, double stop_price, double target_price, int quantity) {
  std::optional<domain::PositionInfo> info;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    info = enterLocked(Direction::Short, entry_price, {{stop_price, quantity}},
                       {{target_price, quantity}}, quantity, false);
    snapshot = snapshotLocked();
  }
  if (info) {
    notify(snapshot);
  }
  return info;
}

std::optional<domain::PositionInfo> PositionManager::enterWithMultipleOrders(
    Direction direction, double entry_price,
    const std::vector<BracketLeg>& stops,
    const std::vector<BracketLeg>& targets, int total_quantity) {
  std::optional<domain::PositionInfo> info;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    info = enterLocked(direction, entry_price, stops, targets, total_quantity,
                       true);
    snapshot = snapshotLocked();
  }
  if (info) {
    notify(snapshot);
  }
  return info;
}

// -----------------------------------------------------------------------------
// enterLocked: submit entry + protective legs, register only if all accepted
// -----------------------------------------------------------------------------
std::optional<domain::PositionInfo> PositionManager::enterLocked(
    Direction direction, double entry_price,
    const std::vector<BracketLeg>& stops,
    const std::vector<BracketLeg>& targets, int total_quantity, bool scaled) {
  if (tracker_.hasPosition()) {
    std::cerr << "[PositionManager] entry refused: already "
              << tracker_.describe() << "\n";
    return std::nullopt;
  }
  if (!bracketIsValid(direction, entry_price, stops, targets,
                      total_quantity)) {
    std::cerr << "[PositionManager] entry refused: malformed "
              << domain::toString(direction) << " bracket @ " << entry_price
              << " qty=" << total_quantity << "\n";
    return std::nullopt;
  }

  std::vector<SubmittedLeg> legs;
  legs.reserve(1 + stops.size() + targets.size());

  SubmittedLeg entry;
  entry.spec.client_order_id = id_gen_.next_id();
  // Protective legs of one bracket share the entry id as their OCO group.
  const std::string oco_group =
      gateway_.supportsOco() ? entry.spec.client_order_id : std::string{};
  entry.role = OrderRole::Entry;
  entry.tag = "entry";
  entry.spec.side = domain::entrySide(direction);
  entry.spec.type = OrderType::Market;
  entry.spec.quantity = total_quantity;
  entry.spec.price = entry_price;
  legs.push_back(std::move(entry));

  auto legQuantity = [total_quantity](const BracketLeg& leg) {
    return leg.quantity > 0 ? leg.quantity : total_quantity;
  };

  for (std::size_t i = 0; i < stops.size(); ++i) {
    SubmittedLeg leg;
    leg.role = OrderRole::Stop;
    leg.tag = scaled ? "stop" + std::to_string(i + 1) : "stop";
    leg.spec.side = domain::exitSide(direction);
    leg.spec.type = OrderType::Stop;
    leg.spec.quantity = legQuantity(stops[i]);
    leg.spec.price = stops[i].price;
    leg.spec.oco_group = oco_group;
    legs.push_back(std::move(leg));
  }
  for (std::size_t i = 0; i < targets.size(); ++i) {
    SubmittedLeg leg;
    leg.role = OrderRole::Target;
    leg.tag = scaled ? "target" + std::to_string(i + 1) : "target";
    leg.spec.side = domain::exitSide(direction);
    leg.spec.type = OrderType::Limit;
    leg.spec.quantity = legQuantity(targets[i]);
    leg.spec.price = targets[i].price;
    leg.spec.oco_group = oco_group;
    legs.push_back(std::move(leg));
  }

  std::vector<SubmittedLeg> accepted;
  accepted.reserve(legs.size());
  for (SubmittedLeg& leg : legs) {
    if (leg.spec.client_order_id.empty()) {
      leg.spec.client_order_id = id_gen_.next_id();
    }
    leg.spec.symbol = instrument_.symbol;

    SubmissionResult result = gateway_.submit(leg.spec);
    if (!result.accepted()) {
      std::cerr << "[PositionManager] " << domain::toString(leg.role)
                << " leg " << leg.spec.client_order_id << " rejected: "
                << result.reason << ". Abandoning "
                << domain::toString(direction) << " entry.\n";
      rollbackLegs(accepted);
      return std::nullopt;
    }
    leg.handle = *result.handle;
    accepted.push_back(leg);
  }

  // Every leg is live at the gateway: commit local state.
  domain::PositionInfo info;
  info.direction = direction;
  info.entry_price = entry_price;
  info.stop_price = stops.front().price;
  info.target_price = targets.empty() ? 0.0 : targets.front().price;
  info.quantity = total_quantity;

  for (const SubmittedLeg& leg : accepted) {
    const domain::OrderId& id = leg.spec.client_order_id;
    switch (leg.role) {
      case OrderRole::Entry:
        bundle_.addEntryOrder(id, leg.handle, leg.tag, leg.spec.price,
                              leg.spec.quantity);
        info.entry_order_id = id;
        break;
      case OrderRole::Stop:
        bundle_.addStopOrder(id, leg.handle, leg.tag, leg.spec.price,
                             leg.spec.quantity);
        info.stop_order_ids.push_back(id);
        break;
      case OrderRole::Target:
        bundle_.addTargetOrder(id, leg.handle, leg.tag, leg.spec.price,
                               leg.spec.quantity);
        info.target_order_ids.push_back(id);
        break;
    }
  }

  tracker_.updatePosition(entry_price, info.stop_price, info.target_price,
                          direction == Direction::Long, total_quantity);
  primary_stop_tag_ = scaled ? "stop1" : "stop";
  primary_target_tag_ =
      targets.empty() ? std::string{} : (scaled ? "target1" : "target");

  std::cout << "[PositionManager] entered " << tracker_.describe() << " ("
            << stops.size() << " stop, " << targets.size() << " target)\n";
  return info;
}

void PositionManager::rollbackLegs(const std::vector<SubmittedLeg>& accepted) {
  for (const SubmittedLeg& leg : accepted) {
    if (gateway_.cancel(leg.handle)) {
      continue;
    }
    if (leg.role == OrderRole::Entry) {
      std::cerr << "[PositionManager] WARNING: entry " << leg.spec.client_order_id
                << " could not be cancelled (already executed?). Venue "
                   "exposure is unprotected and untracked.\n";
    } else {
      std::cerr << "[PositionManager] WARNING: could not cancel "
                << leg.spec.client_order_id << " during rollback.\n";
    }
  }
}

bool PositionManager::bracketIsValid(Direction direction, double entry_price,
                                     const std::vector<BracketLeg>& stops,
                                     const std::vector<BracketLeg>& targets,
                                     int total_quantity) {
  if (direction == Direction::Flat || total_quantity < 1 ||
      entry_price <= 0.0 || stops.empty()) {
    return false;
  }
  const bool is_long = direction == Direction::Long;
  for (const BracketLeg& stop : stops) {
    if (stop.quantity > total_quantity || stop.price <= 0.0 ||
        (is_long ? stop.price >= entry_price : stop.price <= entry_price)) {
      return false;
    }
  }
  for (const BracketLeg& target : targets) {
    if (target.quantity > total_quantity || target.price <= 0.0 ||
        (is_long ? target.price <= entry_price : target.price >= entry_price)) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// Modification
// -----------------------------------------------------------------------------
bool PositionManager::modifyStopPrice(double new_stop) {
  bool ok = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    ok = modifyStopLocked(new_stop);
    snapshot = snapshotLocked();
  }
  if (ok) {
    notify(snapshot);
  }
  return ok;
}

bool PositionManager::modifyTargetPrice(double new_target) {
  bool ok = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    ok = modifyTargetLocked(new_target);
    snapshot = snapshotLocked();
  }
  if (ok) {
    notify(snapshot);
  }
  return ok;
}

bool PositionManager::modifyBracket(double new_stop, double new_target) {
  bool stop_ok = false;
  bool target_ok = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    stop_ok = modifyStopLocked(new_stop);
    target_ok = modifyTargetLocked(new_target);
    snapshot = snapshotLocked();
  }
  if (stop_ok || target_ok) {
    notify(snapshot);
  }
  if (stop_ok != target_ok) {
    std::cerr << "[PositionManager] bracket modify partially applied: stop="
              << (stop_ok ? "moved" : "unchanged")
              << " target=" << (target_ok ? "moved" : "unchanged") << "\n";
  }
  return stop_ok && target_ok;
}

bool PositionManager::modifyStopLocked(double new_stop) {
  if (!tracker_.hasPosition() || primary_stop_tag_.empty()) {
    std::cerr << "[PositionManager] modify stop: no position\n";
    return false;
  }
  if (!bundle_.modifyStopByTag(primary_stop_tag_, new_stop)) {
    return false;
  }
  tracker_.updateStopPrice(new_stop);
  return true;
}

bool PositionManager::modifyTargetLocked(double new_target) {
  if (!tracker_.hasPosition() || primary_target_tag_.empty()) {
    std::cerr << "[PositionManager] modify target: no position or target\n";
    return false;
  }
  if (!bundle_.modifyTargetByTag(primary_target_tag_, new_target)) {
    return false;
  }
  tracker_.updateTargetPrice(new_target);
  return true;
}

int PositionManager::modifyAllStops(double new_stop) {
  int modified = 0;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    if (!tracker_.hasPosition()) {
      return 0;
    }
    modified = bundle_.modifyAllStops(new_stop);
    // The tracker follows the primary leg, which may have been rejected
    // while other stops moved.
    if (const domain::TrackedOrder* primary =
            bundle_.getOrderByTag(primary_stop_tag_)) {
      tracker_.updateStopPrice(primary->price);
    }
    snapshot = snapshotLocked();
  }
  if (modified > 0) {
    notify(snapshot);
  }
  return modified;
}

// -----------------------------------------------------------------------------
// Trailing
// -----------------------------------------------------------------------------
bool PositionManager::trailStop(double new_stop) {
  bool ok = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    if (!tracker_.hasPosition()) {
      return false;
    }
    const double current = tracker_.getStopPrice();
    const bool tightens =
        tracker_.isLong() ? new_stop >= current : new_stop <= current;
    if (!tightens) {
      std::cerr << "[PositionManager] trail refused: " << new_stop
                << " would loosen " << domain::toString(tracker_.getDirection())
                << " stop at " << current << "\n";
      return false;
    }
    ok = modifyStopLocked(new_stop);
    snapshot = snapshotLocked();
  }
  if (ok) {
    notify(snapshot);
  }
  return ok;
}

int PositionManager::trailAllStops(double points) {
  int modified = 0;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    if (!tracker_.hasPosition() || points <= 0.0) {
      return 0;
    }
    const double step = tracker_.isLong() ? points : -points;
    std::vector<double> prices;
    for (const domain::TrackedOrder& stop : bundle_.getActiveStopOrders()) {
      prices.push_back(stop.price + step);
    }
    modified = bundle_.modifyAllStops(prices);
    if (const domain::TrackedOrder* primary =
            bundle_.getOrderByTag(primary_stop_tag_)) {
      tracker_.updateStopPrice(primary->price);
    }
    snapshot = snapshotLocked();
  }
  if (modified > 0) {
    notify(snapshot);
  }
  return modified;
}

// -----------------------------------------------------------------------------
// reversePosition: exit, then enter the opposite direction, under one lock
// -----------------------------------------------------------------------------
domain::ReversalResult PositionManager::reversePosition(double entry_price,
                                                        double stop_price,
                                                        double target_price,
                                                        int quantity) {
  domain::ReversalResult result;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    if (!tracker_.hasPosition()) {
      result.status = domain::ReversalStatus::NoPosition;
      return result;
    }

    const Direction next = domain::opposite(tracker_.getDirection());
    const std::vector<BracketLeg> stops{{stop_price, quantity}};
    const std::vector<BracketLeg> targets{{target_price, quantity}};
    if (!bracketIsValid(next, entry_price, stops, targets, quantity)) {
      std::cerr << "[PositionManager] reversal refused: malformed "
                << domain::toString(next) << " bracket\n";
      result.status = domain::ReversalStatus::InvalidRequest;
      return result;
    }

    if (!exitLocked(entry_price)) {
      result.status = domain::ReversalStatus::ExitFailed;
      return result;
    }

    result.position =
        enterLocked(next, entry_price, stops, targets, quantity, false);
    if (result.position) {
      result.status = domain::ReversalStatus::Reversed;
    } else {
      result.status = domain::ReversalStatus::FlatAfterFailedEntry;
      std::cerr << "[PositionManager] ERROR: reversal to "
                << domain::toString(next)
                << " failed after exit; position is FLAT\n";
    }
    snapshot = snapshotLocked();
  }
  notify(snapshot);
  return result;
}

// -----------------------------------------------------------------------------
// Exit
// -----------------------------------------------------------------------------
bool PositionManager::exitPosition() {
  bool ok = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    ok = exitLocked(mark_price_);
    snapshot = snapshotLocked();
  }
  if (ok) {
    notify(snapshot);
  }
  return ok;
}

bool PositionManager::exitLocked(double reference_price) {
  if (!tracker_.hasPosition()) {
    return false;
  }

  const double price =
      reference_price > 0.0 ? reference_price : tracker_.getEntryPrice();

  domain::OrderSpec flatten;
  flatten.client_order_id = id_gen_.next_id();
  flatten.symbol = instrument_.symbol;
  flatten.side = domain::exitSide(tracker_.getDirection());
  flatten.type = OrderType::Market;
  flatten.quantity = tracker_.getQuantity();
  flatten.price = price;

  SubmissionResult result = gateway_.submit(flatten);
  if (!result.accepted()) {
    std::cerr << "[PositionManager] exit rejected: " << result.reason
              << ". Still " << tracker_.describe() << "\n";
    return false;
  }
  rememberExitLocked(flatten.client_order_id);

  const int cancelled = bundle_.cancelProtectiveExcept(domain::OrderId{});
  const double pnl = tracker_.calculateUnrealizedPnL(price,
                                                     tracker_.getQuantity()) *
                     instrument_.point_value;
  std::cout << "[PositionManager] exit " << tracker_.describe() << " at ~"
            << price << " est. P&L=" << std::fixed << std::setprecision(2)
            << pnl << std::defaultfloat << " (" << cancelled
            << " protective orders cancelled)\n";

  bundle_.clear();
  tracker_.reset();
  primary_stop_tag_.clear();
  primary_target_tag_.clear();
  return true;
}

// -----------------------------------------------------------------------------
// Explicit cancellation
// -----------------------------------------------------------------------------
bool PositionManager::cancelOrderById(const domain::OrderId& id) {
  std::lock_guard lock(mutex_);
  return bundle_.cancelOrder(id);
}

int PositionManager::cancelAllOrders() {
  std::lock_guard lock(mutex_);
  const int cancelled = bundle_.cancelAll();
  std::cout << "[PositionManager] cancelled " << cancelled << " orders\n";
  return cancelled;
}

// -----------------------------------------------------------------------------
// Fills
// -----------------------------------------------------------------------------
void PositionManager::onOrderFilled(const domain::OrderId& id) {
  bool changed = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    changed = applyFillLocked(id, std::nullopt);
    snapshot = snapshotLocked();
  }
  if (changed) {
    notify(snapshot);
  }
}

void PositionManager::onFill(const FillDetails& fill) {
  bool changed = false;
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    std::optional<double> price;
    if (fill.fill_price > 0.0) {
      price = fill.fill_price;
    }
    changed = applyFillLocked(fill.order_id, price);
    snapshot = snapshotLocked();
  }
  if (changed) {
    notify(snapshot);
  }
}

bool PositionManager::applyFillLocked(const domain::OrderId& id,
                                      std::optional<double> fill_price) {
  const domain::TrackedOrder* order = bundle_.getOrderById(id);
  if (order == nullptr) {
    if (forgetExitLocked(id)) {
      std::cout << "[PositionManager] exit order " << id << " filled";
      if (fill_price) {
        std::cout << " @ " << *fill_price;
      }
      std::cout << "\n";
    } else {
      std::cerr << "[PositionManager] fill for untracked order " << id
                << " ignored\n";
    }
    return false;
  }
  if (!order->isActive()) {
    std::cerr << "[PositionManager] fill for " << id << " in state "
              << domain::toString(order->status) << " ignored\n";
    return false;
  }

  if (order->role == OrderRole::Entry) {
    bundle_.markFilled(id);
    if (fill_price) {
      tracker_.updateEntryPrice(*fill_price);
    }
    std::cout << "[PositionManager] entry " << id << " filled; "
              << tracker_.describe() << "\n";
    return true;
  }

  // Protective fill: the position is closed at the venue.
  const OrderRole role = order->role;
  bundle_.markFilled(id);
  int cancelled = 0;
  if (!gateway_.supportsOco()) {
    cancelled = bundle_.cancelProtectiveExcept(id);
  }

  const double exit_price = fill_price.value_or(
      role == OrderRole::Stop ? tracker_.getStopPrice()
                              : tracker_.getTargetPrice());
  const double pnl =
      tracker_.calculateUnrealizedPnL(exit_price, tracker_.getQuantity()) *
      instrument_.point_value;
  std::cout << "[PositionManager] " << domain::toString(role) << " " << id
            << " filled @ " << exit_price << ", closing "
            << tracker_.describe() << " P&L=" << std::fixed
            << std::setprecision(2) << pnl << std::defaultfloat << " ("
            << cancelled << " siblings cancelled)\n";

  bundle_.clear();
  tracker_.reset();
  primary_stop_tag_.clear();
  primary_target_tag_.clear();
  return true;
}

void PositionManager::rememberExitLocked(const domain::OrderId& id) {
  exit_orders_.push_back(id);
  if (exit_orders_.size() > kMaxPendingExits) {
    std::cerr << "[PositionManager] WARNING: no fill seen for exit order "
              << exit_orders_.front() << "; no longer tracking it\n";
    exit_orders_.pop_front();
  }
}

bool PositionManager::forgetExitLocked(const domain::OrderId& id) {
  auto it = std::find(exit_orders_.begin(), exit_orders_.end(), id);
  if (it == exit_orders_.end()) {
    return false;
  }
  exit_orders_.erase(it);
  return true;
}

void PositionManager::updateMarkPrice(double price) {
  std::lock_guard lock(mutex_);
  mark_price_ = price;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool PositionManager::hasPosition() const {
  std::lock_guard lock(mutex_);
  return tracker_.hasPosition();
}

bool PositionManager::isLong() const {
  std::lock_guard lock(mutex_);
  return tracker_.isLong();
}

bool PositionManager::isShort() const {
  std::lock_guard lock(mutex_);
  return tracker_.isShort();
}

domain::Position PositionManager::getCurrentPosition() const {
  std::lock_guard lock(mutex_);
  return snapshotLocked();
}

std::vector<domain::TrackedOrder> PositionManager::getTrackedOrders() const {
  std::lock_guard lock(mutex_);
  return bundle_.getAllOrders();
}

std::size_t PositionManager::getActiveOrderCount() const {
  std::lock_guard lock(mutex_);
  return bundle_.getActiveCount();
}

std::optional<domain::TrackedOrder> PositionManager::getOrderByTag(
    const std::string& tag) const {
  std::lock_guard lock(mutex_);
  if (const domain::TrackedOrder* order = bundle_.getOrderByTag(tag)) {
    return *order;
  }
  return std::nullopt;
}

double PositionManager::getUnrealizedPnL(double current_price) const {
  std::lock_guard lock(mutex_);
  return tracker_.calculateUnrealizedPnL(current_price,
                                         tracker_.getQuantity()) *
         instrument_.point_value;
}

bool PositionManager::isNearStop(double current_price, double fraction) const {
  std::lock_guard lock(mutex_);
  return tracker_.isNearStop(current_price, fraction);
}

bool PositionManager::isNearTarget(double current_price,
                                   double fraction) const {
  std::lock_guard lock(mutex_);
  return tracker_.isNearTarget(current_price, fraction);
}

std::string PositionManager::getOrderStatus() const {
  std::lock_guard lock(mutex_);
  std::ostringstream os;
  os << instrument_.symbol << ' ' << tracker_.describe() << "\n"
     << bundle_.getStatus();
  return os.str();
}

std::size_t PositionManager::getPendingExitCount() const {
  std::lock_guard lock(mutex_);
  return exit_orders_.size();
}

void PositionManager::setPositionListener(PositionListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

domain::Position PositionManager::snapshotLocked() const {
  domain::Position pos = tracker_.snapshot();
  pos.symbol = instrument_.symbol;
  return pos;
}

void PositionManager::notify(const domain::Position& position) {
  PositionListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(position);
  }
}

}  // namespace bracket
