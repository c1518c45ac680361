#include "bracket/position/order_bundle.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace bracket {

using domain::OrderRole;
using domain::OrderStatus;
using domain::TrackedOrder;

OrderBundle::OrderBundle(IExecutionGateway& gateway) : gateway_(gateway) {}

// -----------------------------------------------------------------------------
// add*Order: register under the role map and the tag index
// -----------------------------------------------------------------------------
void OrderBundle::addEntryOrder(const domain::OrderId& id,
                                domain::OrderHandle handle,
                                const std::string& tag, double price,
                                int quantity) {
  addOrder(OrderRole::Entry, id, handle, tag, price, quantity);
}

void OrderBundle::addStopOrder(const domain::OrderId& id,
                               domain::OrderHandle handle,
                               const std::string& tag, double price,
                               int quantity) {
  addOrder(OrderRole::Stop, id, handle, tag, price, quantity);
}

void OrderBundle::addTargetOrder(const domain::OrderId& id,
                                 domain::OrderHandle handle,
                                 const std::string& tag, double price,
                                 int quantity) {
  addOrder(OrderRole::Target, id, handle, tag, price, quantity);
}

void OrderBundle::addOrder(OrderRole role, const domain::OrderId& id,
                           domain::OrderHandle handle, const std::string& tag,
                           double price, int quantity) {
  if (getOrderById(id) != nullptr) {
    std::cerr << "[OrderBundle] WARNING: order " << id
              << " already tracked, replacing it.\n";
    removeOrder(id);
  }

  TrackedOrder order;
  order.id = id;
  order.role = role;
  order.tag = tag;
  order.handle = handle;
  order.status = OrderStatus::Active;
  order.price = price;
  order.quantity = quantity;
  order.sequence = next_sequence_++;

  mapFor(role)[id] = order;

  if (!tag.empty()) {
    auto& ids = tag_index_[tag];
    if (!ids.empty()) {
      std::cerr << "[OrderBundle] tag '" << tag << "' reused: " << id
                << " now shadows " << ids.back() << "\n";
    }
    ids.push_back(id);
  }
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
const TrackedOrder* OrderBundle::getOrderByTag(const std::string& tag) const {
  auto it = tag_index_.find(tag);
  if (it == tag_index_.end() || it->second.empty()) {
    return nullptr;
  }
  return getOrderById(it->second.back());
}

const TrackedOrder* OrderBundle::getOrderById(const domain::OrderId& id) const {
  for (const OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    auto it = map->find(id);
    if (it != map->end()) {
      return &it->second;
    }
  }
  return nullptr;
}

TrackedOrder* OrderBundle::findMutable(const domain::OrderId& id) {
  for (OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    auto it = map->find(id);
    if (it != map->end()) {
      return &it->second;
    }
  }
  return nullptr;
}

std::vector<TrackedOrder> OrderBundle::getActiveStopOrders() const {
  return activeSorted(stop_orders_);
}

std::vector<TrackedOrder> OrderBundle::getActiveTargetOrders() const {
  return activeSorted(target_orders_);
}

std::vector<TrackedOrder> OrderBundle::getActiveOrders() const {
  std::vector<TrackedOrder> result;
  for (const OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    for (const auto& [id, order] : *map) {
      if (order.isActive()) {
        result.push_back(order);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const TrackedOrder& a, const TrackedOrder& b) {
              return a.sequence < b.sequence;
            });
  return result;
}

std::vector<TrackedOrder> OrderBundle::getAllOrders() const {
  std::vector<TrackedOrder> result;
  result.reserve(size());
  for (const OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    for (const auto& [id, order] : *map) {
      result.push_back(order);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const TrackedOrder& a, const TrackedOrder& b) {
              return a.sequence < b.sequence;
            });
  return result;
}

std::vector<TrackedOrder> OrderBundle::activeSorted(const OrderMap& map) {
  std::vector<TrackedOrder> result;
  for (const auto& [id, order] : map) {
    if (order.isActive()) {
      result.push_back(order);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const TrackedOrder& a, const TrackedOrder& b) {
              return a.sequence < b.sequence;
            });
  return result;
}

// -----------------------------------------------------------------------------
// Modification through the gateway
// -----------------------------------------------------------------------------
bool OrderBundle::modifyStopByTag(const std::string& tag, double new_price) {
  return modifyByTag(OrderRole::Stop, tag, new_price);
}

bool OrderBundle::modifyTargetByTag(const std::string& tag, double new_price) {
  return modifyByTag(OrderRole::Target, tag, new_price);
}

bool OrderBundle::modifyByTag(OrderRole role, const std::string& tag,
                              double new_price) {
  const TrackedOrder* found = getOrderByTag(tag);
  if (found == nullptr) {
    std::cerr << "[OrderBundle] no order tagged '" << tag << "'\n";
    return false;
  }
  if (found->role != role) {
    std::cerr << "[OrderBundle] tag '" << tag << "' is a "
              << domain::toString(found->role) << " order, expected "
              << domain::toString(role) << "\n";
    return false;
  }
  return modifyTracked(*findMutable(found->id), new_price);
}

bool OrderBundle::modifyTracked(TrackedOrder& order, double new_price) {
  if (!order.isActive()) {
    std::cerr << "[OrderBundle] " << order.id << " is "
              << domain::toString(order.status) << ", modify refused\n";
    return false;
  }
  if (!gateway_.modify(order.handle, new_price)) {
    std::cerr << "[OrderBundle] gateway rejected modify of " << order.id
              << " to " << new_price << "\n";
    return false;
  }
  order.price = new_price;
  return true;
}

int OrderBundle::modifyAllStops(double new_price) {
  int modified = 0;
  for (const TrackedOrder& stop : getActiveStopOrders()) {
    if (modifyTracked(stop_orders_.at(stop.id), new_price)) {
      ++modified;
    }
  }
  return modified;
}

int OrderBundle::modifyAllStops(const std::vector<double>& new_prices) {
  const std::vector<TrackedOrder> stops = getActiveStopOrders();
  const std::size_t n = std::min(stops.size(), new_prices.size());
  int modified = 0;
  for (std::size_t i = 0; i < n; ++i) {
    if (modifyTracked(stop_orders_.at(stops[i].id), new_prices[i])) {
      ++modified;
    }
  }
  return modified;
}

// -----------------------------------------------------------------------------
// Cancellation through the gateway
// -----------------------------------------------------------------------------
bool OrderBundle::cancelOrder(const domain::OrderId& id) {
  TrackedOrder* order = findMutable(id);
  if (order == nullptr) {
    std::cerr << "[OrderBundle] cancel: unknown order " << id << "\n";
    return false;
  }
  return cancelTracked(*order);
}

bool OrderBundle::cancelTracked(TrackedOrder& order) {
  if (!order.isActive()) {
    return false;
  }
  if (!gateway_.cancel(order.handle)) {
    std::cerr << "[OrderBundle] gateway rejected cancel of " << order.id
              << "\n";
    return false;
  }
  order.status = OrderStatus::Cancelled;
  return true;
}

int OrderBundle::cancelAll() {
  int cancelled = 0;
  for (const TrackedOrder& order : getActiveOrders()) {
    if (cancelTracked(*findMutable(order.id))) {
      ++cancelled;
    }
  }
  return cancelled;
}

int OrderBundle::cancelProtectiveExcept(const domain::OrderId& keep) {
  int cancelled = 0;
  for (const TrackedOrder& order : getActiveOrders()) {
    if (order.role == OrderRole::Entry || order.id == keep) {
      continue;
    }
    if (cancelTracked(*findMutable(order.id))) {
      ++cancelled;
    }
  }
  return cancelled;
}

// -----------------------------------------------------------------------------
// Status bookkeeping
// -----------------------------------------------------------------------------
bool OrderBundle::markFilled(const domain::OrderId& id) {
  TrackedOrder* order = findMutable(id);
  if (order == nullptr) {
    return false;
  }
  order->status = OrderStatus::Filled;
  return true;
}

bool OrderBundle::markCancelled(const domain::OrderId& id) {
  TrackedOrder* order = findMutable(id);
  if (order == nullptr) {
    return false;
  }
  order->status = OrderStatus::Cancelled;
  return true;
}

bool OrderBundle::removeOrder(const domain::OrderId& id) {
  for (OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    auto it = map->find(id);
    if (it != map->end()) {
      untag(it->second);
      map->erase(it);
      return true;
    }
  }
  return false;
}

void OrderBundle::untag(const TrackedOrder& order) {
  auto it = tag_index_.find(order.tag);
  if (it == tag_index_.end()) {
    return;
  }
  auto& ids = it->second;
  ids.erase(std::remove(ids.begin(), ids.end(), order.id), ids.end());
  if (ids.empty()) {
    tag_index_.erase(it);
  }
}

void OrderBundle::clear() {
  entry_orders_.clear();
  stop_orders_.clear();
  target_orders_.clear();
  tag_index_.clear();
}

std::size_t OrderBundle::size() const {
  return entry_orders_.size() + stop_orders_.size() + target_orders_.size();
}

std::size_t OrderBundle::getActiveCount() const {
  std::size_t active = 0;
  for (const OrderMap* map : {&entry_orders_, &stop_orders_, &target_orders_}) {
    for (const auto& [id, order] : *map) {
      if (order.isActive()) {
        ++active;
      }
    }
  }
  return active;
}

std::string OrderBundle::getStatus() const {
  std::ostringstream os;
  os << "OrderBundle: " << size() << " orders (" << getActiveCount()
     << " active)\n";
  for (const TrackedOrder& order : getAllOrders()) {
    os << "  [" << domain::toString(order.role) << "] " << order.id
       << " tag=" << order.tag << " status=" << domain::toString(order.status)
       << " price=" << order.price << " qty=" << order.quantity
       << " handle=" << order.handle << "\n";
  }
  return os.str();
}

OrderBundle::OrderMap& OrderBundle::mapFor(OrderRole role) {
  switch (role) {
    case OrderRole::Entry:  return entry_orders_;
    case OrderRole::Stop:   return stop_orders_;
    case OrderRole::Target: return target_orders_;
  }
  return entry_orders_;
}

}  // namespace bracket
