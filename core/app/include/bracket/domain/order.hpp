#pragma once

#include "bracket/domain/direction.hpp"
#include "bracket/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId / OrderHandle
// -----------------------------------------------------------------------------
// OrderId is the locally generated client order id ("BRK-000042"). It is the
// key under which an order is tracked and the id fills are reported with.
//
// OrderHandle is the reference the execution gateway assigns on accepted
// submission. All cancel/modify calls go through the handle; the local side
// never mutates an order except through the gateway. Handle 0 is reserved as
// "not assigned".
// -----------------------------------------------------------------------------
using OrderId = std::string;
using OrderHandle = std::uint64_t;

constexpr OrderHandle kInvalidHandle = 0;

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,  // Entry and flattening orders
  Stop,    // Protective stop-loss
  Limit,   // Profit target
};

// -----------------------------------------------------------------------------
// OrderRole
// -----------------------------------------------------------------------------
// Closed set of roles an order plays inside a bracket. Tags are free-form
// labels for lookup; the role is what drives behaviour.
// -----------------------------------------------------------------------------
enum class OrderRole {
  Entry,
  Stop,
  Target,
};

// -----------------------------------------------------------------------------
// OrderSpec
// -----------------------------------------------------------------------------
// Everything the gateway needs to place one order. `price` is the stop
// trigger for Stop, the limit for Limit, and the reference (expected) price
// for Market orders. `oco_group` links protective orders that must cancel
// each other on gateways with native OCO support; empty means no group.
// -----------------------------------------------------------------------------
struct OrderSpec {
  OrderId client_order_id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  int quantity{0};
  double price{0.0};
  std::string oco_group;
};

// -----------------------------------------------------------------------------
// TrackedOrder
// -----------------------------------------------------------------------------
// One live order backing the current position, as recorded by OrderBundle.
// `price` is the last price confirmed by the gateway (submit or modify).
// `sequence` is the insertion order inside the bundle and keeps bulk
// operations deterministic.
// -----------------------------------------------------------------------------
struct TrackedOrder {
  OrderId id;
  OrderRole role{OrderRole::Entry};
  std::string tag;
  OrderHandle handle{kInvalidHandle};
  OrderStatus status{OrderStatus::Active};
  double price{0.0};
  int quantity{0};
  std::uint64_t sequence{0};

  bool isActive() const { return status == OrderStatus::Active; }
};

inline const char* toString(OrderRole r) {
  switch (r) {
    case OrderRole::Entry:  return "Entry";
    case OrderRole::Stop:   return "Stop";
    case OrderRole::Target: return "Target";
  }
  return "Unknown";
}

inline const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Market: return "Market";
    case OrderType::Stop:   return "Stop";
    case OrderType::Limit:  return "Limit";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace bracket
