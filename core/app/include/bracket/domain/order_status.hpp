#pragma once

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: local bookkeeping state of a tracked order
// -----------------------------------------------------------------------------
//
// @brief  The three states an order can occupy inside an OrderBundle.
//
// @details
// The execution gateway remains the source of truth for the venue-side
// lifecycle (pending, partially filled, rejected and so on). The bundle only
// needs to know whether an order still protects the position:
//
//   Active ───> Filled
//     │
//     └──────> Cancelled
//
// Filled and Cancelled are terminal. Modify requests against a terminal
// order are refused before the gateway is contacted.
//
// Thread model:
//   Plain enum, a value type. Thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Active,     // Working at the gateway, may still be modified or cancelled
  Filled,     // Executed, terminal
  Cancelled,  // Cancel requested and accepted, terminal
};

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Active:    return "Active";
    case OrderStatus::Filled:    return "Filled";
    case OrderStatus::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace bracket
