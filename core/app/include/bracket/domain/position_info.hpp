#pragma once

#include "bracket/domain/direction.hpp"
#include "bracket/domain/order.hpp"

#include <optional>
#include <vector>

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// PositionInfo: result of a successful entry
// -----------------------------------------------------------------------------
//
// @brief  Immutable record of the bracket that was just placed: the ids of
//         every submitted order plus the prices and quantity it was opened
//         with.
//
// @details
// For a simple bracket `stop_order_ids` and `target_order_ids` each hold one
// id. Scaled entries (several stops/targets) list them in submission order;
// the first element is the primary leg that modifyStopPrice() and
// modifyTargetPrice() operate on.
// -----------------------------------------------------------------------------
struct PositionInfo {
  Direction direction{Direction::Flat};
  OrderId entry_order_id;
  std::vector<OrderId> stop_order_ids;
  std::vector<OrderId> target_order_ids;
  double entry_price{0.0};
  double stop_price{0.0};
  double target_price{0.0};
  int quantity{0};
};

// -----------------------------------------------------------------------------
// ReversalStatus / ReversalResult
// -----------------------------------------------------------------------------
// Outcome of the two-step reversal. Each failure mode leaves a different
// state behind, so callers must be able to tell them apart:
//
//   Reversed              old position closed, new one open (position set)
//   NoPosition            nothing to reverse, state untouched
//   InvalidRequest        new bracket malformed, refused before any order
//   ExitFailed            exit rejected, old position unchanged
//   FlatAfterFailedEntry  old position closed, new entry rejected; FLAT
// -----------------------------------------------------------------------------
enum class ReversalStatus {
  Reversed,
  NoPosition,
  InvalidRequest,
  ExitFailed,
  FlatAfterFailedEntry,
};

struct ReversalResult {
  ReversalStatus status{ReversalStatus::NoPosition};
  std::optional<PositionInfo> position;

  bool succeeded() const { return status == ReversalStatus::Reversed; }
};

inline const char* toString(ReversalStatus s) {
  switch (s) {
    case ReversalStatus::Reversed:             return "Reversed";
    case ReversalStatus::NoPosition:           return "NoPosition";
    case ReversalStatus::InvalidRequest:       return "InvalidRequest";
    case ReversalStatus::ExitFailed:           return "ExitFailed";
    case ReversalStatus::FlatAfterFailedEntry: return "FlatAfterFailedEntry";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace bracket
