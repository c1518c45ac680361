#pragma once

#include "bracket/domain/direction.hpp"

#include <string>

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// Position: snapshot of the managed position
// -----------------------------------------------------------------------------
//
// @brief  Value copy of the PositionTracker state, handed out to callers and
//         to telemetry.
//
// @details
// While Flat, quantity is 0 and every price field holds the 0.0 sentinel.
// A snapshot is detached from the tracker the moment it is returned; it is
// safe to read from any thread.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  Direction direction{Direction::Flat};
  double entry_price{0.0};
  double stop_price{0.0};
  double target_price{0.0};
  int quantity{0};

  bool isFlat() const { return direction == Direction::Flat; }
};

}  // namespace domain
}  // namespace bracket
