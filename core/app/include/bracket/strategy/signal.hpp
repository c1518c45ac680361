#pragma once

#include "bracket/time/time_utils.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace bracket {

// -----------------------------------------------------------------------------
// SignalDirection
// -----------------------------------------------------------------------------
// Closed set of directional calls. The signal source is edge-triggered: it
// emits only when its direction changes, never "flat".
// -----------------------------------------------------------------------------
enum class SignalDirection {
  Long,
  Short,
};

inline const char* toString(SignalDirection d) {
  return d == SignalDirection::Long ? "LONG" : "SHORT";
}

// -----------------------------------------------------------------------------
// DirectionalSignal
// -----------------------------------------------------------------------------
// A direction change at `price`. `volatility` is the source's current
// volatility estimate in price points and drives stop placement.
// -----------------------------------------------------------------------------
struct DirectionalSignal {
  std::string symbol;
  SignalDirection direction{SignalDirection::Long};
  double price{0.0};
  double volatility{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PriceBar
// -----------------------------------------------------------------------------
// Periodic price update between signals. Used for trailing stops and as the
// reference price of flattening orders.
// -----------------------------------------------------------------------------
struct PriceBar {
  std::string symbol;
  double price{0.0};
  double volatility{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

using SignalMessage = std::variant<DirectionalSignal, PriceBar>;

}  // namespace bracket
