#pragma once

namespace bracket {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Net direction of the managed position. Flat is the only state in which no
// orders are tracked and quantity is zero.
// -----------------------------------------------------------------------------
enum class Direction {
  Flat,
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Order side as sent to the execution gateway.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// Side that opens a position in the given direction. Flat maps to Buy; callers
// never open a Flat position.
inline Side entrySide(Direction d) {
  return d == Direction::Short ? Side::Sell : Side::Buy;
}

// Side that protects or closes a position in the given direction.
inline Side exitSide(Direction d) {
  return d == Direction::Short ? Side::Buy : Side::Sell;
}

inline Direction opposite(Direction d) {
  switch (d) {
    case Direction::Long:  return Direction::Short;
    case Direction::Short: return Direction::Long;
    case Direction::Flat:  return Direction::Flat;
  }
  return Direction::Flat;
}

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Flat:  return "FLAT";
    case Direction::Long:  return "LONG";
    case Direction::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace bracket
