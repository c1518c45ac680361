#pragma once

#include <chrono>
#include <cstdint>

namespace bracket {

// Wall-clock timestamp carried on fills, signals and telemetry.
using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

inline Timestamp now() { return std::chrono::system_clock::now(); }

}  // namespace bracket
