#pragma once

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace bracket {

// -----------------------------------------------------------------------------
// OrderIdGenerator: thread-safe client order id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique client order ids of the form "<prefix>-<seq>",
//         e.g. "BRK-000017", from an atomic counter.
//
// @details
// The sequence starts at 1 and is zero-padded to six digits so ids sort
// lexically in logs for the first million orders; wider values are printed
// in full. Different prefixes keep ids of two generators (for example two
// engine instances sharing one paper gateway) disjoint.
//
// Thread model:
//   next_id() is safe to call concurrently. PositionManager calls it while
//   holding its state lock; SignalTrader never does.
//
// Ownership:
//   Owned by main() (or the test fixture) and injected by reference into
//   PositionManager. Outlives every component holding the reference.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::string prefix = "BRK")
      : prefix_(std::move(prefix)) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::string next_id() {
    const std::uint64_t seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream os;
    os << prefix_ << '-' << std::setw(6) << std::setfill('0') << seq;
    return os.str();
  }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_seq_{1};
};

}  // namespace bracket
