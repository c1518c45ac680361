#pragma once

#include "bracket/concurrent/order_id_generator.hpp"
#include "bracket/domain/order.hpp"
#include "bracket/domain/position.hpp"
#include "bracket/domain/position_info.hpp"
#include "bracket/domain/risk_config.hpp"
#include "bracket/execution/i_execution_gateway.hpp"
#include "bracket/position/order_bundle.hpp"
#include "bracket/position/position_tracker.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bracket {

// One protective leg of a scaled entry. quantity <= 0 means "the whole
// position".
struct BracketLeg {
  double price{0.0};
  int quantity{0};
};

// -----------------------------------------------------------------------------
// PositionManager: lifecycle orchestrator for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Enters positions with bracket protection, modifies and trails
//         them, reverses and exits them, and applies fills reported by the
//         execution gateway. Owns the PositionTracker and OrderBundle.
//
// @details
// State machine:
//
//          enterLong                      exitPosition / protective fill
//   FLAT ─────────────> LONG ──────────────────────────────────────> FLAT
//     │                  │  ▲
//     │ enterShort       │  │ reversePosition
//     ▼                  ▼  │
//   SHORT <──────────────────┘
//
// Entries are all-or-nothing. The entry, stop and target orders are
// submitted in that order; if any submission is rejected, every leg already
// accepted gets a best-effort cancel, nothing is registered locally and
// std::nullopt is returned. Rejections are not retried.
//
// Reversal is a two-step saga executed under one lock: exit, then enter the
// opposite direction. If the exit is rejected nothing changes; if the new
// entry is rejected the manager is left FLAT and reports so.
//
// A fill on a stop or target closes the position. On gateways without native
// OCO the remaining protective orders are cancelled here; the tracker is
// reset and the bundle cleared.
//
// Thread model:
//   Called from the signal thread (strategy), the gateway's fill callback
//   thread and the IPC command thread. A single std::mutex guards tracker,
//   bundle and the primary-leg tags together; every public method takes it
//   for its whole read-modify-write, including the reversal saga. Gateway
//   calls are made while the lock is held; they never block on fills.
//   The position listener is invoked after the lock is released.
//
// Ownership:
//   Holds references to the gateway and the id generator; both must outlive
//   the manager.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  using PositionListener = std::function<void(const domain::Position&)>;

  PositionManager(IExecutionGateway& gateway, OrderIdGenerator& id_gen,
                  const domain::InstrumentSpec& instrument);

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;
  PositionManager(PositionManager&&) = delete;
  PositionManager& operator=(PositionManager&&) = delete;

  // -------------------------------------------------------------------------
  // enterLong / enterShort
  // -------------------------------------------------------------------------
  // @brief  Market entry plus one stop and one limit target, each for the
  //         full quantity, tagged "entry", "stop" and "target".
  //
  // @return PositionInfo on success. std::nullopt if a position is already
  //         open, the bracket is malformed (stop or target on the wrong
  //         side of entry, quantity < 1), or any leg is rejected.
  //
  // Side-effects: Up to three gateway submissions; on success the tracker
  //               and bundle reflect the new position.
  // -------------------------------------------------------------------------
  std::optional<domain::PositionInfo> enterLong(double entry_price,
                                                double stop_price,
                                                double target_price,
                                                int quantity);
  std::optional<domain::PositionInfo> enterShort(double entry_price,
                                                 double stop_price,
                                                 double target_price,
                                                 int quantity);

  // -------------------------------------------------------------------------
  // enterWithMultipleOrders
  // -------------------------------------------------------------------------
  // @brief  Scaled entry: one entry order plus N stops tagged stop1..stopN
  //         and M targets tagged target1..targetM. At least one stop is
  //         required. The first stop and target are the primary legs.
  //
  // @details Same all-or-nothing rule as enterLong().
  // -------------------------------------------------------------------------
  std::optional<domain::PositionInfo> enterWithMultipleOrders(
      domain::Direction direction, double entry_price,
      const std::vector<BracketLeg>& stops,
      const std::vector<BracketLeg>& targets, int total_quantity);

  // Reprice the primary stop / target. false while flat, when no such leg
  // is tracked, or when the gateway refuses.
  bool modifyStopPrice(double new_stop);
  bool modifyTargetPrice(double new_target);

  // Both legs are attempted. true only if both succeed; a leg that did move
  // is not moved back.
  bool modifyBracket(double new_stop, double new_target);

  // Moves every active stop to one price. Returns the accepted count; the
  // reported stop price follows the primary leg only.
  int modifyAllStops(double new_stop);

  // -------------------------------------------------------------------------
  // trailStop(new_stop)
  // -------------------------------------------------------------------------
  // @brief  Monotonic stop update. Long requires new_stop >= current stop,
  //         Short requires new_stop <= current stop.
  //
  // @details The check runs before the gateway is contacted; a loosening
  //          request returns false and changes nothing.
  // -------------------------------------------------------------------------
  bool trailStop(double new_stop);

  // Tightens every active stop by `points` in the trade's favour. Returns
  // the accepted count; `points` <= 0 is refused.
  int trailAllStops(double points);

  domain::ReversalResult reversePosition(double entry_price, double stop_price,
                                         double target_price, int quantity);

  // -------------------------------------------------------------------------
  // exitPosition()
  // -------------------------------------------------------------------------
  // @brief  Flattens with a market order for the tracked quantity, cancels
  //         the protective orders, clears the bundle and resets the tracker.
  //
  // @return false while flat or if the flattening order is rejected; in
  //         both cases state is untouched.
  // -------------------------------------------------------------------------
  bool exitPosition();

  bool cancelOrderById(const domain::OrderId& id);
  int cancelAllOrders();

  // -------------------------------------------------------------------------
  // onOrderFilled(id) / onFill(details)
  // -------------------------------------------------------------------------
  // @brief  Applies an execution report. Install onFill() as the gateway's
  //         fill handler.
  //
  // @details
  //   Entry fill       marked Filled; the fill price (if any) becomes the
  //                    tracked entry price
  //   Stop/Target fill position closed: siblings cancelled unless the
  //                    gateway has native OCO, tracker reset, bundle cleared
  //   Unknown id       logged and ignored (flattening orders, stale fills)
  //
  // Thread model: Gateway callback thread. Takes the state lock.
  // -------------------------------------------------------------------------
  void onOrderFilled(const domain::OrderId& id);
  void onFill(const FillDetails& fill);

  // Last traded price, used as the reference price of flattening orders
  // and for exit P&L logging.
  void updateMarkPrice(double price);

  bool hasPosition() const;
  bool isLong() const;
  bool isShort() const;
  domain::Position getCurrentPosition() const;
  std::vector<domain::TrackedOrder> getTrackedOrders() const;
  std::size_t getActiveOrderCount() const;
  std::optional<domain::TrackedOrder> getOrderByTag(const std::string& tag) const;

  // Money P&L at `current_price`, point value applied.
  double getUnrealizedPnL(double current_price) const;
  bool isNearStop(double current_price, double fraction) const;
  bool isNearTarget(double current_price, double fraction) const;

  // Tracker line followed by the bundle report.
  std::string getOrderStatus() const;

  // Flattening orders submitted but not yet reported filled.
  std::size_t getPendingExitCount() const;

  // At most this many unfilled flattening ids are remembered; older ones are
  // forgotten and a late fill for them is logged as untracked.
  static constexpr std::size_t kMaxPendingExits = 32;

  void setPositionListener(PositionListener listener);

  const domain::InstrumentSpec& instrument() const { return instrument_; }

 private:
  struct SubmittedLeg {
    domain::OrderSpec spec;
    domain::OrderHandle handle{domain::kInvalidHandle};
    domain::OrderRole role{domain::OrderRole::Entry};
    std::string tag;
  };

  std::optional<domain::PositionInfo> enterLocked(
      domain::Direction direction, double entry_price,
      const std::vector<BracketLeg>& stops,
      const std::vector<BracketLeg>& targets, int total_quantity,
      bool scaled);
  bool exitLocked(double reference_price);
  bool applyFillLocked(const domain::OrderId& id,
                       std::optional<double> fill_price);
  bool modifyStopLocked(double new_stop);
  bool modifyTargetLocked(double new_target);
  void rollbackLegs(const std::vector<SubmittedLeg>& accepted);
  void rememberExitLocked(const domain::OrderId& id);
  bool forgetExitLocked(const domain::OrderId& id);

  static bool bracketIsValid(domain::Direction direction, double entry_price,
                             const std::vector<BracketLeg>& stops,
                             const std::vector<BracketLeg>& targets,
                             int total_quantity);

  domain::Position snapshotLocked() const;
  void notify(const domain::Position& position);

  IExecutionGateway& gateway_;
  OrderIdGenerator& id_gen_;
  const domain::InstrumentSpec instrument_;

  mutable std::mutex mutex_;
  PositionTracker tracker_;
  OrderBundle bundle_;
  std::string primary_stop_tag_;
  std::string primary_target_tag_;
  std::deque<domain::OrderId> exit_orders_;
  double mark_price_{0.0};

  std::mutex listener_mutex_;
  PositionListener listener_;
};

}  // namespace bracket
