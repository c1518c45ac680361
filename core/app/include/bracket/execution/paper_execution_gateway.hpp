#pragma once

#include "bracket/concurrent/thread_safe_queue.hpp"
#include "bracket/execution/i_execution_gateway.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace bracket {

// -----------------------------------------------------------------------------
// PaperExecutionGateway: in-memory simulated venue
// -----------------------------------------------------------------------------
//
// @brief  Accepts orders, keeps them working, and fills them either
//         immediately (market orders) or when a simulated price crosses
//         their trigger (stop and limit orders).
//
// @details
// Fill model (no slippage, no partial fills):
//   Market           filled at submission, at the order's reference price
//   Stop  Sell       price <= stop   → filled at the tick price
//   Stop  Buy        price >= stop   → filled at the tick price
//   Limit Sell       price >= limit  → filled at the limit
//   Limit Buy        price <= limit  → filled at the limit
//
// When constructed with oco_enabled, a fill cancels every other working
// order sharing the same non-empty oco_group and supportsOco() reports true.
//
// Fault injection for tests and dry runs:
//   rejectNextSubmissions(n)  the next n submit() calls are rejected
//   setRejectModifies(bool)   modify() returns false while set
//   setRejectCancels(bool)    cancel() returns false while set
//
// Thread model:
//   submit/cancel/modify/onPrice/triggerFill may be called from any thread;
//   order state is guarded by mutex_. Fills are pushed onto fill_queue_ and
//   delivered FIFO from a single callback thread started by start(). The
//   handler is never invoked while mutex_ is held and never from inside
//   submit/cancel/modify.
//
// Ownership:
//   Owned by main() or a test fixture. stop() (also run by the destructor)
//   closes the queue, delivers what is left and joins the callback thread.
// -----------------------------------------------------------------------------
class PaperExecutionGateway final : public IExecutionGateway {
 public:
  enum class PaperOrderState {
    Working,
    Filled,
    Cancelled,
  };

  struct PaperOrder {
    domain::OrderSpec spec;
    domain::OrderHandle handle{domain::kInvalidHandle};
    PaperOrderState state{PaperOrderState::Working};
    double fill_price{0.0};
  };

  explicit PaperExecutionGateway(bool oco_enabled = false,
                                 bool fill_market_orders = true);
  ~PaperExecutionGateway() override;

  PaperExecutionGateway(const PaperExecutionGateway&) = delete;
  PaperExecutionGateway& operator=(const PaperExecutionGateway&) = delete;
  PaperExecutionGateway(PaperExecutionGateway&&) = delete;
  PaperExecutionGateway& operator=(PaperExecutionGateway&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // @brief  Spawn / join the fill callback thread.
  //
  // @details
  // Fills produced before start() stay queued and are delivered once the
  // thread runs. stop() is idempotent; the gateway cannot be restarted
  // after stop() because the fill queue is closed for good.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  // IExecutionGateway
  SubmissionResult submit(const domain::OrderSpec& spec) override;
  bool cancel(domain::OrderHandle handle) override;
  bool modify(domain::OrderHandle handle, double new_price) override;
  bool supportsOco() const override { return oco_enabled_; }
  void setFillHandler(FillHandler handler) override;

  // -------------------------------------------------------------------------
  // onPrice(price)
  // -------------------------------------------------------------------------
  // @brief  Feeds one simulated trade price and fills every working stop or
  //         limit order it crosses, in submission order.
  //
  // @return Number of orders filled by this tick.
  // -------------------------------------------------------------------------
  std::size_t onPrice(double price);

  // Forces a fill of a working order at the given price. Returns false if
  // the id is unknown or the order is no longer working.
  bool triggerFill(const domain::OrderId& id, double fill_price);

  void rejectNextSubmissions(int count);
  void setRejectModifies(bool reject);
  void setRejectCancels(bool reject);

  // -------------------------------------------------------------------------
  // waitUntilIdle(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until every fill queued so far has been handed to the
  //         handler and the handler has returned.
  //
  // @return false if the timeout expired first.
  // -------------------------------------------------------------------------
  bool waitUntilIdle(std::chrono::milliseconds timeout);

  std::vector<PaperOrder> workingOrders() const;
  std::optional<PaperOrder> findOrder(const domain::OrderId& id) const;

  std::size_t submitCount() const { return submit_calls_.load(); }
  std::size_t cancelCount() const { return cancel_calls_.load(); }
  std::size_t modifyCount() const { return modify_calls_.load(); }

 private:
  void deliverLoop();
  void fillLocked(PaperOrder& order, double price);
  void cancelOcoSiblingsLocked(const PaperOrder& filled);
  bool crosses(const PaperOrder& order, double price) const;

  const bool oco_enabled_;
  const bool fill_market_orders_;

  mutable std::mutex mutex_;
  // Keyed by handle. Handles increase monotonically, so iteration order is
  // submission order.
  std::map<domain::OrderHandle, PaperOrder> orders_;
  domain::OrderHandle next_handle_{1};
  int reject_submissions_{0};
  bool reject_modifies_{false};
  bool reject_cancels_{false};

  std::mutex handler_mutex_;
  FillHandler fill_handler_;

  ThreadSafeQueue<FillDetails> fill_queue_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t pending_fills_{0};

  std::atomic<std::size_t> submit_calls_{0};
  std::atomic<std::size_t> cancel_calls_{0};
  std::atomic<std::size_t> modify_calls_{0};

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace bracket
