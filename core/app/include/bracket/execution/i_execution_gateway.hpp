#pragma once

#include "bracket/domain/order.hpp"
#include "bracket/time/time_utils.hpp"

#include <functional>
#include <optional>
#include <string>

namespace bracket {

// -----------------------------------------------------------------------------
// SubmissionResult
// -----------------------------------------------------------------------------
// Either an accepted submission carrying the gateway handle, or a rejection
// carrying the venue's reason.
// -----------------------------------------------------------------------------
struct SubmissionResult {
  std::optional<domain::OrderHandle> handle;
  std::string reason;

  bool accepted() const { return handle.has_value(); }

  static SubmissionResult accept(domain::OrderHandle h) {
    return SubmissionResult{h, {}};
  }
  static SubmissionResult reject(std::string why) {
    return SubmissionResult{std::nullopt, std::move(why)};
  }
};

// -----------------------------------------------------------------------------
// FillDetails
// -----------------------------------------------------------------------------
// One execution reported by the gateway. `order_id` is the client order id
// the order was submitted with.
// -----------------------------------------------------------------------------
struct FillDetails {
  domain::OrderId order_id;
  domain::OrderHandle handle{domain::kInvalidHandle};
  double fill_price{0.0};
  int filled_quantity{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// IExecutionGateway: abstract order-routing interface
// -----------------------------------------------------------------------------
//
// @brief  The only way PositionManager and OrderBundle touch the venue.
//
// @details
// submit(), cancel() and modify() are fire-and-forget: they return as soon as
// the request is accepted or rejected locally and never wait on a fill.
// Execution reports arrive later through the handler installed with
// setFillHandler(), on a thread owned by the gateway.
//
// Contract for implementations:
//   - The fill handler must never be invoked from inside submit(), cancel()
//     or modify(). PositionManager holds its state lock across those calls
//     and re-enters that lock from the handler.
//   - Fills for the same order are delivered in the order they occurred.
//   - supportsOco() reports whether protective orders sharing an
//     OrderSpec::oco_group are cancelled by the venue when one of them
//     fills.
//
// Implementations:
//   PaperExecutionGateway  : in-memory simulated venue (backtests, tests)
//   A live broker adapter plugs in here without touching orchestration code.
// -----------------------------------------------------------------------------
class IExecutionGateway {
 public:
  using FillHandler = std::function<void(const FillDetails&)>;

  virtual ~IExecutionGateway() = default;

  virtual SubmissionResult submit(const domain::OrderSpec& spec) = 0;
  virtual bool cancel(domain::OrderHandle handle) = 0;
  virtual bool modify(domain::OrderHandle handle, double new_price) = 0;
  virtual bool supportsOco() const = 0;
  virtual void setFillHandler(FillHandler handler) = 0;
};

}  // namespace bracket
