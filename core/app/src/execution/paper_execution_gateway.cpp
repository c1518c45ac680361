#include "bracket/execution/paper_execution_gateway.hpp"

#include <iostream>
#include <utility>

namespace bracket {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
PaperExecutionGateway::PaperExecutionGateway(bool oco_enabled,
                                             bool fill_market_orders)
    : oco_enabled_(oco_enabled), fill_market_orders_(fill_market_orders) {}

PaperExecutionGateway::~PaperExecutionGateway() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the fill callback thread
// -----------------------------------------------------------------------------
void PaperExecutionGateway::start() {
  if (running_.load()) {
    return;
  }
  if (fill_queue_.closed()) {
    std::cerr << "[PaperGateway] WARNING: start() after stop() ignored.\n";
    return;
  }

  running_.store(true);
  thread_ = std::thread([this] { deliverLoop(); });

  std::cout << "[PaperGateway] started. oco=" << (oco_enabled_ ? "on" : "off")
            << "\n";
}

// -----------------------------------------------------------------------------
// stop(): close the fill queue and join
// -----------------------------------------------------------------------------
void PaperExecutionGateway::stop() {
  fill_queue_.close();

  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  std::cout << "[PaperGateway] stopped.\n";
}

// -----------------------------------------------------------------------------
// submit(): accept into the working set, fill market orders immediately
// -----------------------------------------------------------------------------
SubmissionResult PaperExecutionGateway::submit(const domain::OrderSpec& spec) {
  submit_calls_.fetch_add(1);
  std::lock_guard lock(mutex_);

  if (reject_submissions_ > 0) {
    --reject_submissions_;
    std::cerr << "[PaperGateway] rejecting " << spec.client_order_id
              << " (injected)\n";
    return SubmissionResult::reject("rejected by fault injection");
  }
  if (spec.quantity <= 0) {
    return SubmissionResult::reject("quantity must be positive");
  }
  if (spec.type != domain::OrderType::Market && spec.price <= 0.0) {
    return SubmissionResult::reject("stop/limit price must be positive");
  }

  const domain::OrderHandle handle = next_handle_++;
  PaperOrder& order = orders_[handle];
  order.spec = spec;
  order.handle = handle;

  if (spec.type == domain::OrderType::Market && fill_market_orders_) {
    fillLocked(order, spec.price);
  }

  return SubmissionResult::accept(handle);
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
bool PaperExecutionGateway::cancel(domain::OrderHandle handle) {
  cancel_calls_.fetch_add(1);
  std::lock_guard lock(mutex_);

  if (reject_cancels_) {
    return false;
  }
  auto it = orders_.find(handle);
  if (it == orders_.end() || it->second.state != PaperOrderState::Working) {
    return false;
  }
  it->second.state = PaperOrderState::Cancelled;
  return true;
}

// -----------------------------------------------------------------------------
// modify(): reprice a working stop or limit order
// -----------------------------------------------------------------------------
bool PaperExecutionGateway::modify(domain::OrderHandle handle,
                                   double new_price) {
  modify_calls_.fetch_add(1);
  std::lock_guard lock(mutex_);

  if (reject_modifies_ || new_price <= 0.0) {
    return false;
  }
  auto it = orders_.find(handle);
  if (it == orders_.end() || it->second.state != PaperOrderState::Working) {
    return false;
  }
  it->second.spec.price = new_price;
  return true;
}

void PaperExecutionGateway::setFillHandler(FillHandler handler) {
  std::lock_guard lock(handler_mutex_);
  fill_handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// onPrice(): trigger crossed stop/limit orders
// -----------------------------------------------------------------------------
std::size_t PaperExecutionGateway::onPrice(double price) {
  std::lock_guard lock(mutex_);
  std::size_t filled = 0;

  for (auto& [handle, order] : orders_) {
    // An earlier fill in this pass may have cancelled this order via OCO.
    if (order.state != PaperOrderState::Working || !crosses(order, price)) {
      continue;
    }
    const double fill_price =
        order.spec.type == domain::OrderType::Limit ? order.spec.price : price;
    fillLocked(order, fill_price);
    ++filled;
  }
  return filled;
}

bool PaperExecutionGateway::triggerFill(const domain::OrderId& id,
                                        double fill_price) {
  std::lock_guard lock(mutex_);
  for (auto& [handle, order] : orders_) {
    if (order.spec.client_order_id == id &&
        order.state == PaperOrderState::Working) {
      fillLocked(order, fill_price);
      return true;
    }
  }
  return false;
}

void PaperExecutionGateway::rejectNextSubmissions(int count) {
  std::lock_guard lock(mutex_);
  reject_submissions_ = count;
}

void PaperExecutionGateway::setRejectModifies(bool reject) {
  std::lock_guard lock(mutex_);
  reject_modifies_ = reject;
}

void PaperExecutionGateway::setRejectCancels(bool reject) {
  std::lock_guard lock(mutex_);
  reject_cancels_ = reject;
}

// -----------------------------------------------------------------------------
// waitUntilIdle(): block until the callback thread has drained every fill
// -----------------------------------------------------------------------------
bool PaperExecutionGateway::waitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return pending_fills_ == 0; });
}

std::vector<PaperExecutionGateway::PaperOrder>
PaperExecutionGateway::workingOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<PaperOrder> result;
  for (const auto& [handle, order] : orders_) {
    if (order.state == PaperOrderState::Working) {
      result.push_back(order);
    }
  }
  return result;
}

std::optional<PaperExecutionGateway::PaperOrder>
PaperExecutionGateway::findOrder(const domain::OrderId& id) const {
  std::lock_guard lock(mutex_);
  for (const auto& [handle, order] : orders_) {
    if (order.spec.client_order_id == id) {
      return order;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// deliverLoop(): callback thread body
// -----------------------------------------------------------------------------
void PaperExecutionGateway::deliverLoop() {
  while (auto fill = fill_queue_.pop()) {
    FillHandler handler;
    {
      std::lock_guard lock(handler_mutex_);
      handler = fill_handler_;
    }

    if (handler) {
      handler(*fill);
    } else {
      std::cerr << "[PaperGateway] WARNING: no fill handler, dropping fill for "
                << fill->order_id << "\n";
    }

    {
      std::lock_guard lock(idle_mutex_);
      --pending_fills_;
    }
    idle_cv_.notify_all();
  }
}

// -----------------------------------------------------------------------------
// fillLocked(): mark filled, apply OCO, enqueue the report. mutex_ held.
// -----------------------------------------------------------------------------
void PaperExecutionGateway::fillLocked(PaperOrder& order, double price) {
  order.state = PaperOrderState::Filled;
  order.fill_price = price;

  if (oco_enabled_ && !order.spec.oco_group.empty()) {
    cancelOcoSiblingsLocked(order);
  }

  FillDetails fill;
  fill.order_id = order.spec.client_order_id;
  fill.handle = order.handle;
  fill.fill_price = price;
  fill.filled_quantity = order.spec.quantity;
  fill.timestamp = now();

  {
    std::lock_guard lock(idle_mutex_);
    ++pending_fills_;
  }
  if (!fill_queue_.push(std::move(fill))) {
    {
      std::lock_guard lock(idle_mutex_);
      --pending_fills_;
    }
    idle_cv_.notify_all();
    std::cerr << "[PaperGateway] WARNING: fill for "
              << order.spec.client_order_id << " dropped after stop()\n";
  }
}

void PaperExecutionGateway::cancelOcoSiblingsLocked(const PaperOrder& filled) {
  for (auto& [handle, order] : orders_) {
    if (handle != filled.handle && order.state == PaperOrderState::Working &&
        order.spec.oco_group == filled.spec.oco_group) {
      order.state = PaperOrderState::Cancelled;
    }
  }
}

bool PaperExecutionGateway::crosses(const PaperOrder& order,
                                    double price) const {
  const bool buy = order.spec.side == domain::Side::Buy;
  switch (order.spec.type) {
    case domain::OrderType::Stop:
      return buy ? price >= order.spec.price : price <= order.spec.price;
    case domain::OrderType::Limit:
      return buy ? price <= order.spec.price : price >= order.spec.price;
    case domain::OrderType::Market:
      // Only reachable when fill_market_orders_ is off: fill on next tick.
      return true;
  }
  return false;
}

}  // namespace bracket
