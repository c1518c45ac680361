#pragma once

#include "bracket/domain/order.hpp"
#include "bracket/execution/i_execution_gateway.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace bracket {

// -----------------------------------------------------------------------------
// OrderBundle: the live orders backing one position
// -----------------------------------------------------------------------------
//
// @brief  Tracks entry, stop and target orders partitioned by role, indexed
//         by client order id and by tag, and routes modifications and
//         cancels for them through the execution gateway.
//
// @details
// Storage:
//   One map per role (entry_orders_, stop_orders_, target_orders_) keyed by
//   client order id. Every insertion is stamped with a sequence number;
//   bulk queries return orders in insertion order.
//
// Tags:
//   A tag is a lookup label ("stop", "stop1", "target2"), not a key, and
//   may be reused. getOrderByTag() resolves to the most recently inserted
//   order still tracked under that tag (last write wins). The earlier order
//   stays tracked and reachable by id. Reusing a tag is logged.
//
// Gateway interaction:
//   The bundle never edits an order's price on its own. Modify and cancel
//   go to the gateway via the order's handle; local bookkeeping is updated
//   only after the gateway accepts. removeOrder() and clear() are pure
//   bookkeeping and never contact the gateway.
//
// Partial failure:
//   modifyAllStops() and cancelAll() treat every order independently and
//   return how many succeeded. Successes are never rolled back.
//
// Thread model:
//   Not synchronised. PositionManager owns the bundle and serialises every
//   access under its state lock. Pointers returned by getOrderById() and
//   getOrderByTag() are valid until the next mutating call.
// -----------------------------------------------------------------------------
class OrderBundle {
 public:
  explicit OrderBundle(IExecutionGateway& gateway);

  OrderBundle(const OrderBundle&) = delete;
  OrderBundle& operator=(const OrderBundle&) = delete;
  OrderBundle(OrderBundle&&) = delete;
  OrderBundle& operator=(OrderBundle&&) = delete;

  void addEntryOrder(const domain::OrderId& id, domain::OrderHandle handle,
                     const std::string& tag, double price = 0.0,
                     int quantity = 0);
  void addStopOrder(const domain::OrderId& id, domain::OrderHandle handle,
                    const std::string& tag, double price = 0.0,
                    int quantity = 0);
  void addTargetOrder(const domain::OrderId& id, domain::OrderHandle handle,
                      const std::string& tag, double price = 0.0,
                      int quantity = 0);

  const domain::TrackedOrder* getOrderByTag(const std::string& tag) const;
  const domain::TrackedOrder* getOrderById(const domain::OrderId& id) const;

  std::vector<domain::TrackedOrder> getActiveStopOrders() const;
  std::vector<domain::TrackedOrder> getActiveTargetOrders() const;
  std::vector<domain::TrackedOrder> getActiveOrders() const;
  std::vector<domain::TrackedOrder> getAllOrders() const;

  // -------------------------------------------------------------------------
  // modifyStopByTag(tag, price) / modifyTargetByTag(tag, price)
  // -------------------------------------------------------------------------
  // @brief  Reprices the order the tag resolves to.
  //
  // @return false if the tag is unknown, resolves to an order of another
  //         role, the order is no longer Active, or the gateway refuses.
  //         Never throws.
  // -------------------------------------------------------------------------
  bool modifyStopByTag(const std::string& tag, double new_price);
  bool modifyTargetByTag(const std::string& tag, double new_price);

  // -------------------------------------------------------------------------
  // modifyAllStops(price)
  // -------------------------------------------------------------------------
  // @brief  Requests every active stop be moved to the same price.
  //
  // @return Number of stops the gateway accepted. Failures leave the other
  //         stops untouched; nothing is rolled back.
  // -------------------------------------------------------------------------
  int modifyAllStops(double new_price);

  // Pairwise variant: prices[i] goes to the i-th active stop in insertion
  // order. Extra prices or extra stops are ignored.
  int modifyAllStops(const std::vector<double>& new_prices);

  // Cancels one active order through the gateway.
  bool cancelOrder(const domain::OrderId& id);

  // Cancels every active order of any role. Returns the accepted count.
  int cancelAll();

  // Cancels every active stop/target except `keep`. Used when a protective
  // order fills on a gateway without native OCO.
  int cancelProtectiveExcept(const domain::OrderId& keep);

  bool markFilled(const domain::OrderId& id);
  bool markCancelled(const domain::OrderId& id);

  // Bookkeeping only; the gateway is not contacted.
  bool removeOrder(const domain::OrderId& id);
  void clear();

  std::size_t size() const;
  std::size_t getActiveCount() const;
  bool empty() const { return size() == 0; }

  // Multi-line report of every tracked order, for logs and STATUS replies.
  std::string getStatus() const;

 private:
  using OrderMap = std::unordered_map<domain::OrderId, domain::TrackedOrder>;

  void addOrder(domain::OrderRole role, const domain::OrderId& id,
                domain::OrderHandle handle, const std::string& tag,
                double price, int quantity);
  bool modifyByTag(domain::OrderRole role, const std::string& tag,
                   double new_price);
  bool modifyTracked(domain::TrackedOrder& order, double new_price);
  bool cancelTracked(domain::TrackedOrder& order);

  domain::TrackedOrder* findMutable(const domain::OrderId& id);
  OrderMap& mapFor(domain::OrderRole role);
  void untag(const domain::TrackedOrder& order);

  static std::vector<domain::TrackedOrder> activeSorted(const OrderMap& map);

  IExecutionGateway& gateway_;

  OrderMap entry_orders_;
  OrderMap stop_orders_;
  OrderMap target_orders_;

  // tag -> ids in insertion order; the back element wins lookups.
  std::unordered_map<std::string, std::vector<domain::OrderId>> tag_index_;

  std::uint64_t next_sequence_{1};
};

}  // namespace bracket
