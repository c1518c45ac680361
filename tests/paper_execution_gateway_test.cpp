// =============================================================================
// paper_execution_gateway_test.cpp
// =============================================================================
// Unit tests for bracket::PaperExecutionGateway.
//
// Validates:
//   - Market orders fill at submission, stop/limit orders on a crossing price
//   - Fill prices: stops at the tick, limits at the limit
//   - Native OCO cancels the sibling leg
//   - Fault injection for submit / modify / cancel
//   - Fills are delivered FIFO on the callback thread, never inside submit()
// =============================================================================

#include "bracket/execution/paper_execution_gateway.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using bracket::FillDetails;
using bracket::PaperExecutionGateway;
using bracket::domain::OrderSpec;
using bracket::domain::OrderType;
using bracket::domain::Side;
using namespace std::chrono_literals;

namespace {

OrderSpec makeSpec(const std::string& id, Side side, OrderType type,
                   double price, int qty = 1, const std::string& oco = "") {
  OrderSpec spec;
  spec.client_order_id = id;
  spec.symbol = "ES";
  spec.side = side;
  spec.type = type;
  spec.price = price;
  spec.quantity = qty;
  spec.oco_group = oco;
  return spec;
}

}  // namespace

class PaperExecutionGatewayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    gateway.setFillHandler([this](const FillDetails& fill) {
      std::lock_guard lock(mutex);
      fills.push_back(fill);
      fill_threads.push_back(std::this_thread::get_id());
    });
    gateway.start();
  }

  void TearDown() override { gateway.stop(); }

  std::vector<FillDetails> drained() {
    EXPECT_TRUE(gateway.waitUntilIdle(2000ms));
    std::lock_guard lock(mutex);
    return fills;
  }

  PaperExecutionGateway gateway;
  std::mutex mutex;
  std::vector<FillDetails> fills;
  std::vector<std::thread::id> fill_threads;
};

// -----------------------------------------------------------------------------
// 1. Market orders fill at submission, on the callback thread.
// -----------------------------------------------------------------------------
TEST_F(PaperExecutionGatewayTest, MarketOrderFillsImmediately) {
  const auto result =
      gateway.submit(makeSpec("m1", Side::Buy, OrderType::Market, 4500.0, 2));
  ASSERT_TRUE(result.accepted());

  const auto got = drained();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].order_id, "m1");
  EXPECT_EQ(got[0].handle, *result.handle);
  EXPECT_DOUBLE_EQ(got[0].fill_price, 4500.0);
  EXPECT_EQ(got[0].filled_quantity, 2);
  EXPECT_NE(fill_threads[0], std::this_thread::get_id());
  EXPECT_TRUE(gateway.workingOrders().empty());
}

// -----------------------------------------------------------------------------
// 2. Stop and limit triggers.
// -----------------------------------------------------------------------------
TEST_F(PaperExecutionGatewayTest, SellStopFillsAtTickWhenCrossed) {
  ASSERT_TRUE(
      gateway.submit(makeSpec("s1", Side::Sell, OrderType::Stop, 4490.0))
          .accepted());

  EXPECT_EQ(gateway.onPrice(4495.0), 0u);
  EXPECT_EQ(gateway.onPrice(4488.5), 1u);
  EXPECT_EQ(gateway.onPrice(4480.0), 0u);  // already filled

  const auto got = drained();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_DOUBLE_EQ(got[0].fill_price, 4488.5);
}

TEST_F(PaperExecutionGatewayTest, BuyLimitFillsAtLimit) {
  ASSERT_TRUE(
      gateway.submit(makeSpec("t1", Side::Buy, OrderType::Limit, 4480.0))
          .accepted());

  EXPECT_EQ(gateway.onPrice(4481.0), 0u);
  EXPECT_EQ(gateway.onPrice(4479.0), 1u);

  const auto got = drained();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_DOUBLE_EQ(got[0].fill_price, 4480.0);
}

TEST_F(PaperExecutionGatewayTest, ModifiedStopTriggersAtNewPrice) {
  const auto handle =
      gateway.submit(makeSpec("s1", Side::Sell, OrderType::Stop, 4490.0))
          .handle;
  ASSERT_TRUE(handle.has_value());
  ASSERT_TRUE(gateway.modify(*handle, 4495.0));

  EXPECT_EQ(gateway.onPrice(4494.0), 1u);
  EXPECT_DOUBLE_EQ(gateway.findOrder("s1")->spec.price, 4495.0);
}

// -----------------------------------------------------------------------------
// 3. Fills come out in the order they happened.
// -----------------------------------------------------------------------------
TEST_F(PaperExecutionGatewayTest, FillsDeliveredFifo) {
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(gateway
                    .submit(makeSpec("m" + std::to_string(i), Side::Buy,
                                     OrderType::Market, 4500.0 + i))
                    .accepted());
  }

  const auto got = drained();
  ASSERT_EQ(got.size(), 20u);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(got[i].order_id, "m" + std::to_string(i));
  }
}

// -----------------------------------------------------------------------------
// 4. Without OCO both legs stay working after one fills; with OCO the
//    sibling is cancelled at the venue.
// -----------------------------------------------------------------------------
TEST_F(PaperExecutionGatewayTest, NoOcoLeavesSiblingWorking) {
  EXPECT_FALSE(gateway.supportsOco());
  gateway.submit(makeSpec("s1", Side::Sell, OrderType::Stop, 4490.0, 1, "g"));
  gateway.submit(makeSpec("t1", Side::Sell, OrderType::Limit, 4520.0, 1, "g"));

  EXPECT_EQ(gateway.onPrice(4521.0), 1u);
  ASSERT_EQ(gateway.workingOrders().size(), 1u);
  EXPECT_EQ(gateway.workingOrders()[0].spec.client_order_id, "s1");
}

TEST(PaperExecutionGatewayOcoTest, FillCancelsSiblingInGroup) {
  PaperExecutionGateway gateway(/*oco_enabled=*/true);
  EXPECT_TRUE(gateway.supportsOco());

  gateway.submit(makeSpec("s1", Side::Sell, OrderType::Stop, 4490.0, 1, "g1"));
  gateway.submit(makeSpec("t1", Side::Sell, OrderType::Limit, 4520.0, 1, "g1"));
  gateway.submit(makeSpec("s2", Side::Sell, OrderType::Stop, 4300.0, 1, "g2"));

  EXPECT_EQ(gateway.onPrice(4489.0), 1u);

  EXPECT_EQ(gateway.findOrder("t1")->state,
            PaperExecutionGateway::PaperOrderState::Cancelled);
  EXPECT_EQ(gateway.findOrder("s2")->state,
            PaperExecutionGateway::PaperOrderState::Working);
  gateway.stop();
}

// -----------------------------------------------------------------------------
// 5. Fault injection and invalid requests.
// -----------------------------------------------------------------------------
TEST_F(PaperExecutionGatewayTest, RejectNextSubmissions) {
  gateway.rejectNextSubmissions(1);

  const auto first =
      gateway.submit(makeSpec("a", Side::Sell, OrderType::Stop, 4490.0));
  const auto second =
      gateway.submit(makeSpec("b", Side::Sell, OrderType::Stop, 4490.0));

  EXPECT_FALSE(first.accepted());
  EXPECT_FALSE(first.reason.empty());
  EXPECT_TRUE(second.accepted());
  EXPECT_EQ(gateway.submitCount(), 2u);
}

TEST_F(PaperExecutionGatewayTest, InvalidSubmissionsRejected) {
  EXPECT_FALSE(
      gateway.submit(makeSpec("q", Side::Buy, OrderType::Market, 4500.0, 0))
          .accepted());
  EXPECT_FALSE(gateway.submit(makeSpec("p", Side::Sell, OrderType::Stop, 0.0))
                   .accepted());
}

TEST_F(PaperExecutionGatewayTest, ModifyAndCancelOutcomes) {
  const auto handle =
      *gateway.submit(makeSpec("s1", Side::Sell, OrderType::Stop, 4490.0))
           .handle;

  gateway.setRejectModifies(true);
  EXPECT_FALSE(gateway.modify(handle, 4495.0));
  gateway.setRejectModifies(false);
  EXPECT_FALSE(gateway.modify(handle, -1.0));
  EXPECT_FALSE(gateway.modify(9999, 4495.0));

  gateway.setRejectCancels(true);
  EXPECT_FALSE(gateway.cancel(handle));
  gateway.setRejectCancels(false);
  EXPECT_TRUE(gateway.cancel(handle));
  EXPECT_FALSE(gateway.cancel(handle));  // no longer working
  EXPECT_FALSE(gateway.modify(handle, 4495.0));

  EXPECT_EQ(gateway.cancelCount(), 3u);
  EXPECT_EQ(gateway.modifyCount(), 4u);
}

TEST_F(PaperExecutionGatewayTest, TriggerFillOnlyWorkingOrders) {
  gateway.submit(makeSpec("t1", Side::Sell, OrderType::Limit, 4520.0));

  EXPECT_TRUE(gateway.triggerFill("t1", 4519.0));
  EXPECT_FALSE(gateway.triggerFill("t1", 4519.0));
  EXPECT_FALSE(gateway.triggerFill("nope", 1.0));

  const auto got = drained();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_DOUBLE_EQ(got[0].fill_price, 4519.0);
}

// -----------------------------------------------------------------------------
// 6. Fills queued before start() are delivered once the thread runs.
// -----------------------------------------------------------------------------
TEST(PaperExecutionGatewayLifecycleTest, FillsQueuedBeforeStartAreDelivered) {
  PaperExecutionGateway gateway;
  std::vector<std::string> ids;
  gateway.setFillHandler(
      [&ids](const FillDetails& fill) { ids.push_back(fill.order_id); });

  gateway.submit(makeSpec("early", Side::Buy, OrderType::Market, 4500.0));
  gateway.start();

  ASSERT_TRUE(gateway.waitUntilIdle(2000ms));
  gateway.stop();
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], "early");

  // Stopped for good: later fills are dropped, not queued.
  gateway.start();
  gateway.submit(makeSpec("late", Side::Buy, OrderType::Market, 4500.0));
  EXPECT_TRUE(gateway.waitUntilIdle(100ms));
  EXPECT_EQ(ids.size(), 1u);
}
