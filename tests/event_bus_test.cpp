// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for trustflow::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish (subscriber publishes inside callback) — no deadlock
//   - A throwing subscriber does not stop delivery to the others
//   - Payload integrity through the variant dispatch path
//
// All tests are single-threaded; the bus is exercised in isolation.
// =============================================================================

#include "trustflow/eventbus/event_bus.hpp"
#include "trustflow/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace domain = trustflow::domain;

class EventBusTest : public ::testing::Test {
 protected:
  trustflow::EventBus bus;

  static trustflow::OrderUpdateEvent makeUpdate(domain::OrderId id,
                                                domain::OrderStatus from,
                                                domain::OrderStatus to) {
    trustflow::OrderUpdateEvent e;
    e.order.id = id;
    e.order.status = to;
    e.previous_status = from;
    e.reason = "test";
    return e;
  }

  static trustflow::TransactionEvent makeTx(domain::OrderId id,
                                            const std::string& hash) {
    trustflow::TransactionEvent e;
    e.order_id = id;
    e.label = "approve";
    e.stage = trustflow::TransactionEvent::Stage::Broadcast;
    e.tx_hash = hash;
    e.nonce = 7;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: main() logs through generic subscribers and must see everything.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const trustflow::Event&) { ++call_count; });

  bus.publish(makeUpdate(1, domain::OrderStatus::Created,
                         domain::OrderStatus::ApprovalPending));
  bus.publish(makeTx(1, "0xabc"));
  bus.publish(trustflow::ProposalEvent{});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// Why: The IPC telemetry bridges subscribe per type; a mismatched dispatch
//      would push the wrong payload onto the wire.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int tx_count = 0;
  bus.subscribe<trustflow::TransactionEvent>(
      [&tx_count](const trustflow::TransactionEvent&) { ++tx_count; });

  bus.publish(makeUpdate(1, domain::OrderStatus::Created,
                         domain::OrderStatus::ApprovalPending));
  bus.publish(makeTx(1, "0xabc"));

  EXPECT_EQ(tx_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers must all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<trustflow::OrderUpdateEvent>(
      [&count_a](const trustflow::OrderUpdateEvent&) { ++count_a; });
  bus.subscribe<trustflow::OrderUpdateEvent>(
      [&count_b](const trustflow::OrderUpdateEvent&) { ++count_b; });

  bus.publish(makeUpdate(2, domain::OrderStatus::Approved,
                         domain::OrderStatus::GovernancePending));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire again.
// Why: ServiceContext::stop() unsubscribes its telemetry bridges before the
//      IPC server they capture is destroyed.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<trustflow::TransactionEvent>(
      [&call_count](const trustflow::TransactionEvent&) { ++call_count; });

  bus.publish(makeTx(1, "0x01"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeTx(1, "0x02"));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(makeTx(1, "0x01")));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Why: publish() snapshots the subscriber list and releases the lock before
//      invoking callbacks.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int tx_received = 0;

  bus.subscribe<trustflow::TransactionEvent>(
      [&tx_received](const trustflow::TransactionEvent&) { ++tx_received; });

  bus.subscribe<trustflow::OrderUpdateEvent>(
      [this](const trustflow::OrderUpdateEvent& e) {
        bus.publish(makeTx(e.order.id, "0xfeed"));
      });

  bus.publish(makeUpdate(3, domain::OrderStatus::Created,
                         domain::OrderStatus::ApprovalPending));

  EXPECT_EQ(tx_received, 1);
}

// -----------------------------------------------------------------------------
// 7. A throwing subscriber is skipped; later subscribers still run.
// Why: A broken telemetry consumer must not abort the order operation that
//      published the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopDelivery) {
  int after = 0;
  bus.subscribe([](const trustflow::Event&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe([&after](const trustflow::Event&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeTx(4, "0x04")));
  EXPECT_EQ(after, 1);
}

// -----------------------------------------------------------------------------
// 8. Field values must survive publish → dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::vector<trustflow::TransactionEvent> received;

  bus.subscribe<trustflow::TransactionEvent>(
      [&received](const trustflow::TransactionEvent& e) {
        received.push_back(e);
      });

  bus.publish(makeTx(42, "0xdeadbeef"));

  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].order_id, 42u);
  EXPECT_EQ(received[0].tx_hash, "0xdeadbeef");
  EXPECT_EQ(received[0].label, "approve");
  ASSERT_TRUE(received[0].nonce.has_value());
  EXPECT_EQ(*received[0].nonce, 7u);
}
