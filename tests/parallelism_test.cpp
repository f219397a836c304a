#include "brokerflow/executor/parallelism_gate.hpp"
#include "brokerflow/executor/pending_queue.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <limits>

using namespace brokerflow;
using brokerflow::test::make_key;

TEST(ParallelismGateTest, GlobalLimitBoundsAcquisitions) {
  ParallelismGate gate{2};
  EXPECT_EQ(gate.open_slots(), 2U);
  EXPECT_TRUE(gate.try_acquire("default"));
  EXPECT_TRUE(gate.try_acquire("other"));
  EXPECT_TRUE(gate.global_exhausted());
  EXPECT_FALSE(gate.try_acquire("default"));
  EXPECT_EQ(gate.in_use(), 2U);
  EXPECT_EQ(gate.open_slots(), 0U);

  gate.release("other");
  EXPECT_EQ(gate.open_slots(), 1U);
  EXPECT_TRUE(gate.can_acquire("other"));
}

TEST(ParallelismGateTest, ZeroMeansUnlimited) {
  ParallelismGate gate{0};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(gate.try_acquire("default"));
  }
  EXPECT_FALSE(gate.global_exhausted());
  EXPECT_EQ(gate.open_slots(), std::numeric_limits<std::size_t>::max());
}

TEST(ParallelismGateTest, PerQueueLimitIsIndependentOfOtherQueues) {
  ParallelismGate gate{10, {{"gpu", 1}, {"free", 0}}};
  EXPECT_TRUE(gate.try_acquire("gpu"));
  EXPECT_FALSE(gate.try_acquire("gpu"));
  EXPECT_TRUE(gate.try_acquire("cpu"));
  EXPECT_TRUE(gate.try_acquire("free"));
  EXPECT_TRUE(gate.try_acquire("free"));
  EXPECT_EQ(gate.in_use("gpu"), 1U);
  EXPECT_EQ(gate.in_use("free"), 2U);
  EXPECT_EQ(gate.in_use(), 4U);

  gate.release("gpu");
  EXPECT_TRUE(gate.can_acquire("gpu"));
}

TEST(ParallelismGateTest, ReleaseOfUnknownQueueIsIgnored) {
  ParallelismGate gate{1};
  gate.release("nothing");
  EXPECT_EQ(gate.in_use(), 0U);
  EXPECT_TRUE(gate.try_acquire("q"));
}

namespace {
auto pending(std::string_view task_id, int priority = 0) -> PendingTask {
  return PendingTask{.key = make_key("wf", task_id),
                     .command = Command{"true"},
                     .queue_name = "default",
                     .priority = priority};
}
} // namespace

TEST(PendingQueueTest, OrdersByPriorityThenArrival) {
  PendingQueue q;
  q.push(pending("low1", 0));
  q.push(pending("high", 5));
  q.push(pending("low2", 0));
  q.push(pending("mid", 1));

  auto keys = q.ordered_keys();
  ASSERT_EQ(keys.size(), 4U);
  EXPECT_EQ(keys[0].task_id().value(), "high");
  EXPECT_EQ(keys[1].task_id().value(), "mid");
  EXPECT_EQ(keys[2].task_id().value(), "low1");
  EXPECT_EQ(keys[3].task_id().value(), "low2");
}

TEST(PendingQueueTest, RequeueMovesBehindSamePriority) {
  PendingQueue q;
  q.push(pending("a"));
  q.push(pending("b"));
  auto a = q.take(make_key("wf", "a"));
  ASSERT_TRUE(a.has_value());
  q.requeue(std::move(*a));

  auto keys = q.ordered_keys();
  ASSERT_EQ(keys.size(), 2U);
  EXPECT_EQ(keys[0].task_id().value(), "b");
  EXPECT_EQ(keys[1].task_id().value(), "a");
}

TEST(PendingQueueTest, TakeFindAndClear) {
  PendingQueue q;
  q.push(pending("a"));
  EXPECT_TRUE(q.contains(make_key("wf", "a")));
  ASSERT_NE(q.find(make_key("wf", "a")), nullptr);
  EXPECT_EQ(q.find(make_key("wf", "a"))->command, Command{"true"});
  EXPECT_EQ(q.find(make_key("wf", "zzz")), nullptr);
  EXPECT_FALSE(q.take(make_key("wf", "zzz")).has_value());

  q.push(pending("b"));
  q.clear();
  EXPECT_TRUE(q.empty());
  EXPECT_TRUE(q.ordered_keys().empty());
}
