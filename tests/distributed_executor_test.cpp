#include "brokerflow/executor/distributed_executor.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <format>
#include <future>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

using namespace brokerflow;
using namespace std::chrono_literals;
using brokerflow::test::make_key;

namespace {

auto fast_config() -> ExecutorConfig {
  ExecutorConfig cfg;
  cfg.parallelism = 0;
  cfg.sync_parallelism = 4;
  cfg.max_dispatch_failures = 3;
  cfg.poll_timeout = 200ms;
  cfg.shutdown_timeout = 2s;
  cfg.shutdown_grace = 2000ms;
  cfg.shutdown_poll_interval = 10ms;
  return cfg;
}

} // namespace

class DistributedExecutorTest : public ::testing::Test {
protected:
  void SetUp() override { make_executor(fast_config()); }

  void make_executor(ExecutorConfig cfg) {
    executor_.reset();
    broker_ = std::make_shared<test::ScriptedBroker>();
    executor_ = std::make_unique<DistributedExecutor>(std::move(cfg), broker_);
  }

  auto token(std::string_view program) -> std::string {
    auto t = broker_->token_for(program);
    EXPECT_TRUE(t.has_value()) << program << " was never submitted";
    return t.value_or("");
  }

  std::shared_ptr<test::ScriptedBroker> broker_;
  std::unique_ptr<DistributedExecutor> executor_;
};

TEST_F(DistributedExecutorTest, SuccessAndFailureReachEventBuffer) {
  auto ok_key = make_key("wf", "succeeds");
  auto bad_key = make_key("wf", "fails");
  ASSERT_TRUE(executor_->queue(ok_key, Command{"succeeds"}));
  ASSERT_TRUE(executor_->queue(bad_key, Command{"fails"}));
  EXPECT_EQ(executor_->pending_count(), 2U);

  ASSERT_TRUE(executor_->heartbeat());
  EXPECT_EQ(executor_->pending_count(), 0U);
  EXPECT_EQ(executor_->running_count(), 2U);
  EXPECT_EQ(executor_->last_observed(ok_key), TaskState::Pending);
  EXPECT_EQ(broker_->submissions().size(), 2U);

  broker_->set_state(token("succeeds"), broker_state::kSuccess);
  broker_->set_state(token("fails"), broker_state::kFailure, "worker error", 1);
  ASSERT_TRUE(executor_->sync());

  EXPECT_EQ(executor_->running_count(), 0U);
  EXPECT_EQ(executor_->last_observed_count(), 0U);
  EXPECT_FALSE(executor_->has_task(ok_key));

  auto events = executor_->drain_events();
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events.at(ok_key).outcome, Outcome::Success);
  EXPECT_EQ(events.at(bad_key).outcome, Outcome::Failed);
  EXPECT_EQ(events.at(bad_key).info, "worker error (exit code 1)");
}

TEST_F(DistributedExecutorTest, LookupErrorFailsOnlyTheAffectedTask) {
  test::LogCapture logs;
  auto broken = make_key("wf", "broken");
  auto healthy = make_key("wf", "healthy");
  auto done = make_key("wf", "done");
  ASSERT_TRUE(executor_->queue(broken, Command{"broken"}));
  ASSERT_TRUE(executor_->queue(healthy, Command{"healthy"}));
  ASSERT_TRUE(executor_->queue(done, Command{"done"}));
  ASSERT_TRUE(executor_->trigger_pending());

  broker_->set_reply(token("broken"), []() -> std::string {
    throw test::AttributeError("result backend returned no state");
  });
  broker_->set_state(token("healthy"), broker_state::kStarted);
  broker_->set_state(token("done"), broker_state::kSuccess);

  ASSERT_TRUE(executor_->heartbeat());

  EXPECT_EQ(logs.count_containing(kFetchErrorHeader, log::Level::Error), 1U);
  EXPECT_EQ(logs.count_containing("result backend returned no state",
                                  log::Level::Error),
            1U);

  auto events = executor_->drain_events();
  ASSERT_EQ(events.size(), 2U);
  ASSERT_TRUE(events.contains(broken));
  EXPECT_EQ(events.at(broken).outcome, Outcome::Failed);
  ASSERT_TRUE(events.at(broken).info.has_value());
  EXPECT_NE(events.at(broken).info->find("AttributeError"), std::string::npos);
  EXPECT_EQ(events.at(done).outcome, Outcome::Success);

  EXPECT_TRUE(executor_->is_running(healthy));
  EXPECT_EQ(executor_->last_observed(healthy), TaskState::Running);
  EXPECT_FALSE(executor_->has_task(broken));
  EXPECT_EQ(executor_->running_count(), 1U);
}

TEST_F(DistributedExecutorTest, ThrowingFetchDoesNotWaitForPollTimeout) {
  auto cfg = fast_config();
  cfg.poll_timeout = 30s;
  make_executor(cfg);

  auto key = make_key("wf", "broken");
  ASSERT_TRUE(executor_->queue(key, Command{"broken"}));
  ASSERT_TRUE(executor_->trigger_pending());
  broker_->set_reply(token("broken"), []() -> std::string {
    throw test::AttributeError("'NoneType' object has no attribute 'state'");
  });

  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(executor_->sync());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

  auto events = executor_->drain_events();
  ASSERT_TRUE(events.contains(key));
  ASSERT_TRUE(events.at(key).info.has_value());
  EXPECT_NE(events.at(key).info->find("AttributeError"), std::string::npos);
  EXPECT_NE(events.at(key).info->find("has no attribute"), std::string::npos);
}

TEST_F(DistributedExecutorTest, RetiredTokensAreForgottenAtTheBroker) {
  auto ok_key = make_key("wf", "succeeds");
  auto cancelled = make_key("wf", "cancelled");
  ASSERT_TRUE(executor_->queue(ok_key, Command{"succeeds"}));
  ASSERT_TRUE(executor_->queue(cancelled, Command{"cancelled"}));
  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_TRUE(broker_->forgotten().empty());

  broker_->set_state(token("succeeds"), broker_state::kSuccess);
  ASSERT_TRUE(executor_->sync());
  ASSERT_EQ(broker_->forgotten().size(), 1U);
  EXPECT_EQ(broker_->forgotten().front().value(), token("succeeds"));

  ASSERT_TRUE(executor_->cancel(cancelled));
  ASSERT_EQ(broker_->forgotten().size(), 2U);
  EXPECT_EQ(broker_->forgotten().back().value(), token("cancelled"));
}

TEST_F(DistributedExecutorTest, SlowFetchIsReportedAsTimeout) {
  test::LogCapture logs;
  auto slow = make_key("wf", "slow");
  ASSERT_TRUE(executor_->queue(slow, Command{"slow"}));
  ASSERT_TRUE(executor_->trigger_pending());
  broker_->set_hanging(token("slow"));

  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(executor_->sync());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

  auto events = executor_->drain_events();
  ASSERT_TRUE(events.contains(slow));
  EXPECT_EQ(events.at(slow).outcome, Outcome::Failed);
  EXPECT_NE(events.at(slow).info->find("TimeoutError"), std::string::npos);
  EXPECT_EQ(logs.count_containing(kFetchErrorHeader), 1U);
}

TEST_F(DistributedExecutorTest, DuplicateKeyIsRejected) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"a"}));

  auto again = executor_->queue(key, Command{"b"});
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), make_error_code(Error::DuplicateKey));

  ASSERT_TRUE(executor_->trigger_pending());
  auto while_running = executor_->queue(key, Command{"c"});
  ASSERT_FALSE(while_running);
  EXPECT_EQ(while_running.error(), make_error_code(Error::DuplicateKey));

  // A new attempt is a different key.
  EXPECT_TRUE(executor_->queue(make_key("wf", "t", 2), Command{"d"}));
}

TEST_F(DistributedExecutorTest, DrainIsIdempotent) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"t"}));
  ASSERT_TRUE(executor_->trigger_pending());
  broker_->set_state(token("t"), broker_state::kSuccess);
  ASSERT_TRUE(executor_->sync());

  EXPECT_EQ(executor_->drain_events().size(), 1U);
  EXPECT_TRUE(executor_->drain_events().empty());

  // A terminal entry is retired, so later syncs do not re-report it.
  ASSERT_TRUE(executor_->sync());
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST_F(DistributedExecutorTest, DrainByWorkflowLeavesOtherEvents) {
  ASSERT_TRUE(executor_->queue(make_key("a", "t"), Command{"a"}));
  ASSERT_TRUE(executor_->queue(make_key("b", "t"), Command{"b"}));
  ASSERT_TRUE(executor_->trigger_pending());
  broker_->set_state(token("a"), broker_state::kSuccess);
  broker_->set_state(token("b"), broker_state::kSuccess);
  ASSERT_TRUE(executor_->sync());

  const std::vector<WorkflowId> only_a{WorkflowId{"a"}};
  auto a_events = executor_->drain_events(only_a);
  ASSERT_EQ(a_events.size(), 1U);
  EXPECT_TRUE(a_events.contains(make_key("a", "t")));

  auto rest = executor_->drain_events();
  ASSERT_EQ(rest.size(), 1U);
  EXPECT_TRUE(rest.contains(make_key("b", "t")));
}

TEST_F(DistributedExecutorTest, GlobalParallelismBoundsInFlightWork) {
  auto cfg = fast_config();
  cfg.parallelism = 2;
  make_executor(cfg);

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(executor_->queue(make_key("wf", std::format("t{}", i)),
                                 Command{std::format("t{}", i)}));
  }
  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(executor_->running_count(), 2U);
  EXPECT_EQ(executor_->pending_count(), 3U);
  EXPECT_EQ(executor_->open_slots(), 0U);

  // Nothing frees up, so another trigger dispatches nothing.
  ASSERT_TRUE(executor_->heartbeat());
  EXPECT_EQ(executor_->running_count(), 2U);
  EXPECT_EQ(broker_->submissions().size(), 2U);

  broker_->set_state(token("t0"), broker_state::kSuccess);
  ASSERT_TRUE(executor_->sync());
  EXPECT_EQ(executor_->open_slots(), 1U);
  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(executor_->running_count(), 2U);
  EXPECT_EQ(executor_->pending_count(), 2U);
  EXPECT_EQ(broker_->submissions()[2].command, Command{"t2"});
}

TEST_F(DistributedExecutorTest, PerQueueParallelismDoesNotBlockOtherQueues) {
  auto cfg = fast_config();
  cfg.parallelism = 10;
  cfg.queue_parallelism = {{"gpu", 1}};
  make_executor(cfg);

  ASSERT_TRUE(
      executor_->queue(make_key("wf", "g1"), Command{"g1"}, "gpu", 0));
  ASSERT_TRUE(
      executor_->queue(make_key("wf", "g2"), Command{"g2"}, "gpu", 0));
  ASSERT_TRUE(executor_->queue(make_key("wf", "c1"), Command{"c1"}, "cpu", 0));
  ASSERT_TRUE(executor_->trigger_pending());

  EXPECT_EQ(executor_->running_in_queue("gpu"), 1U);
  EXPECT_EQ(executor_->running_in_queue("cpu"), 1U);
  EXPECT_TRUE(executor_->is_pending(make_key("wf", "g2")));

  auto subs = broker_->submissions();
  ASSERT_EQ(subs.size(), 2U);
  EXPECT_EQ(subs[0].queue_name, "gpu");
  EXPECT_EQ(subs[1].queue_name, "cpu");
}

TEST_F(DistributedExecutorTest, HigherPriorityDispatchesFirst) {
  auto cfg = fast_config();
  cfg.parallelism = 1;
  make_executor(cfg);

  ASSERT_TRUE(executor_->queue(make_key("wf", "low"), Command{"low"},
                               std::string(kDefaultQueue), 0));
  ASSERT_TRUE(executor_->queue(make_key("wf", "high"), Command{"high"},
                               std::string(kDefaultQueue), 10));
  ASSERT_TRUE(executor_->trigger_pending());

  auto subs = broker_->submissions();
  ASSERT_EQ(subs.size(), 1U);
  EXPECT_EQ(subs[0].command, Command{"high"});
}

TEST_F(DistributedExecutorTest, QueueTaskInstanceUsesCommandBuilder) {
  auto key = make_key("etl", "extract", 2);
  ExecutionContext ctx{};
  ctx.pool = "io";
  ASSERT_TRUE(executor_->queue_task_instance(key, ctx, "etl"));
  ASSERT_TRUE(executor_->trigger_pending());

  auto subs = broker_->submissions();
  ASSERT_EQ(subs.size(), 1U);
  EXPECT_EQ(subs[0].command, CommandBuilder::build(key, ctx));
  EXPECT_EQ(subs[0].queue_name, "etl");
}

TEST_F(DistributedExecutorTest, DispatchFailureRequeuesUntilThreshold) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"t"}));

  broker_->fail_next_submits(2);
  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(executor_->consecutive_dispatch_failures(), 1U);
  EXPECT_TRUE(executor_->is_pending(key));
  EXPECT_EQ(executor_->open_slots(), std::numeric_limits<std::size_t>::max());

  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(executor_->consecutive_dispatch_failures(), 2U);

  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(executor_->consecutive_dispatch_failures(), 0U);
  EXPECT_TRUE(executor_->is_running(key));
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST_F(DistributedExecutorTest, PersistentDispatchFailureIsFatal) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"t"}));
  broker_->fail_next_submits(100);

  ASSERT_TRUE(executor_->heartbeat());
  ASSERT_TRUE(executor_->heartbeat());
  auto third = executor_->heartbeat();
  ASSERT_FALSE(third);
  EXPECT_EQ(third.error(), make_error_code(Error::BrokerUnavailable));

  // The task is still queued; nothing was reported as failed.
  EXPECT_TRUE(executor_->is_pending(key));
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST_F(DistributedExecutorTest, CancelPendingAndInFlight) {
  auto pending_key = make_key("wf", "pending");
  auto running_key = make_key("wf", "running");
  ASSERT_TRUE(executor_->queue(running_key, Command{"running"}));
  ASSERT_TRUE(executor_->trigger_pending());
  ASSERT_TRUE(executor_->queue(pending_key, Command{"pending"}));

  ASSERT_TRUE(executor_->cancel(pending_key));
  EXPECT_FALSE(executor_->has_task(pending_key));

  ASSERT_TRUE(executor_->cancel(running_key));
  EXPECT_FALSE(executor_->has_task(running_key));
  ASSERT_EQ(broker_->revoked().size(), 1U);
  EXPECT_EQ(broker_->revoked().front().value(), token("running"));

  auto missing = executor_->cancel(make_key("wf", "nope"));
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));

  broker_->set_state(token("running"), broker_state::kRevoked);
  ASSERT_TRUE(executor_->heartbeat());
  EXPECT_TRUE(executor_->drain_events().empty());
  EXPECT_EQ(broker_->submissions().size(), 1U);
}

TEST_F(DistributedExecutorTest, SynchronousShutdownWaitsForOutcomes) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"t"}));
  // The task completes as soon as it is dispatched.
  broker_->set_state("tok-1", broker_state::kSuccess);

  executor_->shutdown(true);

  EXPECT_EQ(executor_->pending_count(), 0U);
  EXPECT_EQ(executor_->running_count(), 0U);
  EXPECT_TRUE(broker_->closed());
  EXPECT_TRUE(broker_->revoked().empty());

  auto events = executor_->drain_events();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events.at(key).outcome, Outcome::Success);

  auto late = executor_->queue(make_key("wf", "late"), Command{"late"});
  ASSERT_FALSE(late);
  EXPECT_EQ(late.error(), make_error_code(Error::InvalidState));
  EXPECT_FALSE(executor_->heartbeat());
}

TEST_F(DistributedExecutorTest, SynchronousShutdownGivesUpAfterTimeout) {
  auto cfg = fast_config();
  cfg.shutdown_timeout = 1s;
  make_executor(cfg);

  ASSERT_TRUE(executor_->queue(make_key("wf", "t"), Command{"t"}));
  broker_->set_state("tok-1", broker_state::kStarted);

  const auto start = std::chrono::steady_clock::now();
  executor_->shutdown(true);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, 900ms);
  EXPECT_LT(elapsed, 10s);
  EXPECT_EQ(executor_->running_count(), 0U);
  EXPECT_TRUE(broker_->revoked().empty());
  EXPECT_TRUE(broker_->closed());
}

TEST_F(DistributedExecutorTest, ImmediateShutdownRevokesAndDropsPending) {
  auto cfg = fast_config();
  cfg.parallelism = 1;
  make_executor(cfg);

  ASSERT_TRUE(executor_->queue(make_key("wf", "a"), Command{"a"}));
  ASSERT_TRUE(executor_->queue(make_key("wf", "b"), Command{"b"}));
  ASSERT_TRUE(executor_->trigger_pending());

  executor_->shutdown(false);

  EXPECT_EQ(executor_->pending_count(), 0U);
  EXPECT_EQ(executor_->running_count(), 0U);
  ASSERT_EQ(broker_->revoked().size(), 1U);
  EXPECT_TRUE(broker_->closed());
  EXPECT_TRUE(executor_->drain_events().empty());

  // Second shutdown is a no-op.
  executor_->shutdown(false);
  EXPECT_EQ(broker_->revoked().size(), 1U);
}

TEST_F(DistributedExecutorTest, ImmediateShutdownWithoutRevokeAbandons) {
  ASSERT_TRUE(executor_->queue(make_key("wf", "a"), Command{"a"}));
  ASSERT_TRUE(executor_->trigger_pending());
  broker_->set_revocable(false);

  executor_->shutdown(false);
  EXPECT_TRUE(broker_->revoked().empty());
  EXPECT_EQ(executor_->running_count(), 0U);
}

TEST_F(DistributedExecutorTest, ShutdownCancelsSyncInProgress) {
  auto cfg = fast_config();
  cfg.sync_parallelism = 1;
  cfg.poll_timeout = 300ms;
  make_executor(cfg);

  for (const auto *name : {"a", "b", "c"}) {
    ASSERT_TRUE(executor_->queue(make_key("wf", name), Command{name}));
  }
  ASSERT_TRUE(executor_->trigger_pending());
  for (const auto *tok : {"tok-1", "tok-2", "tok-3"}) {
    broker_->set_hanging(tok);
  }

  auto sync_result =
      std::async(std::launch::async, [this] { return executor_->sync(); });
  std::this_thread::sleep_for(50ms);
  executor_->shutdown(false);

  auto result = sync_result.get();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), make_error_code(Error::Cancelled));
  EXPECT_LT(broker_->fetch_calls(), 3U);
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST_F(DistributedExecutorTest, EmptySyncIsANoOp) {
  ASSERT_TRUE(executor_->sync());
  ASSERT_TRUE(executor_->trigger_pending());
  EXPECT_EQ(broker_->fetch_calls(), 0U);
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST_F(DistributedExecutorTest, NonTerminalStatesAreTracked) {
  auto key = make_key("wf", "t");
  ASSERT_TRUE(executor_->queue(key, Command{"t"}));
  ASSERT_TRUE(executor_->heartbeat());
  EXPECT_EQ(executor_->last_observed(key), TaskState::Pending);

  broker_->set_state(token("t"), broker_state::kStarted);
  ASSERT_TRUE(executor_->sync());
  EXPECT_EQ(executor_->last_observed(key), TaskState::Running);
  ASSERT_TRUE(executor_->sync());
  EXPECT_EQ(executor_->last_observed(key), TaskState::Running);
  EXPECT_TRUE(executor_->is_running(key));

  broker_->set_state(token("t"), broker_state::kRetry);
  ASSERT_TRUE(executor_->sync());
  EXPECT_TRUE(executor_->is_running(key));
  EXPECT_TRUE(executor_->drain_events().empty());
}

TEST(DistributedExecutorFactoryTest, RejectsUnknownBrokerScheme) {
  SystemConfig cfg;
  cfg.broker.broker_url = "redis://localhost:6379/0";
  auto executor = create_distributed_executor(cfg);
  ASSERT_FALSE(executor);
  EXPECT_EQ(executor.error(), make_error_code(Error::InvalidUrl));
}

TEST(DistributedExecutorFactoryTest, BuildsMemoryBackedExecutor) {
  SystemConfig cfg;
  cfg.executor.parallelism = 3;
  auto executor = create_distributed_executor(cfg);
  ASSERT_TRUE(executor) << executor.error().message();
  EXPECT_EQ((*executor)->config().parallelism, 3U);
  EXPECT_EQ((*executor)->open_slots(), 3U);
  (*executor)->shutdown(false);
}
