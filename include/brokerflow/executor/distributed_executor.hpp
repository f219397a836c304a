#pragma once

#include "brokerflow/broker/message_broker.hpp"
#include "brokerflow/broker/remote_task_handle.hpp"
#include "brokerflow/config/system_config.hpp"
#include "brokerflow/executor/event_buffer.hpp"
#include "brokerflow/executor/executor.hpp"
#include "brokerflow/executor/parallelism_gate.hpp"
#include "brokerflow/executor/pending_queue.hpp"
#include "brokerflow/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/thread_pool.hpp>
#include <boost/describe/enum.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace brokerflow {

/// Literal prefix of every lookup-error log record. Alerting greps for it.
inline constexpr std::string_view kFetchErrorHeader =
    "Error fetching task state";

/// Non-terminal remote state remembered between sync passes.
enum class TaskState : std::uint8_t {
  Pending,
  Running,
};
BOOST_DESCRIBE_ENUM(TaskState, Pending, Running)
BROKERFLOW_DEFINE_ENUM_SERDE(TaskState, TaskState::Pending)

/// Executor that dispatches commands through a MessageBroker and reconciles
/// their state by polling.
///
/// All tables live in one State object guarded by `mu_`. Remote polls run on
/// `poll_pool_` without the lock; their results are applied afterwards under
/// it, one key at a time.
class DistributedExecutor final : public Executor {
public:
  DistributedExecutor(ExecutorConfig config,
                      std::shared_ptr<MessageBroker> broker);
  ~DistributedExecutor() override;

  DistributedExecutor(const DistributedExecutor &) = delete;
  auto operator=(const DistributedExecutor &) -> DistributedExecutor & = delete;
  DistributedExecutor(DistributedExecutor &&) = delete;
  auto operator=(DistributedExecutor &&) -> DistributedExecutor & = delete;

  using Executor::drain_events;
  using Executor::queue;

  [[nodiscard]] auto queue(TaskInstanceKey key, Command command,
                           std::string queue_name, int priority)
      -> Result<void> override;
  [[nodiscard]] auto trigger_pending() -> Result<void> override;
  [[nodiscard]] auto sync() -> Result<void> override;
  [[nodiscard]] auto drain_events() -> EventMap override;
  [[nodiscard]] auto drain_events(std::span<const WorkflowId> workflow_ids)
      -> EventMap override;
  [[nodiscard]] auto cancel(const TaskInstanceKey &key)
      -> Result<void> override;
  auto shutdown(bool wait_for_completion) -> void override;

  [[nodiscard]] auto has_task(const TaskInstanceKey &key) const
      -> bool override;
  [[nodiscard]] auto pending_count() const -> std::size_t override;
  [[nodiscard]] auto running_count() const -> std::size_t override;
  [[nodiscard]] auto open_slots() const -> std::size_t override;

  [[nodiscard]] auto is_pending(const TaskInstanceKey &key) const -> bool;
  [[nodiscard]] auto is_running(const TaskInstanceKey &key) const -> bool;
  [[nodiscard]] auto last_observed(const TaskInstanceKey &key) const
      -> std::optional<TaskState>;
  [[nodiscard]] auto last_observed_count() const -> std::size_t;
  [[nodiscard]] auto consecutive_dispatch_failures() const -> std::size_t;
  [[nodiscard]] auto running_in_queue(std::string_view queue_name) const
      -> std::size_t;

  [[nodiscard]] auto config() const noexcept -> const ExecutorConfig & {
    return config_;
  }

private:
  struct InFlightTask {
    std::shared_ptr<RemoteTaskHandle> handle;
    std::string queue_name;
  };

  struct State {
    PendingQueue pending;
    ankerl::unordered_dense::map<TaskInstanceKey, InFlightTask> in_flight;
    ankerl::unordered_dense::map<TaskInstanceKey, TaskState> last_state;
    EventBuffer events;
    ParallelismGate gate;
    std::size_t consecutive_failures{0};
  };

  using Snapshot =
      std::vector<std::pair<TaskInstanceKey, std::shared_ptr<RemoteTaskHandle>>>;

  [[nodiscard]] auto trigger_pass() -> Result<void>;
  [[nodiscard]] auto sync_pass() -> Result<void>;

  /// Poll every snapshot entry with at most `sync_parallelism` polls in
  /// flight. Slots left empty were skipped because of cancellation.
  [[nodiscard]] auto poll_all(const Snapshot &snapshot)
      -> std::vector<std::optional<PollResult>>;

  auto apply(State &state, const TaskInstanceKey &key,
             const RemoteTaskHandle &handle, PollResult result) -> void;
  auto retire(State &state, const TaskInstanceKey &key) -> void;
  /// Remove every in-flight entry and hand back the handles for revocation.
  [[nodiscard]] auto revoke_all(State &state)
      -> std::vector<std::shared_ptr<RemoteTaskHandle>>;
  auto close_broker() -> void;

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
  }

  ExecutorConfig config_;
  std::shared_ptr<MessageBroker> broker_;

  mutable std::mutex mu_;
  State state_;

  std::atomic<bool> closed_{false};
  std::atomic<bool> cancel_requested_{false};
  std::atomic<bool> broker_closed_{false};

  std::mutex sync_mu_;
  std::condition_variable sync_cv_;
  bool syncing_{false};

  boost::asio::thread_pool poll_pool_;
};

/// Build the broker named by `config.broker` and an executor over it.
[[nodiscard]] auto create_distributed_executor(const SystemConfig &config)
    -> Result<std::unique_ptr<DistributedExecutor>>;

} // namespace brokerflow
