#pragma once

#include "brokerflow/core/error.hpp"
#include "brokerflow/executor/command.hpp"
#include "brokerflow/executor/event_buffer.hpp"
#include "brokerflow/executor/task_instance_key.hpp"
#include "brokerflow/util/id.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace brokerflow {

inline constexpr std::string_view kDefaultQueue = "default";

/// Orchestrator-facing executor contract. The scheduler drives it from a
/// single control thread; implementations must never block that thread on a
/// remote worker.
class Executor {
public:
  virtual ~Executor() = default;

  /// Accept one unit of work into the pending queue. Fails with
  /// Error::DuplicateKey when `key` is already pending or in flight.
  [[nodiscard]] virtual auto queue(TaskInstanceKey key, Command command,
                                   std::string queue_name, int priority)
      -> Result<void> = 0;

  [[nodiscard]] auto queue(TaskInstanceKey key, Command command)
      -> Result<void> {
    return queue(std::move(key), std::move(command), std::string(kDefaultQueue),
                 0);
  }

  /// Build the task runner command for `key` and queue it.
  [[nodiscard]] auto queue_task_instance(const TaskInstanceKey &key,
                                         const ExecutionContext &ctx,
                                         std::string queue_name,
                                         int priority = 0) -> Result<void> {
    return queue(key, CommandBuilder::build(key, ctx), std::move(queue_name),
                 priority);
  }

  /// Dispatch pending work while parallelism allows.
  [[nodiscard]] virtual auto trigger_pending() -> Result<void> = 0;

  /// Reconcile remote state of every in-flight task.
  [[nodiscard]] virtual auto sync() -> Result<void> = 0;

  /// Periodic entry point. Per-task problems never surface here; only
  /// executor-fatal conditions do.
  [[nodiscard]] virtual auto heartbeat() -> Result<void> {
    auto triggered = trigger_pending();
    auto synced = sync();
    if (!triggered) {
      return triggered;
    }
    return synced;
  }

  /// Atomically return and clear every buffered outcome.
  [[nodiscard]] virtual auto drain_events() -> EventMap = 0;

  /// Return and clear only outcomes belonging to `workflow_ids`.
  [[nodiscard]] virtual auto
  drain_events(std::span<const WorkflowId> workflow_ids) -> EventMap = 0;

  /// Drop a pending task or revoke an in-flight one. No event is recorded.
  [[nodiscard]] virtual auto cancel(const TaskInstanceKey &key)
      -> Result<void> = 0;

  virtual auto shutdown(bool wait_for_completion) -> void = 0;

  [[nodiscard]] virtual auto has_task(const TaskInstanceKey &key) const
      -> bool = 0;
  [[nodiscard]] virtual auto pending_count() const -> std::size_t = 0;
  [[nodiscard]] virtual auto running_count() const -> std::size_t = 0;
  [[nodiscard]] virtual auto open_slots() const -> std::size_t = 0;
};

} // namespace brokerflow
