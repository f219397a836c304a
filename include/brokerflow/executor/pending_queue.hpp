#pragma once

#include "brokerflow/executor/command.hpp"
#include "brokerflow/executor/task_instance_key.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace brokerflow {

struct PendingTask {
  TaskInstanceKey key;
  Command command;
  std::string queue_name;
  int priority{0};
};

/// Work accepted by queue() but not yet dispatched, ordered by priority
/// (higher first) and then by arrival. Not synchronized.
class PendingQueue {
public:
  auto push(PendingTask task) -> void;

  /// Re-insert behind every entry of the same priority.
  auto requeue(PendingTask task) -> void { push(std::move(task)); }

  [[nodiscard]] auto take(const TaskInstanceKey &key)
      -> std::optional<PendingTask>;
  [[nodiscard]] auto find(const TaskInstanceKey &key) const
      -> const PendingTask *;
  [[nodiscard]] auto contains(const TaskInstanceKey &key) const -> bool {
    return tasks_.contains(key);
  }

  /// Keys in dispatch order.
  [[nodiscard]] auto ordered_keys() const -> std::vector<TaskInstanceKey>;

  auto clear() -> void;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

private:
  struct Slot {
    PendingTask task;
    std::uint64_t seq{0};
  };

  struct OrderKey {
    int priority{0};
    std::uint64_t seq{0};
    auto operator<(const OrderKey &rhs) const noexcept -> bool {
      if (priority != rhs.priority) {
        return priority > rhs.priority;
      }
      return seq < rhs.seq;
    }
  };

  ankerl::unordered_dense::map<TaskInstanceKey, Slot> tasks_;
  std::set<std::pair<OrderKey, TaskInstanceKey>> order_;
  std::uint64_t next_seq_{0};
};

} // namespace brokerflow
