#include "brokerflow/executor/pending_queue.hpp"

#include <utility>

namespace brokerflow {

auto PendingQueue::push(PendingTask task) -> void {
  if (tasks_.contains(task.key)) {
    (void)take(task.key);
  }
  const auto seq = next_seq_++;
  const OrderKey order{.priority = task.priority, .seq = seq};
  auto key = task.key;
  order_.emplace(order, key);
  tasks_.insert_or_assign(std::move(key),
                          Slot{.task = std::move(task), .seq = seq});
}

auto PendingQueue::take(const TaskInstanceKey &key)
    -> std::optional<PendingTask> {
  auto it = tasks_.find(key);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  order_.erase({OrderKey{.priority = it->second.task.priority,
                         .seq = it->second.seq},
                key});
  auto task = std::move(it->second.task);
  tasks_.erase(it);
  return task;
}

auto PendingQueue::find(const TaskInstanceKey &key) const
    -> const PendingTask * {
  auto it = tasks_.find(key);
  return it == tasks_.end() ? nullptr : &it->second.task;
}

auto PendingQueue::ordered_keys() const -> std::vector<TaskInstanceKey> {
  std::vector<TaskInstanceKey> keys;
  keys.reserve(order_.size());
  for (const auto &[order, key] : order_) {
    keys.push_back(key);
  }
  return keys;
}

auto PendingQueue::clear() -> void {
  tasks_.clear();
  order_.clear();
}

} // namespace brokerflow
