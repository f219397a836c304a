#include "brokerflow/executor/event_buffer.hpp"

#include <algorithm>
#include <utility>

namespace brokerflow {

auto EventBuffer::put(const TaskInstanceKey &key, TaskEvent event) -> void {
  events_.insert_or_assign(key, std::move(event));
}

auto EventBuffer::drain() -> EventMap {
  EventMap out;
  out.swap(events_);
  return out;
}

auto EventBuffer::drain(std::span<const WorkflowId> workflow_ids) -> EventMap {
  EventMap out;
  EventMap kept;
  for (auto &[key, event] : events_) {
    if (std::ranges::find(workflow_ids, key.workflow_id()) !=
        workflow_ids.end()) {
      out.emplace(key, std::move(event));
    } else {
      kept.emplace(key, std::move(event));
    }
  }
  events_.swap(kept);
  return out;
}

auto EventBuffer::find(const TaskInstanceKey &key) const
    -> std::optional<TaskEvent> {
  if (auto it = events_.find(key); it != events_.end()) {
    return it->second;
  }
  return std::nullopt;
}

} // namespace brokerflow
