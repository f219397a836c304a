#pragma once

#include "brokerflow/executor/task_instance_key.hpp"
#include "brokerflow/util/enum.hpp"
#include "brokerflow/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace brokerflow {

enum class Outcome : std::uint8_t {
  Success,
  Failed,
};
BOOST_DESCRIBE_ENUM(Outcome, Success, Failed)
BROKERFLOW_DEFINE_ENUM_SERDE(Outcome, Outcome::Failed)

struct TaskEvent {
  Outcome outcome{Outcome::Failed};
  std::optional<std::string> info;

  auto operator==(const TaskEvent &) const -> bool = default;
};

using EventMap = ankerl::unordered_dense::map<TaskInstanceKey, TaskEvent>;

/// Terminal outcomes waiting for the scheduler. Not synchronized; the owning
/// executor serializes access under its state lock.
class EventBuffer {
public:
  /// Later writes for the same key replace earlier ones.
  auto put(const TaskInstanceKey &key, TaskEvent event) -> void;

  [[nodiscard]] auto drain() -> EventMap;
  [[nodiscard]] auto drain(std::span<const WorkflowId> workflow_ids)
      -> EventMap;

  [[nodiscard]] auto find(const TaskInstanceKey &key) const
      -> std::optional<TaskEvent>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return events_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return events_.empty(); }

private:
  EventMap events_;
};

} // namespace brokerflow
