#pragma once

#include "brokerflow/util/id.hpp"

#include <boost/container_hash/hash.hpp>

#include <chrono>
#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace brokerflow {

using LogicalTime = std::chrono::system_clock::time_point;

/// Whole-second UTC rendering, "2024-01-01T00:00:00Z". This is the form task
/// runners receive on their command line.
[[nodiscard]] auto format_logical_timestamp(LogicalTime tp) -> std::string;

/// Accepts "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] auto parse_logical_timestamp(std::string_view text)
    -> std::optional<LogicalTime>;

/// Identity of one attempt of one task instance. Immutable; used as the map
/// key across the executor.
class TaskInstanceKey {
public:
  using time_point = LogicalTime;

  TaskInstanceKey(WorkflowId workflow_id, TaskId task_id,
                  time_point logical_timestamp, int attempt = 1)
      : workflow_id_(std::move(workflow_id)), task_id_(std::move(task_id)),
        logical_timestamp_(logical_timestamp), attempt_(attempt) {}

  [[nodiscard]] auto workflow_id() const noexcept -> const WorkflowId & {
    return workflow_id_;
  }
  [[nodiscard]] auto task_id() const noexcept -> const TaskId & {
    return task_id_;
  }
  [[nodiscard]] auto logical_timestamp() const noexcept -> time_point {
    return logical_timestamp_;
  }
  [[nodiscard]] auto attempt() const noexcept -> int { return attempt_; }

  [[nodiscard]] friend auto operator<=>(const TaskInstanceKey &,
                                        const TaskInstanceKey &) = default;
  [[nodiscard]] friend auto operator==(const TaskInstanceKey &,
                                       const TaskInstanceKey &)
      -> bool = default;

  /// "workflow.task@2024-01-01T00:00:00Z#1"
  [[nodiscard]] auto to_string() const -> std::string;

private:
  WorkflowId workflow_id_;
  TaskId task_id_;
  time_point logical_timestamp_;
  int attempt_{1};
};

} // namespace brokerflow

template <> struct std::hash<brokerflow::TaskInstanceKey> {
  auto operator()(const brokerflow::TaskInstanceKey &key) const noexcept
      -> std::size_t {
    std::size_t seed = 0;
    boost::hash_combine(seed, std::hash<std::string_view>{}(
                                  key.workflow_id().value()));
    boost::hash_combine(seed,
                        std::hash<std::string_view>{}(key.task_id().value()));
    boost::hash_combine(seed, key.logical_timestamp().time_since_epoch().count());
    boost::hash_combine(seed, key.attempt());
    return seed;
  }
};

template <>
struct std::formatter<brokerflow::TaskInstanceKey>
    : std::formatter<std::string_view> {
  auto format(const brokerflow::TaskInstanceKey &key, auto &ctx) const {
    return std::formatter<std::string_view>::format(key.to_string(), ctx);
  }
};
