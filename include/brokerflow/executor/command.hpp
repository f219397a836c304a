#pragma once

#include "brokerflow/executor/task_instance_key.hpp"

#include <optional>
#include <string>
#include <vector>

namespace brokerflow {

/// Ordered argv handed to the task runner. Opaque to the executor.
using Command = std::vector<std::string>;

/// Per-dispatch options that shape the task runner invocation.
struct ExecutionContext {
  std::string runner{"brokerflow-task"};
  bool local{true};
  bool raw{false};
  bool mark_success{false};
  bool ignore_all_dependencies{false};
  bool ignore_dependencies{false};
  bool ignore_depends_on_past{false};
  bool force{false};
  std::optional<std::string> pool;
  std::optional<std::string> subdir;
  std::optional<std::string> cfg_path;

  auto operator==(const ExecutionContext &) const -> bool = default;
};

class CommandBuilder {
public:
  /// Pure and deterministic: equal inputs yield byte-identical commands.
  [[nodiscard]] static auto build(const TaskInstanceKey &key,
                                  const ExecutionContext &ctx) -> Command;

  /// Space-joined rendering for log lines.
  [[nodiscard]] static auto preview(const Command &command) -> std::string;
};

} // namespace brokerflow
