#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brokerflow::cli {

struct RunOptions {
  std::string config_file;
  std::vector<std::string> commands; // one shell-style command per entry
  std::string workflow_id{"cli"};
  std::string queue_name{"default"};
  int heartbeat_ms{100};
  int timeout_sec{300};
  std::optional<std::string> log_level;
  bool json{false};
};

struct CommandOptions {
  std::string workflow_id;
  std::string task_id;
  std::string execution_date;
  int attempt{1};
  std::string runner{"brokerflow-task"};
  bool raw{false};
  bool mark_success{false};
  bool ignore_all_dependencies{false};
  bool ignore_dependencies{false};
  bool ignore_depends_on_past{false};
  bool force{false};
  std::optional<std::string> pool;
  std::optional<std::string> subdir;
  std::optional<std::string> cfg_path;
  bool json{false};
};

struct ConfigOptions {
  std::string config_file;
  bool json{false};
};

/// Accepts "now", "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] auto parse_execution_date_arg(std::string_view value)
    -> std::optional<std::chrono::system_clock::time_point>;

/// Split a command line on whitespace. No quoting support.
[[nodiscard]] auto split_command_line(std::string_view line)
    -> std::vector<std::string>;

[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_command(const CommandOptions &opts) -> int;
[[nodiscard]] auto cmd_config(const ConfigOptions &opts) -> int;

} // namespace brokerflow::cli
