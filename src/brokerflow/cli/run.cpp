#include "brokerflow/cli/commands.hpp"
#include "brokerflow/cli/formatting.hpp"
#include "brokerflow/config/config.hpp"
#include "brokerflow/executor/distributed_executor.hpp"
#include "brokerflow/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <print>
#include <thread>
#include <vector>

namespace brokerflow::cli {

namespace {

struct RunOutcome {
  TaskInstanceKey key;
  std::string command;
  std::optional<TaskEvent> event;
};

auto load_config(const RunOptions &opts) -> Result<SystemConfig> {
  if (opts.config_file.empty()) {
    return ok(SystemConfig{});
  }
  return ConfigLoader::load_from_file(opts.config_file);
}

auto print_outcomes(const std::vector<RunOutcome> &outcomes, bool json)
    -> void {
  if (json) {
    fmt::JsonValue arr = std::vector<fmt::JsonValue>{};
    for (const auto &o : outcomes) {
      fmt::JsonValue obj{
          {"key", o.key.to_string()},
          {"command", o.command},
          {"outcome", o.event ? std::string(to_string_view(o.event->outcome))
                              : std::string("unknown")},
      };
      if (o.event && o.event->info) {
        obj.get_object().emplace("info", *o.event->info);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    std::println("{}", fmt::to_json_text(arr));
    return;
  }

  for (const auto &o : outcomes) {
    std::println("{:<10} {} {}", fmt::outcome_badge(o.event),
                 fmt::styled(fmt::Style::Bold, o.key.task_id().str()),
                 fmt::styled(fmt::Style::Dim, o.command));
    if (o.event && o.event->info) {
      std::println("           {}", *o.event->info);
    }
  }
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();
  if (opts.log_level) {
    log::set_level(*opts.log_level);
  }

  if (opts.commands.empty()) {
    std::println(stderr, "Error: no commands given");
    return 1;
  }

  auto config = load_config(opts);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  if (!opts.log_level && !opts.config_file.empty()) {
    log::set_level(config->logging.level);
  }
  if (!config->logging.file.empty() &&
      !log::set_output_file(config->logging.file)) {
    std::println(stderr, "Error: cannot open log file {}",
                 config->logging.file);
    return 1;
  }
  log::start();
  struct LoggerGuard {
    ~LoggerGuard() { log::stop(); }
  } logger_guard;

  auto executor_res = create_distributed_executor(*config);
  if (!executor_res) {
    std::println(stderr, "Error: {}", executor_res.error().message());
    return 1;
  }
  auto &executor = **executor_res;

  const auto when = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  std::vector<RunOutcome> outcomes;
  outcomes.reserve(opts.commands.size());

  for (std::size_t i = 0; i < opts.commands.size(); ++i) {
    auto command = split_command_line(opts.commands[i]);
    if (command.empty()) {
      std::println(stderr, "Error: command #{} is empty", i + 1);
      executor.shutdown(false);
      return 1;
    }
    TaskInstanceKey key{WorkflowId{opts.workflow_id},
                        TaskId{std::format("task_{}", i + 1)}, when};
    if (auto r = executor.queue(key, std::move(command), opts.queue_name, 0);
        !r) {
      std::println(stderr, "Error: cannot queue '{}': {}", opts.commands[i],
                   r.error().message());
      executor.shutdown(false);
      return 1;
    }
    outcomes.push_back(RunOutcome{.key = std::move(key),
                                  .command = opts.commands[i],
                                  .event = std::nullopt});
  }

  const auto interval = std::chrono::milliseconds(std::max(1, opts.heartbeat_ms));
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(opts.timeout_sec);
  bool fatal = false;
  bool timed_out = false;

  while (executor.pending_count() + executor.running_count() > 0) {
    if (auto r = executor.heartbeat(); !r) {
      std::println(stderr, "Error: executor heartbeat failed: {}",
                   r.error().message());
      fatal = true;
      break;
    }
    if (executor.pending_count() + executor.running_count() == 0) {
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
      break;
    }
    std::this_thread::sleep_for(interval);
  }

  auto events = executor.drain_events();
  executor.shutdown(!fatal && !timed_out);

  bool any_failed = fatal || timed_out;
  for (auto &o : outcomes) {
    if (auto it = events.find(o.key); it != events.end()) {
      o.event = it->second;
    }
    if (!o.event || o.event->outcome != Outcome::Success) {
      any_failed = true;
    }
  }

  print_outcomes(outcomes, opts.json);
  if (timed_out) {
    std::println(stderr, "Error: timed out after {}s", opts.timeout_sec);
  }
  return any_failed ? 1 : 0;
}

} // namespace brokerflow::cli
