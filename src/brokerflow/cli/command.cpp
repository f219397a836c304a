#include "brokerflow/cli/commands.hpp"
#include "brokerflow/cli/formatting.hpp"
#include "brokerflow/executor/command.hpp"
#include "brokerflow/util/log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <chrono>
#include <print>

namespace brokerflow::cli {

auto parse_execution_date_arg(std::string_view value)
    -> std::optional<LogicalTime> {
  if (value.empty() || value == "now") {
    return std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
  }
  return parse_logical_timestamp(value);
}

auto split_command_line(std::string_view line) -> std::vector<std::string> {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, line, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  std::erase_if(parts, [](const std::string &p) { return p.empty(); });
  return parts;
}

auto cmd_command(const CommandOptions &opts) -> int {
  log::set_output_stderr();

  auto when = parse_execution_date_arg(opts.execution_date);
  if (!when) {
    std::println(stderr, "Error: invalid execution date '{}'",
                 opts.execution_date);
    return 1;
  }
  if (opts.attempt < 1) {
    std::println(stderr, "Error: attempt must be >= 1");
    return 1;
  }

  const TaskInstanceKey key{WorkflowId{opts.workflow_id},
                            TaskId{opts.task_id}, *when, opts.attempt};
  ExecutionContext ctx{};
  ctx.runner = opts.runner;
  ctx.raw = opts.raw;
  ctx.mark_success = opts.mark_success;
  ctx.ignore_all_dependencies = opts.ignore_all_dependencies;
  ctx.ignore_dependencies = opts.ignore_dependencies;
  ctx.ignore_depends_on_past = opts.ignore_depends_on_past;
  ctx.force = opts.force;
  ctx.pool = opts.pool;
  ctx.subdir = opts.subdir;
  ctx.cfg_path = opts.cfg_path;

  const auto command = CommandBuilder::build(key, ctx);

  if (opts.json) {
    fmt::JsonValue args = std::vector<fmt::JsonValue>{};
    for (const auto &arg : command) {
      args.get_array().emplace_back(arg);
    }
    fmt::JsonValue obj{
        {"key", key.to_string()},
        {"command", std::move(args)},
    };
    std::println("{}", fmt::to_json_text(obj));
    return 0;
  }

  for (std::size_t i = 0; i < command.size(); ++i) {
    std::print("{}{}", i == 0 ? "" : " ", command[i]);
  }
  std::println("");
  return 0;
}

} // namespace brokerflow::cli
