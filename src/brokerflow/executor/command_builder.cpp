#include "brokerflow/executor/command.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace brokerflow {

namespace {

inline constexpr std::size_t kPreviewLimit = 120;

auto append_option(Command &cmd, std::string_view flag,
                   const std::optional<std::string> &value) -> void {
  if (value && !value->empty()) {
    cmd.emplace_back(flag);
    cmd.push_back(*value);
  }
}

auto append_flag(Command &cmd, std::string_view flag, bool enabled) -> void {
  if (enabled) {
    cmd.emplace_back(flag);
  }
}

} // namespace

auto CommandBuilder::build(const TaskInstanceKey &key,
                           const ExecutionContext &ctx) -> Command {
  Command cmd;
  cmd.reserve(16);
  cmd.push_back(ctx.runner);
  cmd.emplace_back("run");
  cmd.push_back(key.workflow_id().str());
  cmd.push_back(key.task_id().str());
  cmd.push_back(format_logical_timestamp(key.logical_timestamp()));
  cmd.emplace_back("--attempt");
  cmd.push_back(std::format("{}", key.attempt()));

  append_flag(cmd, "--local", ctx.local);
  append_flag(cmd, "--raw", ctx.raw);
  append_flag(cmd, "--mark-success", ctx.mark_success);
  append_flag(cmd, "--ignore-all-dependencies", ctx.ignore_all_dependencies);
  append_flag(cmd, "--ignore-dependencies", ctx.ignore_dependencies);
  append_flag(cmd, "--ignore-depends-on-past", ctx.ignore_depends_on_past);
  append_flag(cmd, "--force", ctx.force);
  append_option(cmd, "--pool", ctx.pool);
  append_option(cmd, "--subdir", ctx.subdir);
  append_option(cmd, "--cfg-path", ctx.cfg_path);
  return cmd;
}

auto CommandBuilder::preview(const Command &command) -> std::string {
  std::string out;
  for (const auto &arg : command) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(arg);
    if (out.size() > kPreviewLimit) {
      out.resize(kPreviewLimit);
      out.append("...");
      break;
    }
  }
  return out;
}

} // namespace brokerflow
