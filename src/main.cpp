#include "brokerflow/cli/commands.hpp"
#include "brokerflow/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("BROKERFLOW_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep CLI output clean by default.
  brokerflow::log::set_output_stderr();
  brokerflow::log::set_level(brokerflow::log::Level::Warn);

  CLI::App app{"brokerflow", "Broker-backed task executor"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  brokerflow run 'sleep 1' 'echo hello'\n"
             "  brokerflow command my_workflow extract -e 2024-01-01\n"
             "  brokerflow config -c brokerflow.toml\n"
             "\nTip: Set BROKERFLOW_CONFIG=brokerflow.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  brokerflow::cli::RunOptions run_opts;
  auto *run = app.add_subcommand(
      "run", "Dispatch commands through the executor and wait for outcomes");
  run->footer("\nExamples:\n"
              "  brokerflow run 'true' 'false'\n"
              "  brokerflow run -c brokerflow.toml --queue etl 'sleep 2'\n"
              "  brokerflow run --json 'echo hi'");
  run_opts.config_file = env_config;
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("commands", run_opts.commands,
                  "Commands to run, one quoted argument each")
      ->required();
  run->add_option("-w,--workflow", run_opts.workflow_id,
                  "Workflow id used in task keys (default: cli)");
  run->add_option("-q,--queue", run_opts.queue_name,
                  "Broker queue name (default: default)");
  run->add_option("--heartbeat-ms", run_opts.heartbeat_ms,
                  "Milliseconds between heartbeats (default: 100)")
      ->check(CLI::PositiveNumber);
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Seconds to wait for all commands (default: 300)")
      ->check(CLI::PositiveNumber);
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: debug|info|warn|error");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(brokerflow::cli::cmd_run(run_opts)); });

  brokerflow::cli::CommandOptions command_opts;
  auto *command = app.add_subcommand(
      "command", "Print the task runner command for a task instance");
  command->add_option("workflow_id", command_opts.workflow_id, "Workflow ID")
      ->required();
  command->add_option("task_id", command_opts.task_id, "Task ID")->required();
  command->add_option("-e,--execution-date", command_opts.execution_date,
                      "Logical timestamp (ISO8601, YYYY-MM-DD or 'now')");
  command->add_option("-a,--attempt", command_opts.attempt,
                      "Attempt number (default: 1)")
      ->check(CLI::PositiveNumber);
  command->add_option("--runner", command_opts.runner,
                      "Task runner executable");
  command->add_flag("--raw", command_opts.raw, "Run without wrapper");
  command->add_flag("--mark-success", command_opts.mark_success,
                    "Mark the task succeeded without running it");
  command->add_flag("--ignore-all-dependencies",
                    command_opts.ignore_all_dependencies,
                    "Ignore every dependency check");
  command->add_flag("--ignore-dependencies", command_opts.ignore_dependencies,
                    "Ignore task-specific dependencies");
  command->add_flag("--ignore-depends-on-past",
                    command_opts.ignore_depends_on_past,
                    "Ignore depends-on-past checks");
  command->add_flag("--force", command_opts.force,
                    "Run even if already succeeded");
  command->add_option("--pool", command_opts.pool, "Resource pool");
  command->add_option("--subdir", command_opts.subdir,
                      "Workflow definition directory");
  command->add_option("--cfg-path", command_opts.cfg_path,
                      "Configuration file for the task runner");
  command->add_flag("--json", command_opts.json, "Output JSON");
  command->callback([&command_opts]() {
    std::exit(brokerflow::cli::cmd_command(command_opts));
  });

  brokerflow::cli::ConfigOptions config_opts;
  auto *config = app.add_subcommand(
      "config", "Validate a configuration file and print effective values");
  config_opts.config_file = env_config;
  auto *config_cfg =
      config
          ->add_option("-c,--config", config_opts.config_file,
                       "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    config_cfg->required();
  config->add_flag("--json", config_opts.json, "Output JSON");
  config->callback([&config_opts]() {
    std::exit(brokerflow::cli::cmd_config(config_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
