#include "brokerflow/cli/commands.hpp"
#include "brokerflow/cli/formatting.hpp"
#include "brokerflow/config/config.hpp"
#include "brokerflow/util/log.hpp"

#include <cstdint>
#include <print>

namespace brokerflow::cli {

auto cmd_config(const ConfigOptions &opts) -> int {
  log::set_output_stderr();

  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  const auto &cfg = *config_res;
  const auto &ex = cfg.executor;

  if (opts.json) {
    fmt::JsonValue queues = fmt::JsonValue::object_t{};
    for (const auto &[name, limit] : ex.queue_parallelism) {
      queues.get_object().emplace(name, static_cast<std::int64_t>(limit));
    }
    fmt::JsonValue obj{
        {"broker_url", cfg.broker.broker_url},
        {"result_backend", cfg.broker.result_backend},
        {"worker_concurrency",
         static_cast<std::int64_t>(cfg.broker.worker_concurrency)},
        {"parallelism", static_cast<std::int64_t>(ex.parallelism)},
        {"queue_parallelism", std::move(queues)},
        {"sync_parallelism", static_cast<std::int64_t>(ex.sync_parallelism)},
        {"max_dispatch_failures",
         static_cast<std::int64_t>(ex.max_dispatch_failures)},
        {"poll_timeout_ms", static_cast<std::int64_t>(ex.poll_timeout.count())},
        {"shutdown_timeout_sec",
         static_cast<std::int64_t>(ex.shutdown_timeout.count())},
        {"log_level", cfg.logging.level},
    };
    std::println("{}", fmt::to_json_text(obj));
    return 0;
  }

  std::println("{}", fmt::styled(fmt::Style::Bold, "[broker]"));
  std::println("{}", fmt::kv("broker_url", cfg.broker.broker_url));
  std::println("{}", fmt::kv("result_backend", cfg.broker.result_backend));
  std::println("{}", fmt::kv("worker_concurrency",
                             std::to_string(cfg.broker.worker_concurrency)));
  std::println("{}", fmt::styled(fmt::Style::Bold, "[executor]"));
  std::println("{}", fmt::kv("parallelism", fmt::budget_text(ex.parallelism)));
  for (const auto &[name, limit] : ex.queue_parallelism) {
    std::println("{}", fmt::kv(std::format("queue '{}'", name),
                               fmt::budget_text(limit)));
  }
  std::println("{}",
               fmt::kv("sync_parallelism", std::to_string(ex.sync_parallelism)));
  std::println("{}", fmt::kv("max_dispatch_failures",
                             std::to_string(ex.max_dispatch_failures)));
  std::println("{}", fmt::kv("poll_timeout",
                             std::format("{}ms", ex.poll_timeout.count())));
  std::println("{}", fmt::kv("shutdown_timeout",
                             std::format("{}s", ex.shutdown_timeout.count())));
  std::println("{}", fmt::styled(fmt::Style::Bold, "[logging]"));
  std::println("{}", fmt::kv("level", cfg.logging.level));
  std::println("{}", fmt::kv("file", cfg.logging.file.empty()
                                         ? std::string("<stderr>")
                                         : cfg.logging.file));
  std::println("{}",
               fmt::styled(fmt::Style::Good, "configuration is valid"));
  return 0;
}

} // namespace brokerflow::cli
