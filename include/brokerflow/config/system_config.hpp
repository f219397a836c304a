#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace brokerflow {

struct BrokerConfig {
  std::string broker_url{"memory://"};
  std::string result_backend{"memory://"};
  std::size_t worker_concurrency{4};

  auto operator==(const BrokerConfig &) const -> bool = default;
};

struct ExecutorConfig {
  std::size_t parallelism{32}; // 0 = unlimited
  std::map<std::string, std::size_t, std::less<>> queue_parallelism;
  std::size_t sync_parallelism{4};
  std::size_t max_dispatch_failures{5};
  std::chrono::milliseconds poll_timeout{std::chrono::seconds(5)};
  std::chrono::seconds shutdown_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds shutdown_grace{std::chrono::milliseconds(500)};
  std::chrono::milliseconds shutdown_poll_interval{
      std::chrono::milliseconds(100)};

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct SystemConfig {
  BrokerConfig broker;
  ExecutorConfig executor;
  LoggingConfig logging;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace brokerflow
