#include "brokerflow/config/config.hpp"
#include "brokerflow/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <string_view>

namespace brokerflow {
namespace detail {

struct BrokerToml {
  std::string broker_url{"memory://"};
  std::string result_backend{"memory://"};
  std::int64_t worker_concurrency{4};
};

struct ExecutorToml {
  std::int64_t parallelism{32};
  std::map<std::string, std::int64_t> queue_parallelism;
  std::int64_t sync_parallelism{4};
  std::int64_t max_dispatch_failures{5};
  std::int64_t poll_timeout_ms{5000};
  std::int64_t shutdown_timeout_sec{60};
  std::int64_t shutdown_grace_ms{500};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  BrokerToml broker{};
  ExecutorToml executor{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace brokerflow

namespace glz {
template <> struct meta<brokerflow::detail::BrokerToml> {
  using T = brokerflow::detail::BrokerToml;
  static constexpr auto value =
      object("broker_url", &T::broker_url, "result_backend",
             &T::result_backend, "worker_concurrency", &T::worker_concurrency);
};

template <> struct meta<brokerflow::detail::ExecutorToml> {
  using T = brokerflow::detail::ExecutorToml;
  static constexpr auto value = object(
      "parallelism", &T::parallelism, "queue_parallelism",
      &T::queue_parallelism, "sync_parallelism", &T::sync_parallelism,
      "max_dispatch_failures", &T::max_dispatch_failures, "poll_timeout_ms",
      &T::poll_timeout_ms, "shutdown_timeout_sec", &T::shutdown_timeout_sec,
      "shutdown_grace_ms", &T::shutdown_grace_ms);
};

template <> struct meta<brokerflow::detail::LoggingToml> {
  using T = brokerflow::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<brokerflow::detail::SystemToml> {
  using T = brokerflow::detail::SystemToml;
  static constexpr auto value = object("broker", &T::broker, "executor",
                                       &T::executor, "logging", &T::logging);
};
} // namespace glz

namespace brokerflow {
namespace {

template <typename T>
auto override_from_env(const char *name, T &target) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    target = boost::lexical_cast<T>(v);
  }
}

// Negative counts are rejected by validate(); keep the sign until then.
[[nodiscard]] auto to_count(std::int64_t v) -> std::size_t {
  return v < 0 ? static_cast<std::size_t>(-1) : static_cast<std::size_t>(v);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  // Sections and keys brokerflow does not know are ignored, so one file can
  // also carry settings for the scheduler that embeds the executor.
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  detail::SystemToml raw{};
  if (auto ec = glz::read<kOpts>(raw, toml_text); ec) {
    log::error("TOML parse error: {}", glz::format_error(ec, toml_text));
    return fail(Error::ParseError);
  }

  override_from_env("BROKERFLOW_BROKER_URL", raw.broker.broker_url);
  override_from_env("BROKERFLOW_RESULT_BACKEND", raw.broker.result_backend);
  override_from_env("BROKERFLOW_WORKER_CONCURRENCY",
                    raw.broker.worker_concurrency);
  override_from_env("BROKERFLOW_PARALLELISM", raw.executor.parallelism);
  override_from_env("BROKERFLOW_SYNC_PARALLELISM",
                    raw.executor.sync_parallelism);
  override_from_env("BROKERFLOW_MAX_DISPATCH_FAILURES",
                    raw.executor.max_dispatch_failures);
  override_from_env("BROKERFLOW_POLL_TIMEOUT_MS",
                    raw.executor.poll_timeout_ms);
  override_from_env("BROKERFLOW_SHUTDOWN_TIMEOUT_SEC",
                    raw.executor.shutdown_timeout_sec);
  override_from_env("BROKERFLOW_LOG_LEVEL", raw.logging.level);
  override_from_env("BROKERFLOW_LOG_FILE", raw.logging.file);

  const bool any_negative =
      raw.broker.worker_concurrency < 0 || raw.executor.parallelism < 0 ||
      raw.executor.sync_parallelism < 0 ||
      raw.executor.max_dispatch_failures < 0 ||
      raw.executor.poll_timeout_ms < 0 ||
      raw.executor.shutdown_timeout_sec < 0 ||
      raw.executor.shutdown_grace_ms < 0;
  if (any_negative) {
    log::error("configuration contains negative counts or durations");
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.broker.broker_url = std::move(raw.broker.broker_url);
  cfg.broker.result_backend = std::move(raw.broker.result_backend);
  cfg.broker.worker_concurrency = to_count(raw.broker.worker_concurrency);

  cfg.executor.parallelism = to_count(raw.executor.parallelism);
  for (const auto &[queue, limit] : raw.executor.queue_parallelism) {
    if (limit < 0) {
      log::error("queue '{}' has negative parallelism {}", queue, limit);
      return fail(Error::ParseError);
    }
    cfg.executor.queue_parallelism.emplace(queue, to_count(limit));
  }
  cfg.executor.sync_parallelism = to_count(raw.executor.sync_parallelism);
  cfg.executor.max_dispatch_failures =
      to_count(raw.executor.max_dispatch_failures);
  cfg.executor.poll_timeout =
      std::chrono::milliseconds(raw.executor.poll_timeout_ms);
  cfg.executor.shutdown_timeout =
      std::chrono::seconds(raw.executor.shutdown_timeout_sec);
  cfg.executor.shutdown_grace =
      std::chrono::milliseconds(raw.executor.shutdown_grace_ms);

  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &config) -> Result<void> {
  if (config.broker.broker_url.empty()) {
    log::error("broker.broker_url must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.broker.worker_concurrency == 0 ||
      config.executor.sync_parallelism == 0 ||
      config.executor.max_dispatch_failures == 0) {
    log::error("worker_concurrency, sync_parallelism and "
               "max_dispatch_failures must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.executor.poll_timeout <= std::chrono::milliseconds::zero()) {
    log::error("executor.poll_timeout_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    log::error("cannot read configuration file '{}'", path);
    return fail(Error::FileNotFound);
  }
  const std::string text{std::istreambuf_iterator<char>(in),
                         std::istreambuf_iterator<char>()};
  return load_from_string(text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("invalid environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("failed to parse configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace brokerflow
