#pragma once

#include "brokerflow/util/enum.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace brokerflow::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error };
BOOST_DESCRIBE_ENUM(Level, Debug, Info, Warn, Error)

} // namespace brokerflow::log

namespace brokerflow {
BROKERFLOW_DEFINE_ENUM_SERDE(log::Level, log::Level::Info)
} // namespace brokerflow

namespace brokerflow::log {

/// Observer invoked synchronously with every record that passes the level
/// filter. Tests use it to assert on executor diagnostics.
using CaptureFn = std::function<void(Level level, std::string_view message)>;

// Records are formatted on the calling thread and handed to one writer thread
// through a concurrent_channel. Before start() and after stop() records are
// written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex out_mu_;
  FILE *out_{stderr};
  FILE *owned_file_{nullptr};

  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;

  std::mutex capture_mu_;
  CaptureFn capture_;

  [[nodiscard]] static auto colour_for(Level level) noexcept
      -> std::string_view {
    switch (level) {
    case Level::Debug:
      return "\033[36m";
    case Level::Info:
      return "\033[32m";
    case Level::Warn:
      return "\033[33m";
    case Level::Error:
      return "\033[31m";
    }
    return "";
  }

  // Caller holds out_mu_.
  auto emit(const std::string &line) -> void {
    std::fwrite(line.data(), 1, line.size(), out_);
  }

  static auto try_take(Channel &channel) -> std::optional<std::string> {
    std::optional<std::string> item;
    channel.try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            item = std::move(line);
          }
        });
    return item;
  }

  auto writer_loop(std::shared_ptr<Channel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    for (;;) {
      std::optional<std::string> first;
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (!ec) {
              first = std::move(line);
            }
          });
      writer_ctx_.restart();
      writer_ctx_.run_one();
      if (!first) {
        break; // channel closed by stop()
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < kBatchSize) {
        auto next = try_take(*channel);
        if (!next) {
          break;
        }
        batch.push_back(std::move(*next));
      }

      std::scoped_lock lock(out_mu_);
      for (const auto &line : batch) {
        emit(line);
      }
      std::fflush(out_);
    }

    std::scoped_lock lock(out_mu_);
    while (auto rest = try_take(*channel)) {
      emit(*rest);
    }
    std::fflush(out_);
  }

  [[nodiscard]] auto format_line(Level level, std::string_view message)
      -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    bool tty = false;
    {
      std::scoped_lock lock(out_mu_);
      tty = ::isatty(::fileno(out_)) != 0;
    }
    if (tty) {
      return std::format("{:%H:%M:%S} {}{:<5}\033[0m [{:05}] {}\n", now,
                         colour_for(level), to_string_view(level), tid,
                         message);
    }
    return std::format("{:%Y-%m-%dT%H:%M:%SZ} {:<5} [{:05}] {}\n", now,
                       to_string_view(level), tid, message);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owned_file_) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    writer_ctx_.restart();
    auto channel =
        std::make_shared<Channel>(writer_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
    if (auto n = dropped_.exchange(0); n > 0) {
      std::scoped_lock lock(out_mu_);
      emit(std::format("{} log records dropped while the writer was busy\n",
                       n));
      std::fflush(out_);
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(out_mu_);
    out_ = stderr;
    if (owned_file_) {
      std::fclose(owned_file_);
      owned_file_ = nullptr;
    }
  }

  /// Appends to `path`. Returns false, keeping the current output, when the
  /// file cannot be opened.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stderr();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::scoped_lock lock(out_mu_);
    if (owned_file_) {
      std::fclose(owned_file_);
    }
    owned_file_ = f;
    out_ = f;
    return true;
  }

  auto set_capture(CaptureFn fn) -> void {
    std::scoped_lock lock(capture_mu_);
    capture_ = std::move(fn);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    const auto message = std::format(fmt, std::forward<Args>(args)...);
    {
      std::scoped_lock lock(capture_mu_);
      if (capture_) {
        capture_(level, message);
      }
    }

    auto line = format_line(level, message);
    if (auto channel = channel_.load(std::memory_order_acquire)) {
      // Never block a dispatch or poll thread on a slow sink.
      if (!channel->try_send(boost::system::error_code{}, std::move(line))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
      }
      return;
    }
    std::scoped_lock lock(out_mu_);
    emit(line);
    std::fflush(out_);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

/// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse<Level>(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto set_capture(CaptureFn fn) -> void {
  logger().set_capture(std::move(fn));
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace brokerflow::log
