#pragma once

#include "brokerflow/broker/message_broker.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace brokerflow {

/// In-process broker and result backend. Submitted commands run as child
/// processes on a fixed pool of worker threads; exit code 0 is SUCCESS,
/// anything else FAILURE.
class MemoryBroker final : public MessageBroker {
public:
  explicit MemoryBroker(std::size_t worker_concurrency = 4);
  ~MemoryBroker() override;

  MemoryBroker(const MemoryBroker &) = delete;
  auto operator=(const MemoryBroker &) -> MemoryBroker & = delete;

  [[nodiscard]] auto submit(const Command &command,
                            std::string_view queue_name)
      -> Result<TaskToken> override;
  [[nodiscard]] auto fetch_state(const TaskToken &token)
      -> task<std::string> override;
  auto revoke(const TaskToken &token) -> void override;
  auto forget(const TaskToken &token) -> void override;
  auto close() -> void override;

  /// Records still held, including forgotten ones whose process has not
  /// exited yet.
  [[nodiscard]] auto tracked_count() const -> std::size_t;

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
  }

private:
  struct Entry {
    StateRecord record;
    std::string queue_name;
    pid_t pid{-1}; // set only while the child is alive and unreaped
    bool forgotten{false};
  };

  auto execute(TaskToken token, Command command) -> void;
  auto finish(const TaskToken &token, StateRecord record) -> void;

  std::atomic<bool> closed_{false};
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<TaskToken, Entry> entries_;
  std::uint64_t next_id_{1};
  boost::asio::thread_pool workers_;
};

} // namespace brokerflow
