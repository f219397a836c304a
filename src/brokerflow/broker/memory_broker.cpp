#include "brokerflow/broker/memory_broker.hpp"
#include "brokerflow/executor/command.hpp"
#include "brokerflow/util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <cerrno>
#include <csignal>
#include <exception>
#include <filesystem>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <sys/wait.h>

namespace brokerflow {

namespace {

namespace bp = boost::process::v2;

[[nodiscard]] auto resolve_executable(const std::string &program)
    -> std::filesystem::path {
  if (program.find('/') != std::string::npos) {
    return program;
  }
  return bp::environment::find_executable(program);
}

// Blocks until `pid` exits but leaves it a zombie, so the pid cannot be
// recycled while a revoke() might still signal it.
auto wait_exited(pid_t pid) -> void {
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) ==
             -1 &&
         errno == EINTR) {
  }
}

} // namespace

MemoryBroker::MemoryBroker(std::size_t worker_concurrency)
    : workers_(worker_concurrency == 0 ? 1 : worker_concurrency) {}

MemoryBroker::~MemoryBroker() { close(); }

auto MemoryBroker::submit(const Command &command, std::string_view queue_name)
    -> Result<TaskToken> {
  if (is_closed()) {
    return fail(Error::BrokerUnavailable);
  }
  if (command.empty()) {
    return fail(Error::InvalidArgument);
  }

  TaskToken token;
  {
    std::scoped_lock lock(mu_);
    token = TaskToken{std::format("mem-{:08}", next_id_++)};
    entries_.emplace(
        token,
        Entry{.record = StateRecord{.state = std::string(broker_state::kPending)},
              .queue_name = std::string(queue_name)});
  }

  boost::asio::post(workers_, [this, token, command] {
    execute(token, command);
  });
  log::debug("memory broker accepted {} on queue '{}': {}", token, queue_name,
             CommandBuilder::preview(command));
  return ok(std::move(token));
}

auto MemoryBroker::execute(TaskToken token, Command command) -> void {
  {
    std::scoped_lock lock(mu_);
    auto it = entries_.find(token);
    if (it == entries_.end()) {
      return;
    }
    if (is_closed() || it->second.record.state == broker_state::kRevoked) {
      if (it->second.forgotten) {
        entries_.erase(it);
      }
      return;
    }
    it->second.record.state = std::string(broker_state::kStarted);
  }

  const auto exe = resolve_executable(command.front());
  if (exe.empty()) {
    finish(token, StateRecord{.state = std::string(broker_state::kFailure),
                              .detail = std::format("executable not found: {}",
                                                    command.front())});
    return;
  }

  std::vector<std::string> args(command.begin() + 1, command.end());
  try {
    bp::process proc(
        workers_.get_executor(), exe, args,
        bp::process_stdio{.in = nullptr, .out = nullptr, .err = nullptr});
    {
      std::scoped_lock lock(mu_);
      auto it = entries_.find(token);
      // Revoked or closed between STARTED and spawn: nobody else will
      // signal this child.
      if (it == entries_.end() || is_closed() ||
          it->second.record.state == broker_state::kRevoked) {
        (void)::kill(proc.id(), SIGKILL);
      } else {
        it->second.pid = proc.id();
      }
    }
    wait_exited(proc.id());
    {
      std::scoped_lock lock(mu_);
      if (auto it = entries_.find(token); it != entries_.end()) {
        it->second.pid = -1;
      }
    }
    const int exit_code = proc.wait();
    if (exit_code == 0) {
      finish(token, StateRecord{.state = std::string(broker_state::kSuccess),
                                .exit_code = exit_code});
    } else {
      finish(token, StateRecord{.state = std::string(broker_state::kFailure),
                                .detail = "command exited with error",
                                .exit_code = exit_code});
    }
  } catch (const std::exception &e) {
    log::warn("memory broker failed to run {}: {}", token, e.what());
    finish(token, StateRecord{.state = std::string(broker_state::kFailure),
                              .detail = e.what()});
  }
}

auto MemoryBroker::finish(const TaskToken &token, StateRecord record) -> void {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(token);
  if (it == entries_.end()) {
    return;
  }
  it->second.pid = -1;
  if (it->second.forgotten) {
    entries_.erase(it);
    return;
  }
  if (it->second.record.state == broker_state::kRevoked) {
    return;
  }
  it->second.record = std::move(record);
}

auto MemoryBroker::fetch_state(const TaskToken &token) -> task<std::string> {
  if (is_closed()) {
    throw BrokerError("broker connection closed");
  }
  std::string payload;
  {
    std::scoped_lock lock(mu_);
    auto it = entries_.find(token);
    if (it == entries_.end()) {
      throw BrokerError(std::format("unknown task token {}", token));
    }
    payload = encode_state_record(it->second.record);
  }
  co_return payload;
}

auto MemoryBroker::revoke(const TaskToken &token) -> void {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(token);
  if (it == entries_.end()) {
    return;
  }
  auto &entry = it->second;
  if (entry.record.state == broker_state::kSuccess ||
      entry.record.state == broker_state::kFailure) {
    return;
  }
  entry.record = StateRecord{.state = std::string(broker_state::kRevoked),
                             .detail = "revoked"};
  if (entry.pid > 0) {
    (void)::kill(entry.pid, SIGKILL);
  }
}

auto MemoryBroker::forget(const TaskToken &token) -> void {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(token);
  if (it == entries_.end()) {
    return;
  }
  const auto &state = it->second.record.state;
  if (state == broker_state::kPending || state == broker_state::kStarted) {
    // Still queued or running; finish() drops it.
    it->second.forgotten = true;
    return;
  }
  entries_.erase(it);
}

auto MemoryBroker::tracked_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return entries_.size();
}

auto MemoryBroker::close() -> void {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  {
    std::scoped_lock lock(mu_);
    for (auto &[token, entry] : entries_) {
      if (entry.pid > 0) {
        (void)::kill(entry.pid, SIGKILL);
      }
    }
  }
  workers_.stop();
  workers_.join();
  log::debug("memory broker closed");
}

} // namespace brokerflow
