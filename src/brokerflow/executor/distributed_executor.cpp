#include "brokerflow/executor/distributed_executor.hpp"
#include "brokerflow/core/coroutine.hpp"
#include "brokerflow/util/log.hpp"

#include <boost/asio/co_spawn.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <latch>
#include <thread>

namespace brokerflow {

namespace {

// One lambda per PollResult alternative.
template <class... Fs> struct PollVisitor : Fs... {
  using Fs::operator()...;
};
template <class... Fs> PollVisitor(Fs...) -> PollVisitor<Fs...>;

} // namespace

DistributedExecutor::DistributedExecutor(ExecutorConfig config,
                                         std::shared_ptr<MessageBroker> broker)
    : config_(std::move(config)), broker_(std::move(broker)),
      poll_pool_(std::max<std::size_t>(1, config_.sync_parallelism)) {
  state_.gate = ParallelismGate{config_.parallelism, config_.queue_parallelism};
  log::info("distributed executor ready: parallelism={} sync_parallelism={} "
            "poll_timeout={}ms",
            config_.parallelism, config_.sync_parallelism,
            config_.poll_timeout.count());
}

DistributedExecutor::~DistributedExecutor() {
  if (!is_closed()) {
    shutdown(false);
  }
  close_broker();
  poll_pool_.join();
}

auto DistributedExecutor::queue(TaskInstanceKey key, Command command,
                                std::string queue_name, int priority)
    -> Result<void> {
  if (is_closed()) {
    return fail(Error::InvalidState);
  }
  std::scoped_lock lock(mu_);
  if (state_.pending.contains(key) || state_.in_flight.contains(key)) {
    log::warn("could not queue {}: already queued or running", key);
    return fail(Error::DuplicateKey);
  }
  log::info("adding to queue: {} queue='{}' priority={} cmd='{}'", key,
            queue_name, priority, CommandBuilder::preview(command));
  state_.pending.push(PendingTask{.key = std::move(key),
                                  .command = std::move(command),
                                  .queue_name = std::move(queue_name),
                                  .priority = priority});
  return ok();
}

auto DistributedExecutor::trigger_pending() -> Result<void> {
  if (is_closed()) {
    return fail(Error::InvalidState);
  }
  return trigger_pass();
}

auto DistributedExecutor::trigger_pass() -> Result<void> {
  std::vector<TaskInstanceKey> order;
  {
    std::scoped_lock lock(mu_);
    if (state_.pending.empty() || state_.gate.global_exhausted()) {
      return ok();
    }
    order = state_.pending.ordered_keys();
    log::debug("{} pending, {} open slots", order.size(),
               state_.gate.open_slots());
  }

  for (const auto &key : order) {
    if (cancel_requested_.load(std::memory_order_acquire)) {
      break;
    }

    Command command;
    std::string queue_name;
    {
      std::scoped_lock lock(mu_);
      if (state_.gate.global_exhausted()) {
        break;
      }
      const auto *task = state_.pending.find(key);
      if (task == nullptr || !state_.gate.try_acquire(task->queue_name)) {
        continue;
      }
      command = task->command;
      queue_name = task->queue_name;
    }

    // The entry stays pending while the broker call is outstanding.
    auto submitted = broker_->submit(command, queue_name);

    std::shared_ptr<RemoteTaskHandle> orphan;
    {
      std::scoped_lock lock(mu_);
      if (!submitted) {
        state_.gate.release(queue_name);
        const auto failures = ++state_.consecutive_failures;
        log::warn("dispatch of {} failed ({} consecutive): {}", key, failures,
                  submitted.error().message());
        if (auto task = state_.pending.take(key)) {
          state_.pending.requeue(std::move(*task));
        }
        if (failures >= config_.max_dispatch_failures) {
          log::error("giving up after {} consecutive dispatch failures; last "
                     "cause: {}",
                     failures, submitted.error().message());
          return fail(Error::BrokerUnavailable);
        }
        continue;
      }

      state_.consecutive_failures = 0;
      auto handle = std::make_shared<RemoteTaskHandle>(broker_, *submitted);
      if (!state_.pending.take(key)) {
        // Cancelled while the submission was in progress.
        state_.gate.release(queue_name);
        orphan = std::move(handle);
      } else {
        log::debug("dispatched {} as {}", key, handle->token());
        state_.in_flight.emplace(
            key, InFlightTask{.handle = std::move(handle),
                              .queue_name = std::move(queue_name)});
        state_.last_state.insert_or_assign(key, TaskState::Pending);
      }
    }
    if (orphan && broker_->supports_revoke()) {
      orphan->revoke();
    }
  }
  return ok();
}

auto DistributedExecutor::sync() -> Result<void> {
  if (is_closed()) {
    return fail(Error::InvalidState);
  }
  return sync_pass();
}

auto DistributedExecutor::sync_pass() -> Result<void> {
  struct SyncMark {
    DistributedExecutor &self;
    explicit SyncMark(DistributedExecutor &s) : self(s) {
      std::scoped_lock lock(self.sync_mu_);
      self.syncing_ = true;
    }
    ~SyncMark() {
      {
        std::scoped_lock lock(self.sync_mu_);
        self.syncing_ = false;
      }
      self.sync_cv_.notify_all();
    }
    SyncMark(const SyncMark &) = delete;
    auto operator=(const SyncMark &) -> SyncMark & = delete;
  };
  SyncMark mark{*this};

  Snapshot snapshot;
  {
    std::scoped_lock lock(mu_);
    snapshot.reserve(state_.in_flight.size());
    for (const auto &[key, entry] : state_.in_flight) {
      snapshot.emplace_back(key, entry.handle);
    }
  }
  if (snapshot.empty()) {
    return ok();
  }
  log::debug("inquiring about {} task(s)", snapshot.size());

  auto results = poll_all(snapshot);

  std::size_t skipped = 0;
  {
    std::scoped_lock lock(mu_);
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
      if (!results[i]) {
        ++skipped;
        continue;
      }
      apply(state_, snapshot[i].first, *snapshot[i].second,
            std::move(*results[i]));
    }
  }

  if (skipped > 0) {
    log::warn("sync pass cancelled with {} of {} task(s) not polled", skipped,
              snapshot.size());
    return fail(Error::Cancelled);
  }
  return ok();
}

auto DistributedExecutor::poll_all(const Snapshot &snapshot)
    -> std::vector<std::optional<PollResult>> {
  const auto count = snapshot.size();
  std::vector<std::optional<PollResult>> results(count);
  const auto workers =
      std::min(count, std::max<std::size_t>(1, config_.sync_parallelism));

  std::atomic<std::size_t> next{0};
  std::latch done(static_cast<std::ptrdiff_t>(workers));
  std::mutex failure_mu;
  std::exception_ptr failure;

  for (std::size_t w = 0; w < workers; ++w) {
    co_spawn(
        poll_pool_,
        [&]() -> task<void> {
          for (;;) {
            if (cancel_requested_.load(std::memory_order_acquire)) {
              co_return;
            }
            const auto i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
              co_return;
            }
            results[i] = co_await snapshot[i].second->poll(config_.poll_timeout);
          }
        },
        [&](std::exception_ptr e) {
          if (e) {
            std::scoped_lock lock(failure_mu);
            if (!failure) {
              failure = e;
            }
          }
          done.count_down();
        });
  }
  done.wait();

  if (failure) {
    std::rethrow_exception(failure);
  }
  return results;
}

auto DistributedExecutor::apply(State &state, const TaskInstanceKey &key,
                                const RemoteTaskHandle &handle,
                                PollResult result) -> void {
  auto it = state.in_flight.find(key);
  if (it == state.in_flight.end() || it->second.handle.get() != &handle) {
    // Cancelled while the poll was outstanding.
    return;
  }

  auto observe = [&](TaskState observed) {
    auto [last, inserted] = state.last_state.try_emplace(key, observed);
    if (!inserted && last->second == observed) {
      return;
    }
    last->second = observed;
    log::debug("{} is now {}", key, to_string_view(observed));
  };

  std::visit(
      PollVisitor{
          [&](const poll::Pending &) { observe(TaskState::Pending); },
          [&](const poll::Running &) { observe(TaskState::Running); },
          [&](const poll::Success &) {
            log::info("{} succeeded", key);
            state.events.put(key, TaskEvent{.outcome = Outcome::Success});
            retire(state, key);
          },
          [&](poll::Failed &failed) {
            log::warn("{} failed: {}", key, failed.detail);
            state.events.put(key, TaskEvent{.outcome = Outcome::Failed,
                                            .info = std::move(failed.detail)});
            retire(state, key);
          },
          [&](poll::LookupError &lookup) {
            log::error("{} for {} (token {}): {}: {}", kFetchErrorHeader, key,
                       handle.token(), lookup.error_class, lookup.message);
            state.events.put(
                key, TaskEvent{.outcome = Outcome::Failed,
                               .info = std::format("{}: {}", lookup.error_class,
                                                   lookup.message)});
            retire(state, key);
          },
      },
      result);
}

auto DistributedExecutor::retire(State &state, const TaskInstanceKey &key)
    -> void {
  if (auto it = state.in_flight.find(key); it != state.in_flight.end()) {
    state.gate.release(it->second.queue_name);
    // The executor never fetches this token again.
    it->second.handle->forget();
    state.in_flight.erase(it);
  }
  state.last_state.erase(key);
}

auto DistributedExecutor::drain_events() -> EventMap {
  std::scoped_lock lock(mu_);
  return state_.events.drain();
}

auto DistributedExecutor::drain_events(std::span<const WorkflowId> workflow_ids)
    -> EventMap {
  std::scoped_lock lock(mu_);
  return state_.events.drain(workflow_ids);
}

auto DistributedExecutor::cancel(const TaskInstanceKey &key) -> Result<void> {
  std::shared_ptr<RemoteTaskHandle> handle;
  {
    std::scoped_lock lock(mu_);
    if (state_.pending.take(key)) {
      log::info("removed pending {}", key);
      return ok();
    }
    auto it = state_.in_flight.find(key);
    if (it == state_.in_flight.end()) {
      return fail(Error::NotFound);
    }
    handle = it->second.handle;
    retire(state_, key);
  }

  if (broker_->supports_revoke()) {
    handle->revoke();
    log::info("revoked {} (token {})", key, handle->token());
  } else {
    log::warn("broker cannot revoke {}; it may still run remotely", key);
  }
  return ok();
}

auto DistributedExecutor::revoke_all(State &state)
    -> std::vector<std::shared_ptr<RemoteTaskHandle>> {
  std::vector<std::shared_ptr<RemoteTaskHandle>> handles;
  handles.reserve(state.in_flight.size());
  std::vector<TaskInstanceKey> keys;
  keys.reserve(state.in_flight.size());
  for (const auto &[key, entry] : state.in_flight) {
    handles.push_back(entry.handle);
    keys.push_back(key);
  }
  for (const auto &key : keys) {
    retire(state, key);
  }
  return handles;
}

auto DistributedExecutor::shutdown(bool wait_for_completion) -> void {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  if (wait_for_completion) {
    log::info("shutting down; waiting up to {}s for outstanding tasks",
              config_.shutdown_timeout.count());
    const auto deadline =
        std::chrono::steady_clock::now() + config_.shutdown_timeout;
    for (;;) {
      auto triggered = trigger_pass();
      auto synced = sync_pass();
      if (!triggered || !synced) {
        log::error("stopping shutdown reconciliation: {}",
                   (!triggered ? triggered : synced).error().message());
        break;
      }
      {
        std::scoped_lock lock(mu_);
        if (state_.pending.empty() && state_.in_flight.empty()) {
          break;
        }
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        log::warn("shutdown timeout elapsed with tasks outstanding");
        break;
      }
      std::this_thread::sleep_for(config_.shutdown_poll_interval);
    }
  } else {
    cancel_requested_.store(true, std::memory_order_release);
  }

  std::vector<std::shared_ptr<RemoteTaskHandle>> outstanding;
  {
    std::scoped_lock lock(mu_);
    if (!state_.pending.empty()) {
      log::warn("dropping {} task(s) that were never dispatched",
                state_.pending.size());
      state_.pending.clear();
    }
    outstanding = revoke_all(state_);
  }

  if (!outstanding.empty()) {
    if (!wait_for_completion && broker_->supports_revoke()) {
      log::info("revoking {} running task(s)", outstanding.size());
      for (const auto &handle : outstanding) {
        handle->revoke();
      }
    } else {
      log::warn("abandoning {} running task(s)", outstanding.size());
    }
  }

  {
    std::unique_lock lock(sync_mu_);
    if (!sync_cv_.wait_for(lock, config_.shutdown_grace,
                           [this] { return !syncing_; })) {
      log::warn("sync pass still running after {}ms grace period",
                config_.shutdown_grace.count());
    }
  }
  close_broker();
  log::info("executor shut down");
}

auto DistributedExecutor::close_broker() -> void {
  if (!broker_closed_.exchange(true, std::memory_order_acq_rel)) {
    broker_->close();
  }
}

auto DistributedExecutor::has_task(const TaskInstanceKey &key) const -> bool {
  std::scoped_lock lock(mu_);
  return state_.pending.contains(key) || state_.in_flight.contains(key);
}

auto DistributedExecutor::is_pending(const TaskInstanceKey &key) const
    -> bool {
  std::scoped_lock lock(mu_);
  return state_.pending.contains(key);
}

auto DistributedExecutor::is_running(const TaskInstanceKey &key) const
    -> bool {
  std::scoped_lock lock(mu_);
  return state_.in_flight.contains(key);
}

auto DistributedExecutor::last_observed(const TaskInstanceKey &key) const
    -> std::optional<TaskState> {
  std::scoped_lock lock(mu_);
  if (auto it = state_.last_state.find(key); it != state_.last_state.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto DistributedExecutor::last_observed_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.last_state.size();
}

auto DistributedExecutor::pending_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.pending.size();
}

auto DistributedExecutor::running_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.in_flight.size();
}

auto DistributedExecutor::running_in_queue(std::string_view queue_name) const
    -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.gate.in_use(queue_name);
}

auto DistributedExecutor::open_slots() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.gate.open_slots();
}

auto DistributedExecutor::consecutive_dispatch_failures() const
    -> std::size_t {
  std::scoped_lock lock(mu_);
  return state_.consecutive_failures;
}

auto create_distributed_executor(const SystemConfig &config)
    -> Result<std::unique_ptr<DistributedExecutor>> {
  auto broker = make_broker(config.broker);
  if (!broker) {
    return fail(broker.error());
  }
  return ok(std::make_unique<DistributedExecutor>(config.executor,
                                                  std::move(*broker)));
}

} // namespace brokerflow
