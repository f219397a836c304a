#include "brokerflow/executor/parallelism_gate.hpp"

#include <limits>
#include <utility>

namespace brokerflow {

ParallelismGate::ParallelismGate(std::size_t global_limit,
                                 QueueLimits queue_limits)
    : global_limit_(global_limit), queue_limits_(std::move(queue_limits)) {}

auto ParallelismGate::global_exhausted() const noexcept -> bool {
  return global_limit_ != 0 && in_use_ >= global_limit_;
}

auto ParallelismGate::can_acquire(std::string_view queue_name) const -> bool {
  if (global_exhausted()) {
    return false;
  }
  auto limit = queue_limits_.find(queue_name);
  if (limit == queue_limits_.end() || limit->second == 0) {
    return true;
  }
  return in_use(queue_name) < limit->second;
}

auto ParallelismGate::try_acquire(std::string_view queue_name) -> bool {
  if (!can_acquire(queue_name)) {
    return false;
  }
  ++in_use_;
  auto it = queue_in_use_.find(queue_name);
  if (it == queue_in_use_.end()) {
    queue_in_use_.emplace(std::string(queue_name), 1);
  } else {
    ++it->second;
  }
  return true;
}

auto ParallelismGate::release(std::string_view queue_name) -> void {
  auto it = queue_in_use_.find(queue_name);
  if (it == queue_in_use_.end() || in_use_ == 0) {
    return;
  }
  --in_use_;
  if (--it->second == 0) {
    queue_in_use_.erase(it);
  }
}

auto ParallelismGate::in_use(std::string_view queue_name) const
    -> std::size_t {
  auto it = queue_in_use_.find(queue_name);
  return it == queue_in_use_.end() ? 0 : it->second;
}

auto ParallelismGate::open_slots() const noexcept -> std::size_t {
  if (global_limit_ == 0) {
    return std::numeric_limits<std::size_t>::max();
  }
  return in_use_ >= global_limit_ ? 0 : global_limit_ - in_use_;
}

} // namespace brokerflow
