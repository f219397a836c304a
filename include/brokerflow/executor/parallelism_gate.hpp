#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace brokerflow {

/// Slot accounting for in-flight work: one global budget plus optional
/// per-queue budgets. A limit of 0 means unlimited. Not synchronized.
class ParallelismGate {
public:
  using QueueLimits = std::map<std::string, std::size_t, std::less<>>;

  explicit ParallelismGate(std::size_t global_limit = 0,
                           QueueLimits queue_limits = {});

  [[nodiscard]] auto can_acquire(std::string_view queue_name) const -> bool;
  [[nodiscard]] auto global_exhausted() const noexcept -> bool;

  /// Returns false (and changes nothing) when no slot is available.
  auto try_acquire(std::string_view queue_name) -> bool;
  auto release(std::string_view queue_name) -> void;

  [[nodiscard]] auto in_use() const noexcept -> std::size_t { return in_use_; }
  [[nodiscard]] auto in_use(std::string_view queue_name) const -> std::size_t;

  /// Free global slots; SIZE_MAX when unlimited.
  [[nodiscard]] auto open_slots() const noexcept -> std::size_t;

private:
  std::size_t global_limit_;
  QueueLimits queue_limits_;
  std::size_t in_use_{0};
  std::map<std::string, std::size_t, std::less<>> queue_in_use_;
};

} // namespace brokerflow
