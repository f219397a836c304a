#pragma once

#include "brokerflow/broker/message_broker.hpp"
#include "brokerflow/core/coroutine.hpp"
#include "brokerflow/util/id.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace brokerflow {

namespace poll {
struct Pending {
  auto operator==(const Pending &) const -> bool = default;
};
struct Running {
  auto operator==(const Running &) const -> bool = default;
};
struct Success {
  auto operator==(const Success &) const -> bool = default;
};
struct Failed {
  std::string detail;
  auto operator==(const Failed &) const -> bool = default;
};
/// The state could not be determined: the fetch threw, timed out, or the
/// record was malformed.
struct LookupError {
  std::string error_class;
  std::string message;
  auto operator==(const LookupError &) const -> bool = default;
};
} // namespace poll

using PollResult = std::variant<poll::Pending, poll::Running, poll::Success,
                                poll::Failed, poll::LookupError>;

[[nodiscard]] auto is_terminal(const PollResult &result) noexcept -> bool;

/// Map a raw result-backend record onto PollResult. Anything unexpected
/// becomes LookupError.
[[nodiscard]] auto classify_state_record(std::string_view raw) -> PollResult;

/// One dispatched unit of work. Owned by its in-flight entry.
class RemoteTaskHandle {
public:
  RemoteTaskHandle(std::shared_ptr<MessageBroker> broker, TaskToken token)
      : broker_(std::move(broker)), token_(std::move(token)) {}

  RemoteTaskHandle(const RemoteTaskHandle &) = delete;
  auto operator=(const RemoteTaskHandle &) -> RemoteTaskHandle & = delete;

  [[nodiscard]] auto token() const noexcept -> const TaskToken & {
    return token_;
  }

  /// Fetch the current state, giving up after `timeout`. Never throws.
  [[nodiscard]] auto poll(std::chrono::milliseconds timeout)
      -> task<PollResult>;

  /// Poll until terminal or until `ceiling` elapses. For collaborators that
  /// want to block on one task; the executor's sync pass never uses it.
  [[nodiscard]] auto wait(std::chrono::milliseconds ceiling,
                          std::chrono::milliseconds interval =
                              std::chrono::milliseconds(50))
      -> task<PollResult>;

  auto revoke() -> void;
  auto forget() -> void;

private:
  std::shared_ptr<MessageBroker> broker_;
  TaskToken token_;
};

} // namespace brokerflow
