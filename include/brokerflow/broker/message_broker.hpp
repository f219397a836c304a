#pragma once

#include "brokerflow/config/system_config.hpp"
#include "brokerflow/core/coroutine.hpp"
#include "brokerflow/core/error.hpp"
#include "brokerflow/executor/command.hpp"
#include "brokerflow/util/id.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace brokerflow {

/// State names a result backend reports for a submitted task.
namespace broker_state {
inline constexpr std::string_view kPending = "PENDING";
inline constexpr std::string_view kReceived = "RECEIVED";
inline constexpr std::string_view kStarted = "STARTED";
inline constexpr std::string_view kRetry = "RETRY";
inline constexpr std::string_view kSuccess = "SUCCESS";
inline constexpr std::string_view kFailure = "FAILURE";
inline constexpr std::string_view kRevoked = "REVOKED";
} // namespace broker_state

/// Result-backend record, serialized as JSON on the wire.
struct StateRecord {
  std::string state;
  std::optional<std::string> detail;
  std::optional<int> exit_code;
};

[[nodiscard]] auto encode_state_record(const StateRecord &record)
    -> std::string;
[[nodiscard]] auto decode_state_record(std::string_view raw,
                                       std::string *diagnostic = nullptr)
    -> Result<StateRecord>;

/// Thrown by broker implementations when the transport itself fails.
class BrokerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Transport boundary between the executor and remote workers.
class MessageBroker {
public:
  virtual ~MessageBroker() = default;

  /// Enqueue `command` on `queue_name`. On failure the error code is the
  /// transport cause.
  [[nodiscard]] virtual auto submit(const Command &command,
                                    std::string_view queue_name)
      -> Result<TaskToken> = 0;

  /// Fetch the raw result-backend record for `token`. Implementations must
  /// suspend rather than block and honour cancellation; they may throw.
  [[nodiscard]] virtual auto fetch_state(const TaskToken &token)
      -> task<std::string> = 0;

  virtual auto revoke(const TaskToken &token) -> void = 0;

  /// Drop the stored result for `token` once nobody will fetch it again.
  /// Backends that expire results on their own can ignore it.
  virtual auto forget(const TaskToken & /*token*/) -> void {}

  [[nodiscard]] virtual auto supports_revoke() const noexcept -> bool {
    return true;
  }

  /// Release transport resources. Idempotent.
  virtual auto close() -> void = 0;
};

/// Build a broker from `config.broker_url`. Only `memory://` is available in
/// process; other schemes fail with Error::InvalidUrl.
[[nodiscard]] auto make_broker(const BrokerConfig &config)
    -> Result<std::shared_ptr<MessageBroker>>;

} // namespace brokerflow
