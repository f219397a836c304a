#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace brokerflow {

/// Failures reported through `Result<T>`. Task failures are not errors: they
/// travel as `Outcome::Failed` events.
enum class Error : std::uint8_t {
  FileNotFound = 1,
  ParseError,
  InvalidArgument,
  InvalidUrl,
  NotFound,
  DuplicateKey,
  InvalidState,
  Cancelled,
  BrokerUnavailable,
  ProtocolError,
};

[[nodiscard]] constexpr auto describe(Error e) noexcept -> std::string_view {
  switch (e) {
  case Error::FileNotFound:
    return "file not found";
  case Error::ParseError:
    return "parse error";
  case Error::InvalidArgument:
    return "invalid argument";
  case Error::InvalidUrl:
    return "unsupported or malformed broker URL";
  case Error::NotFound:
    return "task instance not known to the executor";
  case Error::DuplicateKey:
    return "task instance already queued or running";
  case Error::InvalidState:
    return "executor is shut down";
  case Error::Cancelled:
    return "cancelled";
  case Error::BrokerUnavailable:
    return "broker unavailable";
  case Error::ProtocolError:
    return "unexpected reply from broker";
  }
  return "unrecognized error";
}

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "brokerflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{describe(static_cast<Error>(ev))};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace brokerflow

template <>
struct std::is_error_code_enum<brokerflow::Error> : std::true_type {};
