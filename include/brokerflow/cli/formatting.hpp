#pragma once

#include "brokerflow/executor/event_buffer.hpp"

#include <glaze/json.hpp>

#include <cstddef>
#include <cstdio>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

namespace brokerflow::cli::fmt {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto to_json_text(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : std::string("null");
}

enum class Style { Bold, Dim, Good, Bad };

// Escapes are only emitted when stdout is a terminal, so piped output and
// --json stay clean.
[[nodiscard]] inline auto styled(Style style, std::string_view text)
    -> std::string {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  if (!tty) {
    return std::string(text);
  }
  std::string_view code;
  switch (style) {
  case Style::Bold:
    code = "\033[1m";
    break;
  case Style::Dim:
    code = "\033[2m";
    break;
  case Style::Good:
    code = "\033[32m";
    break;
  case Style::Bad:
    code = "\033[31m";
    break;
  }
  return std::format("{}{}\033[0m", code, text);
}

/// SUCCESS / FAILED, or UNKNOWN when no outcome was reported.
[[nodiscard]] inline auto outcome_badge(const std::optional<TaskEvent> &event)
    -> std::string {
  if (!event) {
    return styled(Style::Dim, "UNKNOWN");
  }
  return event->outcome == Outcome::Success ? styled(Style::Good, "SUCCESS")
                                            : styled(Style::Bad, "FAILED");
}

/// Slot budgets print 0 as "unlimited".
[[nodiscard]] inline auto budget_text(std::size_t limit) -> std::string {
  return limit == 0 ? std::string("unlimited") : std::to_string(limit);
}

inline auto kv(std::string_view key, std::string_view value,
               std::size_t width = 24) -> std::string {
  return std::format("{:<{}} {}", std::format("{}:", key), width, value);
}

} // namespace brokerflow::cli::fmt
