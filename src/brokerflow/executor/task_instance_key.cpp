#include "brokerflow/executor/task_instance_key.hpp"

#include <sstream>

namespace brokerflow {

auto format_logical_timestamp(LogicalTime tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

auto parse_logical_timestamp(std::string_view text)
    -> std::optional<LogicalTime> {
  std::istringstream in{std::string(text)};
  if (text.size() == 10) {
    std::chrono::year_month_day day;
    in >> std::chrono::parse("%Y-%m-%d", day);
    if (in.fail() || !day.ok()) {
      return std::nullopt;
    }
    return std::chrono::sys_days{day};
  }

  std::chrono::sys_seconds when;
  in >> std::chrono::parse("%Y-%m-%dT%H:%M:%SZ", when);
  if (in.fail()) {
    return std::nullopt;
  }
  return when;
}

auto TaskInstanceKey::to_string() const -> std::string {
  return std::format("{}.{}@{}#{}", workflow_id_, task_id_,
                     format_logical_timestamp(logical_timestamp_), attempt_);
}

} // namespace brokerflow
