#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace brokerflow {

struct WorkflowTag {};
struct TaskTag {};
struct TokenTag {};

// A string id that only compares with ids of the same tag, so a broker token
// can never be passed where a task id is expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string_view value) : value_(value) {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  friend auto operator<=>(const TypedId &, const TypedId &) = default;
  friend auto operator==(const TypedId &, const TypedId &) -> bool = default;

private:
  std::string value_;
};

using WorkflowId = TypedId<WorkflowTag>;
using TaskId = TypedId<TaskTag>;
/// Correlation token issued by a message broker for one submission.
using TaskToken = TypedId<TokenTag>;

} // namespace brokerflow

// `is_avalanching` lets ankerl::unordered_dense::hash use this directly.
template <typename Tag> struct std::hash<brokerflow::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const brokerflow::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<brokerflow::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const brokerflow::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
