#pragma once

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace brokerflow {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// Lower-cased enumerator names, built once per enum from its
// BOOST_DESCRIBE_ENUM list. Outcome and TaskState names are what logs and
// `--json` output show.
template <typename E> [[nodiscard]] auto enum_names() -> const auto & {
  using descriptors = boost::describe::describe_enumerators<E>;
  static const auto names = [] {
    std::array<std::pair<E, std::string>,
               boost::mp11::mp_size<descriptors>::value>
        out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto d) {
      out[i++] = {d.value, boost::algorithm::to_lower_copy(
                               std::string(d.name))};
    });
    return out;
  }();
  return names;
}

template <typename E>
[[nodiscard]] auto enum_to_view(E value) noexcept -> std::string_view {
  for (const auto &[e, name] : enum_names<E>()) {
    if (e == value) {
      return name;
    }
  }
  return "unknown";
}

/// Case-insensitive lookup; anything unrecognised maps to `fallback`.
template <typename E>
[[nodiscard]] auto enum_from_view(std::string_view text, E fallback) noexcept
    -> E {
  for (const auto &[e, name] : enum_names<E>()) {
    if (boost::algorithm::iequals(name, text)) {
      return e;
    }
  }
  return fallback;
}

} // namespace util

#define BROKERFLOW_DEFINE_ENUM_SERDE(EnumType, Fallback)                       \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept           \
      -> std::string_view {                                                    \
    return ::brokerflow::util::enum_to_view(value);                            \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::brokerflow::util::enum_from_view(s, Fallback);                    \
  }

} // namespace brokerflow
