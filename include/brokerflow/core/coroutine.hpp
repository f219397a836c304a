#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace brokerflow {

/// Every broker call and poll is a `task`; none of them block a thread.
template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::use_awaitable;

/// Completion token that hands back `(error_code, ...)` instead of throwing.
/// Timer waits use it so cancellation is a value, not an exception.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

} // namespace brokerflow
