#include "brokerflow/broker/remote_task_handle.hpp"
#include "brokerflow/core/coroutine.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/core/demangle.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <typeinfo>
#include <utility>

namespace brokerflow {

namespace {

inline constexpr std::string_view kTimeoutClass = "TimeoutError";
inline constexpr std::string_view kDecodeClass = "DecodeError";

} // namespace

auto is_terminal(const PollResult &result) noexcept -> bool {
  return !std::holds_alternative<poll::Pending>(result) &&
         !std::holds_alternative<poll::Running>(result);
}

auto classify_state_record(std::string_view raw) -> PollResult {
  std::string diagnostic;
  auto record = decode_state_record(raw, &diagnostic);
  if (!record) {
    return poll::LookupError{
        .error_class = std::string(kDecodeClass),
        .message = std::format("malformed state record: {}", diagnostic)};
  }

  const std::string_view state = record->state;
  if (state == broker_state::kPending || state == broker_state::kReceived) {
    return poll::Pending{};
  }
  if (state == broker_state::kStarted || state == broker_state::kRetry) {
    return poll::Running{};
  }
  if (state == broker_state::kSuccess) {
    return poll::Success{};
  }
  if (state == broker_state::kFailure || state == broker_state::kRevoked) {
    std::string detail = record->detail.value_or(std::string(state));
    if (record->exit_code) {
      detail = std::format("{} (exit code {})", detail, *record->exit_code);
    }
    return poll::Failed{.detail = std::move(detail)};
  }
  return poll::LookupError{
      .error_class = std::string(kDecodeClass),
      .message = std::format("unrecognized task state '{}'", state)};
}

namespace {

auto lookup_error_from(const std::exception &e) -> poll::LookupError {
  return poll::LookupError{.error_class =
                               boost::core::demangle(typeid(e).name()),
                           .message = e.what()};
}

// Exceptions must not escape: the awaitable `||` in poll() only ends early for
// an operation that completes without one.
auto fetch_and_classify(std::shared_ptr<MessageBroker> broker,
                        TaskToken token) -> task<PollResult> {
  try {
    auto raw = co_await broker->fetch_state(token);
    co_return classify_state_record(raw);
  } catch (const std::exception &e) {
    co_return lookup_error_from(e);
  }
}

} // namespace

auto RemoteTaskHandle::poll(std::chrono::milliseconds timeout)
    -> task<PollResult> {
  using namespace awaitable_ops;
  try {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                    timeout);
    auto first = co_await (fetch_and_classify(broker_, token_) ||
                           timer.async_wait(use_nothrow));
    if (first.index() == 1) {
      co_return poll::LookupError{
          .error_class = std::string(kTimeoutClass),
          .message = std::format("no state for token {} within {}ms", token_,
                                 timeout.count())};
    }
    co_return std::get<0>(std::move(first));
  } catch (const std::exception &e) {
    co_return lookup_error_from(e);
  }
}

auto RemoteTaskHandle::wait(std::chrono::milliseconds ceiling,
                            std::chrono::milliseconds interval)
    -> task<PollResult> {
  const auto deadline = std::chrono::steady_clock::now() + ceiling;
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
      co_return poll::LookupError{
          .error_class = std::string(kTimeoutClass),
          .message = std::format("token {} not terminal after {}ms", token_,
                                 ceiling.count())};
    }
    auto result = co_await poll(remaining);
    if (is_terminal(result)) {
      co_return result;
    }
    timer.expires_after(std::min(interval, remaining));
    auto [ec] = co_await timer.async_wait(use_nothrow);
    if (ec) {
      co_return poll::LookupError{.error_class = "Cancelled",
                                  .message = ec.message()};
    }
  }
}

auto RemoteTaskHandle::revoke() -> void { broker_->revoke(token_); }

auto RemoteTaskHandle::forget() -> void { broker_->forget(token_); }

} // namespace brokerflow
