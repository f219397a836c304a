#include "brokerflow/broker/message_broker.hpp"
#include "brokerflow/broker/memory_broker.hpp"
#include "brokerflow/util/log.hpp"

#include <boost/url/parse.hpp>
#include <glaze/json.hpp>

#include <string>
#include <utility>

namespace glz {
template <> struct meta<brokerflow::StateRecord> {
  using T = brokerflow::StateRecord;
  static constexpr auto value = object("state", &T::state, "detail",
                                       &T::detail, "exit_code", &T::exit_code);
};
} // namespace glz

namespace brokerflow {

namespace {

inline constexpr std::string_view kMemoryScheme = "memory";

[[nodiscard]] auto scheme_of(std::string_view uri) -> Result<std::string> {
  auto parsed = boost::urls::parse_uri(uri);
  if (!parsed) {
    log::error("invalid broker URI '{}': {}", uri, parsed.error().message());
    return fail(Error::InvalidUrl);
  }
  return ok(std::string(parsed->scheme()));
}

} // namespace

auto encode_state_record(const StateRecord &record) -> std::string {
  auto out = glz::write_json(record);
  return out ? std::move(*out) : std::string{"{}"};
}

auto decode_state_record(std::string_view raw, std::string *diagnostic)
    -> Result<StateRecord> {
  StateRecord record{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(record, raw); ec) {
    if (diagnostic) {
      *diagnostic = glz::format_error(ec, raw);
    }
    return fail(Error::ProtocolError);
  }
  if (record.state.empty()) {
    if (diagnostic) {
      *diagnostic = "record has no state";
    }
    return fail(Error::ProtocolError);
  }
  return ok(std::move(record));
}

auto make_broker(const BrokerConfig &config)
    -> Result<std::shared_ptr<MessageBroker>> {
  auto scheme = scheme_of(config.broker_url);
  if (!scheme) {
    return fail(scheme.error());
  }
  if (*scheme != kMemoryScheme) {
    log::error("unsupported broker scheme '{}' in '{}'", *scheme,
               config.broker_url);
    return fail(Error::InvalidUrl);
  }

  // The in-process broker is its own result backend.
  if (!config.result_backend.empty()) {
    auto backend = scheme_of(config.result_backend);
    if (!backend) {
      return fail(backend.error());
    }
    if (*backend != kMemoryScheme) {
      log::error("result backend '{}' cannot be paired with broker '{}'",
                 config.result_backend, config.broker_url);
      return fail(Error::InvalidUrl);
    }
  }

  log::info("using in-process broker with {} workers",
            config.worker_concurrency);
  return ok(std::static_pointer_cast<MessageBroker>(
      std::make_shared<MemoryBroker>(config.worker_concurrency)));
}

} // namespace brokerflow
