#pragma once

#include "brokerflow/config/system_config.hpp"
#include "brokerflow/core/error.hpp"

#include <string_view>

namespace brokerflow {

class ConfigLoader {
public:
  /// Load TOML, then apply BROKERFLOW_* environment overrides and validate.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  /// Reject values the executor cannot run with.
  [[nodiscard]] static auto validate(const SystemConfig &config)
      -> Result<void>;
};

} // namespace brokerflow
