#pragma once

#include "dagrun/config/engine_config.hpp"
#include "dagrun/core/error.hpp"

#include <string>
#include <string_view>

namespace dagrun {

/// Loads the `[engine]` table of a TOML file and applies `DAGRUN_*`
/// environment overrides on top.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;

  /// Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto from_environment(std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;

  [[nodiscard]] static auto validate(const EngineConfig &cfg,
                                     std::string *diagnostic = nullptr)
      -> Result<void>;
};

} // namespace dagrun
