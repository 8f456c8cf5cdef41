#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/task/task_registry.hpp"

#include <string>
#include <string_view>

namespace dagrun {

/// Builds a TaskRegistry from a TOML task definition file. Both dependency
/// shapes (`stdin`/`files` keys and the mixed `dependencies` list) are
/// normalized into Task. Dependency existence is left to the resolver.
class TaskFileLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<TaskRegistry>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<TaskRegistry>;
};

} // namespace dagrun
