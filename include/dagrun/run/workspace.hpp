#pragma once

#include "dagrun/core/error.hpp"
#include "dagrun/util/id.hpp"

#include <filesystem>
#include <string_view>

namespace dagrun {

/// Private run-scoped scratch directory holding one `<task>.out` slot per
/// task. Move-only; the directory is removed recursively when the owning
/// object is destroyed or destroy() is called.
class Workspace {
public:
  /// Creates `<root>/<prefix>-XXXXXX`. An empty root means the system
  /// temporary directory.
  [[nodiscard]] static auto create(const std::filesystem::path &root = {},
                                   std::string_view prefix = "dagrun")
      -> Result<Workspace>;

  Workspace() = default;
  ~Workspace();

  Workspace(Workspace &&other) noexcept;
  Workspace &operator=(Workspace &&other) noexcept;
  Workspace(const Workspace &) = delete;
  Workspace &operator=(const Workspace &) = delete;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }
  [[nodiscard]] auto valid() const noexcept -> bool { return !path_.empty(); }

  [[nodiscard]] auto output_slot(const TaskId &task_id) const
      -> std::filesystem::path;

  /// Create (or truncate) the empty output slot of `task_id`.
  [[nodiscard]] auto init_output_slot(const TaskId &task_id) const
      -> Result<std::filesystem::path>;

  auto destroy() noexcept -> void;

private:
  explicit Workspace(std::filesystem::path path) : path_(std::move(path)) {}

  std::filesystem::path path_;
};

} // namespace dagrun
