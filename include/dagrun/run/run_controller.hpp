#pragma once

#include "dagrun/config/engine_config.hpp"
#include "dagrun/core/error.hpp"
#include "dagrun/run/completion_monitor.hpp"
#include "dagrun/task/task_registry.hpp"
#include "dagrun/util/id.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dagrun {

enum class DestinationKind : std::uint8_t { None, Stdout, File };

/// Where the requested task's output goes after a successful run.
struct OutputDestination {
  DestinationKind kind{DestinationKind::None};
  std::filesystem::path path;

  /// "" or "none" -> None, "-" -> Stdout, anything else -> File.
  [[nodiscard]] static auto parse(std::string_view text) -> OutputDestination;

  [[nodiscard]] static auto to_stdout() -> OutputDestination {
    return {.kind = DestinationKind::Stdout, .path = {}};
  }
  [[nodiscard]] static auto to_file(std::filesystem::path path)
      -> OutputDestination {
    return {.kind = DestinationKind::File, .path = std::move(path)};
  }
};

/// Progress callbacks; all invoked on the calling thread.
struct RunObserver {
  std::move_only_function<void(const std::filesystem::path &workspace)>
      on_workspace;
  std::move_only_function<void(const TaskOutcome &outcome)> on_task_complete;
};

struct RunReport {
  TaskId requested;
  std::vector<TaskId> order;
  std::vector<TaskOutcome> outcomes; // completion order
  bool success{false};
  bool interrupted{false};
};

/// Runs a requested task and its dependency closure end to end.
class RunController {
public:
  explicit RunController(const TaskRegistry &registry, EngineConfig config = {},
                         RunObserver observer = {});

  /// Errors: MissingEnvironment, UnknownTask, UnknownDependency,
  /// CycleDetected (no process started); WorkspaceError, ProcessSpawnFailed;
  /// RunFailed when a task failed or the run was interrupted; FileOpenFailed
  /// when the output could not be delivered.
  [[nodiscard]] auto run(const TaskId &requested,
                         const OutputDestination &destination = {},
                         std::string *diagnostic = nullptr)
      -> Result<RunReport>;

  /// Report of the most recent run, including failed ones.
  [[nodiscard]] auto last_report() const noexcept -> const RunReport & {
    return report_;
  }

private:
  [[nodiscard]] static auto deliver(const std::filesystem::path &slot,
                                    const OutputDestination &destination,
                                    std::string *diagnostic) -> Result<void>;

  const TaskRegistry *registry_;
  EngineConfig config_;
  RunObserver observer_;
  RunReport report_;
};

} // namespace dagrun
