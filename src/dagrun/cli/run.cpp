#include "dagrun/cli/commands.hpp"
#include "dagrun/cli/formatting.hpp"
#include "dagrun/config/config.hpp"
#include "dagrun/config/task_file_loader.hpp"
#include "dagrun/run/run_controller.hpp"
#include "dagrun/util/log.hpp"

#include "common.hpp"

#include <print>

namespace dagrun::cli {

namespace {

auto configure_logging(const EngineConfig &cfg) -> bool {
  log::set_level(cfg.log_level);
  if (!cfg.log_file.empty()) {
    return log::set_output_file(cfg.log_file);
  }
  log::set_output_stderr();
  return true;
}

auto print_outcome(const TaskOutcome &outcome) -> void {
  if (outcome.success) {
    std::println(stderr, "{} {} {}", fmt::ansi::green("✓", stderr),
                 outcome.task_id,
                 fmt::ansi::dim(fmt::format_elapsed(outcome.elapsed), stderr));
  } else {
    std::println(stderr, "{} {} {}", fmt::ansi::red("✗", stderr),
                 outcome.task_id,
                 fmt::ansi::dim(std::format("exit {}", outcome.exit_code),
                                stderr));
  }
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();
  std::string diagnostic;

  auto config = opts.config_file.empty()
                    ? ConfigLoader::from_environment(&diagnostic)
                    : ConfigLoader::load_from_file(opts.config_file,
                                                   &diagnostic);
  if (!config) {
    return report_error(config.error(), diagnostic);
  }
  if (opts.log_level) {
    config->log_level = *opts.log_level;
    if (auto valid = ConfigLoader::validate(*config, &diagnostic); !valid) {
      return report_error(valid.error(), diagnostic);
    }
  }
  if (!configure_logging(*config)) {
    std::println(stderr, "Error: cannot open log file {}", config->log_file);
    return 1;
  }

  auto registry = TaskFileLoader::load_from_file(opts.task_file, &diagnostic);
  if (!registry) {
    return report_error(registry.error(), diagnostic);
  }

  const bool status_lines = fmt::ansi::is_tty(stderr);
  RunObserver observer{
      .on_workspace =
          [](const std::filesystem::path &workspace) {
            std::println(stderr, "workspace: {}", workspace.string());
          },
      .on_task_complete =
          [status_lines](const TaskOutcome &outcome) {
            if (status_lines) {
              print_outcome(outcome);
            }
          }};

  RunController controller(*registry, *config, std::move(observer));
  log::start();
  auto report = controller.run(TaskId{opts.task},
                               OutputDestination::parse(opts.output),
                               &diagnostic);
  log::stop();

  if (!report) {
    return report_error(report.error(), diagnostic);
  }
  return 0;
}

} // namespace dagrun::cli
