#include "dagrun/cli/commands.hpp"
#include "dagrun/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_task_file() -> std::string {
  if (const char *env = std::getenv("DAGRUN_FILE"); env && *env) {
    return env;
  }
  return "tasks.toml";
}
} // namespace

int main(int argc, char *argv[]) {
  dagrun::log::set_output_stderr();
  dagrun::log::set_level(dagrun::log::Level::Warn);

  CLI::App app{"dagrun", "Dependency-aware task executor"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  dagrun run -f tasks.toml -o - report\n"
             "  dagrun list -f tasks.toml\n"
             "  dagrun validate -f tasks.toml report\n"
             "\nTip: Set DAGRUN_FILE=tasks.toml to skip -f on every command.");

  const std::string task_file = default_task_file();

  dagrun::cli::RunOptions run_opts;
  run_opts.task_file = task_file;
  auto *run = app.add_subcommand("run", "Run a task and its dependencies");
  run->add_option("-f,--file", run_opts.task_file, "Task definition file")
      ->check(CLI::ExistingFile);
  run->add_option("-c,--config", run_opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  run->add_option("-o,--output", run_opts.output,
                  "Output destination: '-' for stdout, a path, or none");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
  run->add_option("task", run_opts.task, "Task to run")->required();
  run->callback([&run_opts]() { std::exit(dagrun::cli::cmd_run(run_opts)); });

  dagrun::cli::ListOptions list_opts;
  list_opts.task_file = task_file;
  auto *list = app.add_subcommand("list", "List declared tasks");
  list->add_option("-f,--file", list_opts.task_file, "Task definition file")
      ->check(CLI::ExistingFile);
  list->add_flag("--json", list_opts.json, "Output JSON");
  list->callback(
      [&list_opts]() { std::exit(dagrun::cli::cmd_list(list_opts)); });

  dagrun::cli::ValidateOptions validate_opts;
  validate_opts.task_file = task_file;
  auto *validate = app.add_subcommand(
      "validate", "Check a task file and optionally resolve a task's order");
  validate
      ->add_option("-f,--file", validate_opts.task_file,
                   "Task definition file")
      ->check(CLI::ExistingFile);
  validate->add_option("task", validate_opts.task,
                       "Task whose execution order to print");
  validate->callback([&validate_opts]() {
    std::exit(dagrun::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
