#include "dagrun/cli/commands.hpp"
#include "dagrun/cli/formatting.hpp"
#include "dagrun/config/task_file_loader.hpp"
#include "dagrun/util/json.hpp"

#include "common.hpp"

#include <algorithm>
#include <print>

namespace dagrun::cli {

namespace {

auto join_ids(const std::vector<TaskId> &ids) -> std::string {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty())
      out += ", ";
    out += id.str();
  }
  return out;
}

auto task_to_json(const Task &task) -> JsonValue {
  JsonValue files = std::vector<JsonValue>{};
  for (const auto &dep : task.file_dependencies) {
    files.get_array().emplace_back(dep.str());
  }
  JsonValue entry{
      {"task_id", task.task_id.str()},
      {"kind", std::string(to_string_view(task.body->kind()))},
      {"files", std::move(files)},
      {"body", task.body->describe()},
  };
  if (task.stdin_dependency) {
    entry.get_object().emplace("stdin", task.stdin_dependency->str());
  }
  return entry;
}

} // namespace

auto cmd_list(const ListOptions &opts) -> int {
  std::string diagnostic;
  auto registry = TaskFileLoader::load_from_file(opts.task_file, &diagnostic);
  if (!registry) {
    return report_error(registry.error(), diagnostic);
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &task : registry->tasks()) {
      arr.get_array().emplace_back(task_to_json(task));
    }
    std::println("{}", dump_json(arr));
    return 0;
  }

  std::size_t name_width = 4;
  for (const auto &task : registry->tasks()) {
    name_width = std::max(name_width, task.task_id.size());
  }

  fmt::Table table({{.header = "TASK", .width = name_width},
                    {.header = "STDIN", .width = 12},
                    {.header = "FILES", .width = 24},
                    {.header = "BODY", .width = 0}});
  table.print_header();
  for (const auto &task : registry->tasks()) {
    table.print_row(
        {fmt::ansi::cyan(task.task_id.str()),
         task.stdin_dependency
             ? std::format("< {}", *task.stdin_dependency)
             : std::string("-"),
         task.file_dependencies.empty()
             ? std::string("-")
             : std::format("[{}]", join_ids(task.file_dependencies)),
         fmt::ansi::dim(task.body->describe())});
  }
  return 0;
}

} // namespace dagrun::cli
