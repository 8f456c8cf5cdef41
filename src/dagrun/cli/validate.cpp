#include "dagrun/cli/commands.hpp"
#include "dagrun/cli/formatting.hpp"
#include "dagrun/config/task_file_loader.hpp"
#include "dagrun/dag/resolver.hpp"

#include "common.hpp"

#include <print>
#include <ranges>

namespace dagrun::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  std::string diagnostic;
  auto registry = TaskFileLoader::load_from_file(opts.task_file, &diagnostic);
  if (!registry) {
    return report_error(registry.error(), diagnostic);
  }

  if (!opts.task) {
    std::println("{} {} ({} tasks)", fmt::ansi::green("✓"), opts.task_file,
                 registry->size());
    return 0;
  }

  DependencyResolver resolver(*registry);
  auto order = resolver.resolve(TaskId{*opts.task}, &diagnostic);
  if (!order) {
    return report_error(order.error(), diagnostic);
  }
  for (const auto &[i, task_id] : std::views::enumerate(*order)) {
    std::println("{:>3}. {}", i + 1, task_id);
  }
  return 0;
}

} // namespace dagrun::cli
