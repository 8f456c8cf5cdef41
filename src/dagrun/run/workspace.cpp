#include "dagrun/run/workspace.hpp"

#include "dagrun/util/log.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace dagrun {

auto Workspace::create(const std::filesystem::path &root,
                       std::string_view prefix) -> Result<Workspace> {
  std::error_code ec;
  auto base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
  if (ec) {
    log::error("cannot determine temporary directory: {}", ec.message());
    return fail(Error::WorkspaceError);
  }

  auto pattern = (base / std::format("{}-XXXXXX", prefix)).string();
  std::vector<char> templ(pattern.begin(), pattern.end());
  templ.push_back('\0');
  if (::mkdtemp(templ.data()) == nullptr) {
    log::error("cannot create workspace under {}: {}", base.string(),
               std::error_code(errno, std::system_category()).message());
    return fail(Error::WorkspaceError);
  }

  auto path = std::filesystem::absolute(std::filesystem::path(templ.data()), ec);
  if (ec) {
    path = std::filesystem::path(templ.data());
  }
  log::debug("workspace created at {}", path.string());
  return ok(Workspace{std::move(path)});
}

Workspace::~Workspace() { destroy(); }

Workspace::Workspace(Workspace &&other) noexcept
    : path_(std::exchange(other.path_, {})) {}

Workspace &Workspace::operator=(Workspace &&other) noexcept {
  if (this != &other) {
    destroy();
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

auto Workspace::output_slot(const TaskId &task_id) const
    -> std::filesystem::path {
  return path_ / std::format("{}.out", task_id);
}

auto Workspace::init_output_slot(const TaskId &task_id) const
    -> Result<std::filesystem::path> {
  auto slot = output_slot(task_id);
  auto fd = sys_check(
      ::open(slot.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd) {
    log::error("cannot create output slot {}: {}", slot.string(),
               fd.error().message());
    return fail(Error::WorkspaceError);
  }
  ::close(*fd);
  return ok(std::move(slot));
}

auto Workspace::destroy() noexcept -> void {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    log::warn("failed to remove workspace {}: {}", path_.string(),
              ec.message());
  } else {
    log::debug("workspace removed: {}", path_.string());
  }
  path_.clear();
}

} // namespace dagrun
