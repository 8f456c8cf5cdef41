#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace dagrun {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

/// A task name doubles as a file name inside the workspace, so it must not
/// contain path separators or be a relative directory reference.
[[nodiscard]] inline auto is_valid_task_name(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value) &&
         value.find('/') == std::string_view::npos && value != "." &&
         value != "..";
}

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto c_str() const noexcept -> const char * {
    return value_.c_str();
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return value_.size();
  }

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace dagrun

// `is_avalanching` tells ankerl::unordered_dense the hash is already well
// mixed, so it is used without an extra mixing step.
template <> struct std::hash<dagrun::TaskId> {
  using is_avalanching = void;
  auto operator()(const dagrun::TaskId &id) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <>
struct std::formatter<dagrun::TaskId> : std::formatter<std::string_view> {
  auto format(const dagrun::TaskId &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
