#include "dagrun/config/config.hpp"
#include "dagrun/config/toml_util.hpp"

#include "dagrun/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <format>
#include <string>
#include <string_view>

namespace dagrun {
namespace detail {

struct EngineToml {
  std::string log_level{"warn"};
  std::string log_file;
  std::string workspace_root;
  std::string workspace_prefix{"dagrun"};
  int follow_poll_interval_ms{20};
  int gate_threads{2};
};

struct ConfigToml {
  EngineToml engine{};
};

} // namespace detail
} // namespace dagrun

namespace glz {
template <> struct meta<dagrun::detail::EngineToml> {
  using T = dagrun::detail::EngineToml;
  static constexpr auto value = object(
      "log_level", &T::log_level, "log_file", &T::log_file, "workspace_root",
      &T::workspace_root, "workspace_prefix", &T::workspace_prefix,
      "follow_poll_interval_ms", &T::follow_poll_interval_ms, "gate_threads",
      &T::gate_threads);
};

template <> struct meta<dagrun::detail::ConfigToml> {
  using T = dagrun::detail::ConfigToml;
  static constexpr auto value = object("engine", &T::engine);
};
} // namespace glz

namespace dagrun {
namespace {

auto apply_env_overrides(EngineConfig &cfg) -> void {
  if (const char *v = std::getenv("DAGRUN_LOG_LEVEL"); v != nullptr) {
    cfg.log_level = v;
  }
  if (const char *v = std::getenv("DAGRUN_LOG_FILE"); v != nullptr) {
    cfg.log_file = v;
  }
  if (const char *v = std::getenv("DAGRUN_WORKSPACE_ROOT"); v != nullptr) {
    cfg.workspace_root = v;
  }
  if (const char *v = std::getenv("DAGRUN_FOLLOW_POLL_MS"); v != nullptr) {
    cfg.follow_poll_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("DAGRUN_GATE_THREADS"); v != nullptr) {
    cfg.gate_threads = boost::lexical_cast<int>(v);
  }
}

[[nodiscard]] auto finish(EngineConfig cfg, std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    apply_env_overrides(cfg);
  } catch (const boost::bad_lexical_cast &e) {
    set_diagnostic(diagnostic,
                   std::format("invalid numeric DAGRUN_* override: {}",
                               e.what()));
    return fail(Error::ParseError);
  }
  if (auto valid = ConfigLoader::validate(cfg, diagnostic); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const EngineConfig &cfg, std::string *diagnostic)
    -> Result<void> {
  if (!log::parse_level(cfg.log_level)) {
    set_diagnostic(diagnostic,
                   std::format("unknown log level '{}'", cfg.log_level));
    return fail(Error::ParseError);
  }
  if (cfg.follow_poll_interval_ms <= 0) {
    set_diagnostic(diagnostic, "follow_poll_interval_ms must be positive");
    return fail(Error::ParseError);
  }
  if (cfg.gate_threads <= 0) {
    set_diagnostic(diagnostic, "gate_threads must be positive");
    return fail(Error::ParseError);
  }
  if (cfg.workspace_prefix.empty() ||
      cfg.workspace_prefix.find('/') != std::string::npos) {
    set_diagnostic(diagnostic,
                   "workspace_prefix must be a non-empty file name");
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path,
                                  std::string *diagnostic)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    set_diagnostic(diagnostic,
                   std::format("cannot read config file '{}'", path));
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw = toml_util::parse_toml<detail::ConfigToml>(toml_str, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }
  auto &engine = raw->engine;
  EngineConfig cfg{};
  cfg.log_level = std::move(engine.log_level);
  cfg.log_file = std::move(engine.log_file);
  cfg.workspace_root = std::move(engine.workspace_root);
  cfg.workspace_prefix = std::move(engine.workspace_prefix);
  cfg.follow_poll_interval_ms = engine.follow_poll_interval_ms;
  cfg.gate_threads = engine.gate_threads;
  return finish(std::move(cfg), diagnostic);
}

auto ConfigLoader::from_environment(std::string *diagnostic)
    -> Result<EngineConfig> {
  return finish(EngineConfig{}, diagnostic);
}

} // namespace dagrun
