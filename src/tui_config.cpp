#include "tui_config.hpp"
#include "core/sanitizer.hpp"
#include "trace.hpp"
#include "tui_types.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace term_launcher {

namespace {

class ConfigError : public std::runtime_error {
public:
  ConfigError(const std::string &origin, const std::string &what)
      : std::runtime_error(origin + ": " + what) {}
};

std::string app_label(size_t index) {
  return "apps[" + std::to_string(index) + "]";
}

std::string required_string(const toml::table &props, const char *field,
                            const std::string &origin, size_t index) {
  const toml::node *value = props.get(field);
  if (!value)
    throw ConfigError(origin, app_label(index) + ": missing required field '" +
                                  field + "'");
  if (!value->is_string())
    throw ConfigError(origin, app_label(index) + ": field '" + field +
                                  "' must be a string");
  return value->as_string()->get();
}

bool optional_bool(const toml::table &launcher, const char *field,
                   bool fallback, const std::string &origin) {
  const toml::node *value = launcher.get(field);
  if (!value)
    return fallback;
  if (!value->is_boolean())
    throw ConfigError(origin, std::string("launcher.") + field +
                                  " must be a boolean");
  return value->as_boolean()->get();
}

AppEntry parse_app(const toml::node &node, const std::string &origin,
                   size_t index) {
  const toml::table *props = node.as_table();
  if (!props)
    throw ConfigError(origin, app_label(index) + " must be a table");

  AppEntry app;
  // 显示字段清洗；cmd/args逐字节保留
  app.name = sanitize(required_string(*props, "name", origin, index));
  app.key = sanitize(required_string(*props, "key", origin, index));
  app.cmd = required_string(*props, "cmd", origin, index);

  if (const toml::node *args_node = props->get("args")) {
    const toml::array *args = args_node->as_array();
    if (!args)
      throw ConfigError(origin, app_label(index) + ": 'args' must be an array");
    app.args.reserve(args->size());
    for (size_t i = 0; i < args->size(); ++i) {
      const toml::node *arg = args->get(i);
      if (!arg || !arg->is_string())
        throw ConfigError(origin, app_label(index) + ": args[" +
                                      std::to_string(i) +
                                      "] must be a string");
      app.args.emplace_back(arg->as_string()->get());
    }
  }
  return app;
}

LauncherSettings parse_settings(const toml::node *node,
                                const std::string &origin) {
  LauncherSettings settings;
  if (!node)
    return settings;
  const toml::table *launcher = node->as_table();
  if (!launcher)
    throw ConfigError(origin, "'launcher' must be a table");

  settings.confine_symlink_targets =
      optional_bool(*launcher, "confine_symlink_targets",
                    settings.confine_symlink_targets, origin);
  settings.skip_writable_directories =
      optional_bool(*launcher, "skip_writable_directories",
                    settings.skip_writable_directories, origin);
  settings.pause_after_exit = optional_bool(
      *launcher, "pause_after_exit", settings.pause_after_exit, origin);

  if (const toml::node *log_file = launcher->get("log_file")) {
    if (!log_file->is_string())
      throw ConfigError(origin, "launcher.log_file must be a string");
    settings.log_file = log_file->as_string()->get();
  }
  return settings;
}

bool usable_base(const char *value) {
  return value && value[0] == '/';
}

} // namespace

std::unique_ptr<ConfigData>
ConfigData::load_from_string(const std::string &text,
                             const std::string &origin) {
  toml::table config;
  try {
    config = toml::parse(text, origin);
  } catch (const toml::parse_error &e) {
    const auto &begin = e.source().begin;
    throw ConfigError(origin, "Failed to parse TOML: " +
                                  std::string(e.description()) + " (line " +
                                  std::to_string(begin.line) + ", column " +
                                  std::to_string(begin.column) + ")");
  }

  const toml::node *apps_node = config.get("apps");
  if (!apps_node)
    throw ConfigError(origin, "missing required 'apps' array");
  const toml::array *apps = apps_node->as_array();
  if (!apps)
    throw ConfigError(origin, "'apps' must be an array");

  auto data = std::make_unique<ConfigData>();
  data->source = origin;
  data->apps.reserve(apps->size());
  for (size_t i = 0; i < apps->size(); ++i)
    data->apps.emplace_back(parse_app(*apps->get(i), origin, i));
  data->settings = parse_settings(config.get("launcher"), origin);

  TRACE_DEBUG("CONFIG", "loaded " + std::to_string(data->apps.size()) +
                            " apps from " + sanitize(origin));
  return data;
}

std::unique_ptr<ConfigData> load_config(const std::string &file_path) {
  std::ifstream in(file_path, std::ios::in | std::ios::binary);
  if (!in)
    throw std::runtime_error("Cannot open config file: " + file_path);

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad())
    throw std::runtime_error("Failed to read config file: " + file_path);

  return ConfigData::load_from_string(buffer.str(), file_path);
}

std::unique_ptr<ConfigData>
ConfigData::load_from_file(const std::string &file_path) {
  return load_config(file_path);
}

std::string default_config_path() {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (usable_base(xdg))
    return std::string(xdg) + "/term-launcher/config.toml";
  const char *home = std::getenv("HOME");
  if (usable_base(home))
    return std::string(home) + "/.config/term-launcher/config.toml";
  return "";
}

} // namespace term_launcher
