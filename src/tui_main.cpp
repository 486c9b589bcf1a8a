#include "core/allowlist.hpp"
#include "core/launch_orchestrator.hpp"
#include "core/process_spawner.hpp"
#include "core/sanitizer.hpp"
#include "terminal_device.hpp"
#include "terminal_guard.hpp"
#include "trace.hpp"
#include "tui_config.hpp"
#include "tui_logic.hpp"
#include "tui_menu.hpp"
#include "tui_types.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace term_launcher;

namespace {

struct Options {
  std::string config_path;
  std::string log_path;
  std::string run_name;
  bool check = false;
  bool run = false;
  bool debug = false;
};

void show_help() {
  std::cout << "term_launcher - terminal application launcher\n\n"
               "Usage: term_launcher [options]\n\nOptions:\n";
  std::cout << "  --config PATH   config file (default: "
               "$XDG_CONFIG_HOME/term-launcher/config.toml)\n"
               "  --check         resolve and validate every entry, no UI\n"
               "  --run NAME      launch the entry NAME (or its key), no UI\n"
               "  --debug         verbose trace output\n"
               "  --log FILE      write trace output to FILE\n"
               "  --help, -h      show this help\n"
               "  --version, -v   show version\n\nKeys:\n";
  std::cout << "  Up/Down         move\n  Enter           launch selected\n"
               "  <key>           launch by hotkey\n  q/Esc           quit\n";
}

void show_version() { std::cout << "term_launcher v1.0\n"; }

// 返回-1表示继续运行，否则为退出码
int parse_arguments(int argc, char *argv[], Options &options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    auto take_value = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "term_launcher: " << arg << " requires a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      show_help();
      return 0;
    } else if (arg == "--version" || arg == "-v") {
      show_version();
      return 0;
    } else if (arg == "--config") {
      if (!take_value(options.config_path))
        return 1;
    } else if (arg == "--log") {
      if (!take_value(options.log_path))
        return 1;
    } else if (arg == "--run") {
      if (!take_value(options.run_name))
        return 1;
      options.run = true;
    } else if (arg == "--check") {
      options.check = true;
    } else if (arg == "--debug") {
      options.debug = true;
    } else {
      std::cerr << "term_launcher: unknown option '" << sanitize(arg)
                << "'\nTry 'term_launcher --help'.\n";
      return 1;
    }
  }
  if (options.check && options.run) {
    std::cerr << "term_launcher: --check and --run cannot be combined\n";
    return 1;
  }
  return -1;
}

int run_check(const ConfigData &config, LaunchOrchestrator &orchestrator) {
  size_t failures = 0;
  for (const auto &app : config.apps) {
    const auto prepared = orchestrator.prepare(app);
    if (prepared.ok()) {
      std::cout << "OK   " << app.name << ": "
                << sanitize(prepared.value->absolute_path) << "\n";
    } else {
      std::cout << "FAIL " << app.name << ": " << prepared.refusal->message()
                << "\n";
      ++failures;
    }
  }
  std::cout << config.apps.size() - failures << "/" << config.apps.size()
            << " entries launchable\n";
  return failures == 0 ? 0 : 1;
}

int run_single(const ConfigData &config, const std::string &name,
               LaunchOrchestrator &orchestrator) {
  const AppEntry *entry = nullptr;
  for (const auto &app : config.apps) {
    if (app.name == name || app.key == name) {
      entry = &app;
      break;
    }
  }
  if (!entry) {
    std::cerr << "term_launcher: no entry named '" << sanitize(name) << "'\n";
    return 1;
  }

  const auto result = orchestrator.launch(*entry);
  if (!result.ok()) {
    std::cerr << result.refusal->message() << "\n";
    return 127;
  }
  return result.value->shell_code();
}

} // namespace

int main(int argc, char *argv[]) {
  Options options;
  const int parsed = parse_arguments(argc, argv, options);
  if (parsed >= 0)
    return parsed;

  Trace::set_debug(options.debug);

  try {
    std::string config_path = options.config_path;
    if (config_path.empty())
      config_path = default_config_path();
    if (config_path.empty())
      throw std::runtime_error(
          "cannot locate config file: neither XDG_CONFIG_HOME nor HOME is "
          "set, use --config");

    auto config = ConfigData::load_from_file(config_path);

    std::string log_path = options.log_path;
    if (log_path.empty())
      log_path = config->settings.log_file;
    if (!log_path.empty() && !Trace::open_file(log_path))
      std::cerr << "term_launcher: cannot open log file '" << sanitize(log_path)
                << "', logging to stderr\n";

    // 白名单只在启动时构造一次，之后只读
    AllowlistDirectories allowlist_init = AllowlistDirectories::from_environment();
    allowlist_init.confine_symlink_targets =
        config->settings.confine_symlink_targets;
    allowlist_init.skip_writable_directories =
        config->settings.skip_writable_directories;
    const AllowlistDirectories allowlist = allowlist_init;

    TtyDevice device;
    PosixSpawner spawner;
    int exit_code = 0;
    {
      // 只有交互模式接管终端信号
      TerminalGuard guard(device, !options.check && !options.run);
      LaunchOptions launch_options;
      launch_options.pause_after_exit =
          config->settings.pause_after_exit && !options.run;
      LaunchOrchestrator orchestrator(allowlist, guard, spawner,
                                      launch_options);

      if (options.check) {
        exit_code = run_check(*config, orchestrator);
      } else if (options.run) {
        exit_code = run_single(*config, options.run_name, orchestrator);
      } else {
        if (!device.is_terminal())
          throw std::runtime_error("interactive mode requires a terminal");
        MenuModel menu(config->apps);
        UILogic logic(menu, guard, orchestrator);
        exit_code = logic.run();
      }
    }
    Trace::close_file();
    return exit_code;
  } catch (const std::exception &e) {
    // guard已析构，终端处于正常模式
    std::cerr << "term_launcher: " << sanitize(e.what()) << std::endl;
    Trace::close_file();
    return 1;
  }
}
