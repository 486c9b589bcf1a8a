#pragma once
#include <memory>
#include <string>
#include <vector>

namespace term_launcher {

/**
 * @brief 菜单中的一个应用
 *
 * name/key加载时已清洗，只用于显示；
 * cmd/args原样保存，只用于解析和执行，不做任何修改
 */
struct AppEntry {
  std::string name, key, cmd;
  std::vector<std::string> args;

  /// key恰好是一个可打印ASCII字符时才能当快捷键
  bool has_hotkey() const {
    return key.size() == 1 && key[0] > 0x20 && key[0] < 0x7f;
  }
  char hotkey() const { return has_hotkey() ? key[0] : '\0'; }
};

/// 配置文件中launcher段的选项
struct LauncherSettings {
  bool confine_symlink_targets = true;
  bool skip_writable_directories = true;
  bool pause_after_exit = true;
  std::string log_file;
};

struct ConfigData {
  std::vector<AppEntry> apps;
  LauncherSettings settings;
  std::string source; // 配置来源（文件路径），用于错误信息

  static std::unique_ptr<ConfigData> load_from_file(const std::string &file_path);
  static std::unique_ptr<ConfigData> load_from_string(const std::string &text,
                                                      const std::string &origin);
};

} // namespace term_launcher
