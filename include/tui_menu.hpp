#pragma once
#include "tui_types.hpp"
#include <string>
#include <vector>

namespace term_launcher {

/**
 * @brief 菜单状态：应用列表 + 选中项 + 状态行
 *
 * 导航到边界时停住，不循环。空列表是合法状态，selected()返回nullptr
 */
class MenuModel {
public:
  static constexpr char QUIT_KEY = 'q';

  explicit MenuModel(std::vector<AppEntry> apps);

  const std::vector<AppEntry> &apps() const { return apps_; }
  bool empty() const { return apps_.empty(); }
  size_t selected_index() const { return selected_; }
  const AppEntry *selected() const;

  // ==================== 导航 ====================
  void move_up();
  void move_down();
  void move_home();
  void move_end();
  void page_up(size_t page);
  void page_down(size_t page);
  bool select(size_t index);

  /**
   * @brief 按快捷键查找
   * @return 条目下标；没有可用绑定时返回-1
   */
  int find_hotkey(char key) const;

  /// 条目的快捷键是否生效（冲突的条目只保留显示值）
  bool hotkey_active(size_t index) const;

  // ==================== 状态行 ====================
  void set_status(const std::string &text, bool is_error = false);
  void clear_status();
  const std::string &status() const { return status_; }
  bool status_is_error() const { return status_error_; }

  /// 加载时发现的快捷键问题（与q冲突、重复绑定）
  const std::vector<std::string> &warnings() const { return warnings_; }

private:
  std::vector<AppEntry> apps_;
  std::vector<bool> hotkey_active_;
  std::vector<std::string> warnings_;
  size_t selected_ = 0;
  std::string status_;
  bool status_error_ = false;

  void build_hotkeys();
};

} // namespace term_launcher
