#pragma once

#include "ftxui/dom/elements.hpp"
#include "tui_menu.hpp"
#include <string>

namespace term_launcher {

/**
 * @brief 菜单画面：标题 + 应用列表 + 状态行 + 按键说明
 *
 * 只负责生成画面，不持有终端。输出通过TerminalGuard::draw()写出
 */
class MenuRenderer {
public:
  /// 列表以外占用的行数（边框、标题、分隔线、状态行、按键说明）
  static constexpr int CHROME_ROWS = 7;

  explicit MenuRenderer(const MenuModel &menu,
                        std::string title = "Term Launcher");

  ftxui::Element document() const;

  /// 渲染成cols x rows的完整画面（含ANSI属性）
  std::string render_frame(int cols, int rows) const;

  /// rows行的终端里列表能显示几行，用于翻页
  static size_t visible_rows(int rows);

private:
  const MenuModel &menu_;
  std::string title_;

  ftxui::Element render_list() const;
  ftxui::Element render_status() const;
};

} // namespace term_launcher
