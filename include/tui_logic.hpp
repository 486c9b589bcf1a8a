#pragma once

#include "core/launch_orchestrator.hpp"
#include "render/menu_renderer.hpp"
#include "ftxui/screen/terminal.hpp"
#include "terminal_guard.hpp"
#include "tui_keys.hpp"
#include "tui_menu.hpp"

namespace term_launcher {

/**
 * @brief UI逻辑控制器
 *
 * 负责：
 * - 按键事件处理和菜单导航
 * - 启动选中应用（经LaunchOrchestrator交出终端）
 * - 终端尺寸变化时重绘
 */
class UILogic {
public:
  /// 无按键时检查终端尺寸的间隔
  static constexpr int RESIZE_POLL_MS = 250;

  UILogic(MenuModel &menu, TerminalGuard &guard,
          LaunchOrchestrator &orchestrator);

  /**
   * @brief 运行主循环直到用户退出
   * @return 程序退出码
   * @throws std::runtime_error 无法进入或恢复UI
   */
  int run();

  /**
   * @brief 处理一个按键
   * @return false表示退出
   */
  bool handle_key(const KeyEvent &key);

private:
  MenuModel &menu_;
  TerminalGuard &guard_;
  LaunchOrchestrator &orchestrator_;
  MenuRenderer renderer_;
  ftxui::Dimensions size_{80, 24};

  void redraw();
  bool refresh_size();
  void launch(size_t index);
};

} // namespace term_launcher
