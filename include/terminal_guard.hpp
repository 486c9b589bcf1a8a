#pragma once

#include "terminal_device.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace term_launcher {

enum class TerminalMode { NORMAL, UI_ACTIVE };

const char *terminal_mode_name(TerminalMode mode);

// Linus风格的终端管理：RAII + 原子操作 + 极简信号处理
//
// 状态机只有两个状态：NORMAL <-> UI_ACTIVE
// 析构时保证离开UI；致命信号时做紧急恢复后按默认动作退出
class TerminalGuard {
public:
  explicit TerminalGuard(TerminalDevice &device,
                         bool install_signal_handlers = true);
  ~TerminalGuard();

  // 禁用拷贝和移动
  TerminalGuard(const TerminalGuard &) = delete;
  TerminalGuard &operator=(const TerminalGuard &) = delete;
  TerminalGuard(TerminalGuard &&) = delete;
  TerminalGuard &operator=(TerminalGuard &&) = delete;

  /**
   * @brief NORMAL -> UI_ACTIVE：raw模式 + 备用屏幕 + 隐藏光标
   * @return 已经处于UI_ACTIVE也返回true；设备拒绝raw模式时返回false
   */
  bool enter_ui();

  /**
   * @brief UI_ACTIVE -> NORMAL；NORMAL下调用无任何效果
   * @param clear_screen 回到主屏幕后再清屏（交给子进程前使用）
   */
  void leave_ui(bool clear_screen = false);

  TerminalMode mode() const {
    return ui_active_.load() ? TerminalMode::UI_ACTIVE : TerminalMode::NORMAL;
  }
  bool ui_active() const { return ui_active_.load(); }

  /// 从左上角覆盖输出一帧画面，只在UI_ACTIVE时有效
  bool draw(const std::string &frame);

  /**
   * @brief NORMAL模式下显示提示并阻塞读取一个按键
   * @return 按键字节；输入结束时为TerminalDevice::READ_EOF
   */
  int wait_for_key(const std::string &prompt);

  TerminalDevice &device() { return device_; }

  // 全局清理函数 - 可从信号处理器调用
  static void restore_terminal() noexcept;

private:
  static constexpr int HANDLED_SIGNALS[] = {SIGTERM, SIGHUP, SIGQUIT, SIGABRT,
                                            SIGINT};
  static constexpr int HANDLED_SIGNAL_COUNT =
      sizeof(HANDLED_SIGNALS) / sizeof(HANDLED_SIGNALS[0]);

  static std::atomic<TerminalGuard *> active_;
  static std::atomic<bool> cleanup_in_progress_;

  TerminalDevice &device_;
  std::atomic<bool> ui_active_{false};
  bool handlers_installed_ = false;
  struct sigaction previous_actions_[HANDLED_SIGNAL_COUNT];

  void setup_signals();
  void restore_signals();
  static void signal_handler(int sig);
};

/**
 * @brief 启动子进程期间暂停UI
 *
 * 构造时离开UI；正常离开作用域时，如果之前处于UI则重新进入。
 * 因异常离开作用域时保持NORMAL，让异常带着已恢复的终端继续传播。
 */
class UiSuspendScope {
public:
  explicit UiSuspendScope(TerminalGuard &guard);
  ~UiSuspendScope();

  UiSuspendScope(const UiSuspendScope &) = delete;
  UiSuspendScope &operator=(const UiSuspendScope &) = delete;

  bool was_active() const { return was_active_; }

  /// 提前恢复UI；返回enter_ui()的结果
  bool resume();

private:
  TerminalGuard &guard_;
  bool was_active_;
  bool resumed_ = false;
  int uncaught_on_entry_;
};

} // namespace term_launcher
