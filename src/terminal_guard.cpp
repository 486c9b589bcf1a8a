#include "terminal_guard.hpp"
#include "terminal_core.hpp"
#include "trace.hpp"

#include <exception>

namespace term_launcher {

// 静态成员定义
std::atomic<TerminalGuard *> TerminalGuard::active_{nullptr};
std::atomic<bool> TerminalGuard::cleanup_in_progress_{false};

const char *terminal_mode_name(TerminalMode mode) {
  return mode == TerminalMode::UI_ACTIVE ? "UiActive" : "Normal";
}

TerminalGuard::TerminalGuard(TerminalDevice &device,
                             bool install_signal_handlers)
    : device_(device) {
  if (install_signal_handlers)
    setup_signals();
}

TerminalGuard::~TerminalGuard() {
  leave_ui();
  if (handlers_installed_)
    restore_signals();
}

bool TerminalGuard::enter_ui() {
  if (ui_active_.load())
    return true;

  if (!device_.enable_raw_mode()) {
    TRACE_CRITICAL("TERMINAL", "cannot switch terminal to raw mode");
    return false;
  }
  if (!device_.write(Terminal::ENTER_UI_SEQUENCE))
    TRACE_WARN("TERMINAL", "failed to write enter-UI sequence");

  TRACE_DEBUG("TERMINAL", "Normal -> UiActive");
  // UI占用屏幕期间不向stderr输出日志
  Trace::set_console_enabled(false);
  ui_active_.store(true);
  return true;
}

void TerminalGuard::leave_ui(bool clear_screen) {
  if (!ui_active_.exchange(false))
    return;

  bool restored = device_.write(Terminal::LEAVE_UI_SEQUENCE);
  if (clear_screen)
    restored = device_.write(Terminal::CLEAR_SCREEN_SEQUENCE) && restored;
  const bool mode_restored = device_.restore_mode();

  Trace::set_console_enabled(true);
  if (!restored)
    TRACE_WARN("TERMINAL", "failed to write leave-UI sequence");
  if (!mode_restored)
    TRACE_CRITICAL("TERMINAL", "failed to restore cooked terminal mode");
  TRACE_DEBUG("TERMINAL", "UiActive -> Normal");
}

bool TerminalGuard::draw(const std::string &frame) {
  if (!ui_active_.load())
    return false;
  return device_.write(Terminal::CURSOR_HOME_SEQUENCE + frame);
}

int TerminalGuard::wait_for_key(const std::string &prompt) {
  if (ui_active_.load()) {
    TRACE_WARN("TERMINAL", "wait_for_key called while UI is active");
    return TerminalDevice::READ_EOF;
  }

  if (!device_.write(prompt))
    TRACE_WARN("TERMINAL", "failed to write prompt");

  // 关闭回显读一个键，随后恢复cooked模式
  if (!device_.enable_raw_mode())
    return TerminalDevice::READ_EOF;
  int key = TerminalDevice::READ_INTERRUPTED;
  while (key == TerminalDevice::READ_INTERRUPTED ||
         key == TerminalDevice::READ_TIMEOUT)
    key = device_.read_byte(-1);
  if (!device_.restore_mode())
    TRACE_CRITICAL("TERMINAL", "failed to restore cooked terminal mode");
  if (!device_.write("\n"))
    TRACE_WARN("TERMINAL", "failed to write newline after prompt");
  return key;
}

void TerminalGuard::restore_terminal() noexcept {
  if (cleanup_in_progress_.exchange(true))
    return;
  TerminalGuard *guard = active_.load();
  if (guard && guard->ui_active_.exchange(false))
    guard->device_.emergency_restore();
  cleanup_in_progress_.store(false);
}

void TerminalGuard::setup_signals() {
  // 同一时刻只有一个guard接管信号
  TerminalGuard *expected = nullptr;
  if (!active_.compare_exchange_strong(expected, this)) {
    TRACE_WARN("TERMINAL", "another TerminalGuard already owns signal handling");
    return;
  }

  // Linus哲学：捕获关键信号，确保终端状态正确恢复
  struct sigaction action {};
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  for (int i = 0; i < HANDLED_SIGNAL_COUNT; ++i)
    sigaction(HANDLED_SIGNALS[i], &action, &previous_actions_[i]);

  // 写已关闭的终端时返回EPIPE而不是被杀死
  signal(SIGPIPE, SIG_IGN);
  handlers_installed_ = true;
}

void TerminalGuard::restore_signals() {
  for (int i = 0; i < HANDLED_SIGNAL_COUNT; ++i)
    sigaction(HANDLED_SIGNALS[i], &previous_actions_[i], nullptr);
  handlers_installed_ = false;
  active_.store(nullptr);
}

void TerminalGuard::signal_handler(int sig) {
  restore_terminal();

  // 恢复默认动作并重新投递，退出状态如实反映信号
  struct sigaction action {};
  action.sa_handler = SIG_DFL;
  sigemptyset(&action.sa_mask);
  sigaction(sig, &action, nullptr);
  raise(sig);
}

UiSuspendScope::UiSuspendScope(TerminalGuard &guard)
    : guard_(guard), was_active_(guard.ui_active()),
      uncaught_on_entry_(std::uncaught_exceptions()) {
  guard_.leave_ui(true);
}

UiSuspendScope::~UiSuspendScope() {
  if (!was_active_ || resumed_)
    return;
  // 异常传播中：保持NORMAL
  if (std::uncaught_exceptions() > uncaught_on_entry_) {
    TRACE_WARN("TERMINAL", "launch aborted by exception, UI left suspended");
    return;
  }
  if (!guard_.enter_ui())
    TRACE_CRITICAL("TERMINAL", "failed to resume UI after launch");
}

bool UiSuspendScope::resume() {
  resumed_ = true;
  if (!was_active_)
    return true;
  return guard_.enter_ui();
}

} // namespace term_launcher
