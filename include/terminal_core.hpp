#pragma once

#include <cstddef>
#include <string>

namespace term_launcher {

/**
 * 终端核心：统一管理ANSI控制序列 + TTY直接写入
 * 所有写操作只用write(2)，可以在信号处理器里调用
 */
class Terminal {
public:
  /// 进入UI：备用屏幕 + 隐藏光标 + 清屏归位
  static constexpr const char *ENTER_UI_SEQUENCE = "\033[?1049h" // 备用屏幕
                                                   "\033[?25l"   // 隐藏光标
                                                   "\033[2J"     // 清屏
                                                   "\033[H";     // 光标归位

  /// 离开UI：恢复光标和属性，关闭可能残留的鼠标/粘贴模式，回到主屏幕
  static constexpr const char *LEAVE_UI_SEQUENCE =
      "\033[?25h"   // Show cursor
      "\033[0m"     // Reset all attributes (colors, styles)
      "\033[?1000l" // Disable X10 mouse reporting
      "\033[?1002l" // Disable button event tracking
      "\033[?1003l" // Disable any event tracking
      "\033[?1006l" // Disable SGR mouse mode
      "\033[?2004l" // Disable bracketed paste mode
      "\033[?1049l"; // Exit alternate screen + restore cursor

  static constexpr const char *CLEAR_SCREEN_SEQUENCE = "\033[2J\033[H";
  static constexpr const char *CURSOR_HOME_SEQUENCE = "\033[H";

  /**
   * 写完整个缓冲区，处理EINTR和短写
   * @return 全部写出返回true
   */
  static bool write_all(int fd, const char *data, std::size_t size);
  static bool write_all(int fd, const char *sequence);
  static bool write_all(int fd, const std::string &data) {
    return write_all(fd, data.data(), data.size());
  }
};

} // namespace term_launcher
