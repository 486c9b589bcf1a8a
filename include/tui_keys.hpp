#pragma once
#include <functional>

namespace term_launcher {

enum class KeyType {
  NONE, // 超时或无法识别的序列
  UP,
  DOWN,
  HOME,
  END,
  PAGE_UP,
  PAGE_DOWN,
  ENTER,
  ESCAPE,
  CTRL_C,
  CHARACTER,
  END_OF_INPUT
};

struct KeyEvent {
  KeyType type = KeyType::NONE;
  char ch = '\0'; // 仅CHARACTER有效

  static KeyEvent of(KeyType type) { return {type, '\0'}; }
  static KeyEvent character(char c) { return {KeyType::CHARACTER, c}; }
};

/**
 * @brief 把raw模式下的字节流解码成按键
 *
 * 支持 ESC [ A/B/H/F、ESC O A/B/H/F 以及 ESC [ n ~ (1/7 Home, 4/8 End,
 * 5 PgUp, 6 PgDn)。单独的ESC在短暂超时后视为Escape。
 */
class KeyDecoder {
public:
  /// 参数为超时毫秒数，返回值约定同TerminalDevice::read_byte()
  using ByteSource = std::function<int(int)>;

  static constexpr int ESCAPE_TIMEOUT_MS = 30;

  /**
   * @brief 读取一个按键
   * @param idle_timeout_ms 等待第一个字节的超时，负数表示无限等待
   */
  static KeyEvent read_key(const ByteSource &next, int idle_timeout_ms);

private:
  static KeyEvent decode_escape(const ByteSource &next);
};

} // namespace term_launcher
