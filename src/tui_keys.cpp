#include "tui_keys.hpp"
#include "terminal_device.hpp"

namespace term_launcher {

namespace {

// 读取一个字节，EINTR时重试
int next_byte(const KeyDecoder::ByteSource &next, int timeout_ms) {
  int byte = TerminalDevice::READ_INTERRUPTED;
  while (byte == TerminalDevice::READ_INTERRUPTED)
    byte = next(timeout_ms);
  return byte;
}

KeyEvent from_final(int final_byte) {
  switch (final_byte) {
  case 'A':
    return KeyEvent::of(KeyType::UP);
  case 'B':
    return KeyEvent::of(KeyType::DOWN);
  case 'H':
    return KeyEvent::of(KeyType::HOME);
  case 'F':
    return KeyEvent::of(KeyType::END);
  default:
    return KeyEvent::of(KeyType::NONE);
  }
}

KeyEvent from_tilde_code(int code) {
  switch (code) {
  case 1:
  case 7:
    return KeyEvent::of(KeyType::HOME);
  case 4:
  case 8:
    return KeyEvent::of(KeyType::END);
  case 5:
    return KeyEvent::of(KeyType::PAGE_UP);
  case 6:
    return KeyEvent::of(KeyType::PAGE_DOWN);
  default:
    return KeyEvent::of(KeyType::NONE);
  }
}

} // namespace

KeyEvent KeyDecoder::read_key(const ByteSource &next, int idle_timeout_ms) {
  const int byte = next_byte(next, idle_timeout_ms);
  if (byte == TerminalDevice::READ_TIMEOUT)
    return KeyEvent::of(KeyType::NONE);
  if (byte == TerminalDevice::READ_EOF)
    return KeyEvent::of(KeyType::END_OF_INPUT);

  switch (byte) {
  case 0x1b:
    return decode_escape(next);
  case '\r':
  case '\n':
    return KeyEvent::of(KeyType::ENTER);
  case 0x03:
    return KeyEvent::of(KeyType::CTRL_C);
  case 0x04: // Ctrl-D
    return KeyEvent::of(KeyType::END_OF_INPUT);
  default:
    break;
  }

  if (byte >= 0x20 && byte < 0x7f)
    return KeyEvent::character(static_cast<char>(byte));
  return KeyEvent::of(KeyType::NONE);
}

KeyEvent KeyDecoder::decode_escape(const ByteSource &next) {
  const int intro = next_byte(next, ESCAPE_TIMEOUT_MS);
  if (intro == TerminalDevice::READ_TIMEOUT ||
      intro == TerminalDevice::READ_EOF)
    return KeyEvent::of(KeyType::ESCAPE);

  if (intro == 'O') {
    const int final_byte = next_byte(next, ESCAPE_TIMEOUT_MS);
    return final_byte < 0 ? KeyEvent::of(KeyType::ESCAPE)
                          : from_final(final_byte);
  }
  // ESC ESC：第一个ESC当作Escape
  if (intro == 0x1b)
    return KeyEvent::of(KeyType::ESCAPE);
  if (intro != '[')
    return KeyEvent::of(KeyType::NONE);

  // CSI：参数字节(0x30-0x3f)之后跟一个结束字节(0x40-0x7e)
  int code = 0;
  bool has_code = false;
  bool first_param = true;
  for (;;) {
    const int b = next_byte(next, ESCAPE_TIMEOUT_MS);
    if (b < 0)
      return KeyEvent::of(KeyType::NONE);
    if (b >= '0' && b <= '9') {
      if (first_param && code < 1000) {
        code = code * 10 + (b - '0');
        has_code = true;
      }
      continue;
    }
    // 只取第一个参数，';'之后的修饰键参数忽略
    if (b >= 0x30 && b <= 0x3f) {
      first_param = false;
      continue;
    }
    if (b == '~')
      return has_code ? from_tilde_code(code) : KeyEvent::of(KeyType::NONE);
    if (b >= 0x40 && b <= 0x7e)
      return from_final(b);
    return KeyEvent::of(KeyType::NONE);
  }
}

} // namespace term_launcher
