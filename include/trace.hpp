#pragma once

#include <string>

namespace term_launcher {

enum class TraceLevel { DEBUG, WARN, CRITICAL };

/**
 * 简化版日志输出
 *
 * - 配置了日志文件时写入文件（带时间戳和级别）
 * - 否则写到stderr，但UI占用终端期间不输出，避免破坏画面
 * - DEBUG级别只在--debug时输出
 */
class Trace {
public:
  static bool open_file(const std::string &path);
  static void close_file();

  static void set_debug(bool enabled) { debug_enabled_ = enabled; }
  static bool debug_enabled() { return debug_enabled_; }

  // TerminalGuard在进入/离开UI时切换
  static void set_console_enabled(bool enabled) { console_enabled_ = enabled; }
  static bool console_enabled() { return console_enabled_; }

  static void write(TraceLevel level, const std::string &tag,
                    const std::string &message);

private:
  static bool debug_enabled_;
  static bool console_enabled_;
};

} // namespace term_launcher

#define TRACE_CRITICAL(tag, msg)                                               \
  do {                                                                         \
    ::term_launcher::Trace::write(::term_launcher::TraceLevel::CRITICAL, tag, \
                                  msg);                                        \
  } while (0)

#define TRACE_WARN(tag, msg)                                                   \
  do {                                                                         \
    ::term_launcher::Trace::write(::term_launcher::TraceLevel::WARN, tag,     \
                                  msg);                                        \
  } while (0)

#define TRACE_DEBUG(tag, msg)                                                  \
  do {                                                                         \
    if (::term_launcher::Trace::debug_enabled())                               \
      ::term_launcher::Trace::write(::term_launcher::TraceLevel::DEBUG, tag,  \
                                    msg);                                      \
  } while (0)
