#pragma once

#include <string>
#include <termios.h>

namespace term_launcher {

/**
 * @brief 终端设备抽象
 *
 * TerminalGuard只通过这个接口操作终端，测试中用假设备替换
 */
class TerminalDevice {
public:
  static constexpr int READ_TIMEOUT = -1;
  static constexpr int READ_EOF = -2;
  static constexpr int READ_INTERRUPTED = -3;

  virtual ~TerminalDevice() = default;

  /// 关闭行缓冲/回显/信号键
  virtual bool enable_raw_mode() = 0;

  /// 恢复到设备打开时的原始模式
  virtual bool restore_mode() = 0;

  virtual bool write(const std::string &data) = 0;

  /**
   * @brief 读一个字节
   * @param timeout_ms 超时毫秒数，负数表示无限等待
   * @return 0-255为字节值，否则为READ_TIMEOUT/READ_EOF/READ_INTERRUPTED
   */
  virtual int read_byte(int timeout_ms) = 0;

  /// 信号处理器中调用：只允许async-signal-safe操作
  virtual void emergency_restore() noexcept = 0;
};

/**
 * @brief 真实终端：优先/dev/tty，不可用时退回stdin/stdout
 *
 * 原始termios在构造时（失败则在第一次enable_raw_mode时）保存一次，
 * 之后不再覆盖。子进程改乱的终端模式在leave/紧急恢复时被还原。
 */
class TtyDevice : public TerminalDevice {
public:
  TtyDevice();
  /// 使用已打开的终端fd（不接管所有权）
  explicit TtyDevice(int fd);
  ~TtyDevice() override;

  TtyDevice(const TtyDevice &) = delete;
  TtyDevice &operator=(const TtyDevice &) = delete;

  bool is_terminal() const;

  bool enable_raw_mode() override;
  bool restore_mode() override;
  bool write(const std::string &data) override;
  int read_byte(int timeout_ms) override;
  void emergency_restore() noexcept override;

private:
  bool snapshot_original_mode();

  int tty_fd_ = -1;
  int in_fd_;
  int out_fd_;
  struct termios saved_ {};
  bool saved_valid_ = false;
  bool raw_ = false;
};

} // namespace term_launcher
