#include "terminal_device.hpp"
#include "terminal_core.hpp"
#include "trace.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace term_launcher {

TtyDevice::TtyDevice() : in_fd_(STDIN_FILENO), out_fd_(STDOUT_FILENO) {
  // 直接打开控制终端，stdout被重定向时UI依然画在终端上
  tty_fd_ = ::open("/dev/tty", O_RDWR | O_CLOEXEC | O_NOCTTY);
  if (tty_fd_ >= 0) {
    in_fd_ = tty_fd_;
    out_fd_ = tty_fd_;
  } else {
    TRACE_DEBUG("TTY", std::string("/dev/tty unavailable: ") +
                           std::strerror(errno) + ", using stdin/stdout");
  }
  snapshot_original_mode();
}

TtyDevice::TtyDevice(int fd) : in_fd_(fd), out_fd_(fd) {
  snapshot_original_mode();
}

TtyDevice::~TtyDevice() {
  if (raw_ && !restore_mode())
    TRACE_WARN("TTY", "failed to restore terminal mode on close");
  if (tty_fd_ >= 0)
    ::close(tty_fd_);
}

bool TtyDevice::snapshot_original_mode() {
  // 只记录一次：之后恢复的永远是启动前的模式
  if (saved_valid_)
    return true;
  saved_valid_ = tcgetattr(in_fd_, &saved_) == 0;
  return saved_valid_;
}

bool TtyDevice::is_terminal() const { return ::isatty(in_fd_) == 1; }

bool TtyDevice::enable_raw_mode() {
  if (raw_)
    return true;

  if (!saved_valid_ && !snapshot_original_mode()) {
    TRACE_CRITICAL("TTY", std::string("tcgetattr failed: ") +
                              std::strerror(errno));
    return false;
  }

  // 以启动时的模式为基础，子进程留下的改动不会带进来
  struct termios raw = saved_;
  raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
  raw.c_cflag |= CS8;
  raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
  // OPOST保留：输出中的'\n'仍由终端转换为"\r\n"
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;

  if (tcsetattr(in_fd_, TCSAFLUSH, &raw) != 0) {
    TRACE_CRITICAL("TTY", std::string("tcsetattr(raw) failed: ") +
                              std::strerror(errno));
    return false;
  }
  raw_ = true;
  return true;
}

bool TtyDevice::restore_mode() {
  if (!raw_)
    return true;
  if (!saved_valid_ || tcsetattr(in_fd_, TCSAFLUSH, &saved_) != 0) {
    TRACE_CRITICAL("TTY", std::string("tcsetattr(restore) failed: ") +
                              std::strerror(errno));
    return false;
  }
  raw_ = false;
  return true;
}

bool TtyDevice::write(const std::string &data) {
  return Terminal::write_all(out_fd_, data);
}

int TtyDevice::read_byte(int timeout_ms) {
  struct pollfd pfd {};
  pfd.fd = in_fd_;
  pfd.events = POLLIN;

  const int ready = ::poll(&pfd, 1, timeout_ms);
  if (ready < 0)
    return errno == EINTR ? READ_INTERRUPTED : READ_EOF;
  if (ready == 0)
    return READ_TIMEOUT;

  unsigned char byte = 0;
  const ssize_t n = ::read(in_fd_, &byte, 1);
  if (n == 1)
    return byte;
  if (n < 0 && (errno == EINTR || errno == EAGAIN))
    return READ_INTERRUPTED;
  return READ_EOF;
}

void TtyDevice::emergency_restore() noexcept {
  // 信号上下文：只用write(2)和tcsetattr(3)
  Terminal::write_all(out_fd_, Terminal::LEAVE_UI_SEQUENCE);
  if (saved_valid_)
    tcsetattr(in_fd_, TCSANOW, &saved_);
}

} // namespace term_launcher
