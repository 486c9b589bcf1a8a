#include "terminal_core.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace term_launcher {

bool Terminal::write_all(int fd, const char *data, std::size_t size) {
  if (fd < 0)
    return false;
  while (size > 0) {
    const ssize_t written = ::write(fd, data, size);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
  return true;
}

bool Terminal::write_all(int fd, const char *sequence) {
  if (!sequence)
    return false;
  return write_all(fd, sequence, std::strlen(sequence));
}

} // namespace term_launcher
