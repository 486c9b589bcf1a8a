#include "core/executable_validator.hpp"
#include "trace.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace term_launcher {

std::optional<Refusal> validate_executable(const std::string &path) {
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    return Refusal::make(RefusalReason::NOT_EXECUTABLE, path,
                         "does not exist", ec ? ec.value() : ENOENT);
  }

  if (!fs::is_regular_file(status)) {
    return Refusal::make(RefusalReason::NOT_EXECUTABLE, path,
                         "not a regular file");
  }

  const fs::perms any_exec =
      fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
  if ((status.permissions() & any_exec) == fs::perms::none) {
    return Refusal::make(RefusalReason::NOT_EXECUTABLE, path,
                         "no execute permission bits");
  }

  if (faccessat(AT_FDCWD, path.c_str(), X_OK, AT_EACCESS) != 0) {
    const int err = errno;
    return Refusal::make(RefusalReason::NOT_EXECUTABLE, path,
                         "execute permission denied", err);
  }

  TRACE_DEBUG("VALIDATE", path + " is executable");
  return std::nullopt;
}

} // namespace term_launcher
