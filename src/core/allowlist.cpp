#include "core/allowlist.hpp"

#include <cstdlib>
#include <filesystem>

namespace term_launcher {

AllowlistDirectories AllowlistDirectories::standard(const char *home) {
  AllowlistDirectories allowlist;
  allowlist.directories = {"/usr/bin", "/usr/local/bin", "/bin"};
  if (home && home[0] == '/') {
    allowlist.directories.push_back(
        (std::filesystem::path(home) / ".local/bin").string());
  }
  return allowlist;
}

AllowlistDirectories AllowlistDirectories::from_environment() {
  return standard(std::getenv("HOME"));
}

} // namespace term_launcher
