#include "core/refusal.hpp"
#include "core/sanitizer.hpp"

#include <cstring>

namespace term_launcher {

const char *refusal_name(RefusalReason reason) {
  switch (reason) {
  case RefusalReason::UNRESOLVABLE:
    return "Unresolvable";
  case RefusalReason::NOT_FOUND:
    return "NotFound";
  case RefusalReason::NOT_EXECUTABLE:
    return "NotExecutable";
  case RefusalReason::CANONICALIZATION_FAILED:
    return "CanonicalizationFailed";
  case RefusalReason::SPAWN_FAILED:
    return "SpawnFailed";
  case RefusalReason::OUTSIDE_ALLOWLIST:
    return "OutsideAllowlist";
  }
  return "Unknown";
}

const char *refusal_text(RefusalReason reason) {
  switch (reason) {
  case RefusalReason::UNRESOLVABLE:
    return "not found in allowlisted directories";
  case RefusalReason::NOT_FOUND:
    return "path does not exist";
  case RefusalReason::NOT_EXECUTABLE:
    return "not an executable regular file";
  case RefusalReason::CANONICALIZATION_FAILED:
    return "cannot resolve symlinks";
  case RefusalReason::SPAWN_FAILED:
    return "process creation failed";
  case RefusalReason::OUTSIDE_ALLOWLIST:
    return "symlink target is outside allowlisted directories";
  }
  return "unknown reason";
}

std::string Refusal::message() const {
  std::string text = "Refusing to launch ";
  text += command.empty() ? std::string("<empty command>") : command;
  text += ": ";
  text += refusal_text(reason);
  if (!detail.empty())
    text += " (" + detail + ")";
  if (os_error != 0)
    text += " [" + std::string(std::strerror(os_error)) + "]";
  // command和detail可能带有配置文件里的控制字符
  return sanitize(text);
}

} // namespace term_launcher
