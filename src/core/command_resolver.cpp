#include "core/command_resolver.hpp"
#include "trace.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace term_launcher {

namespace {

ResolveResult refuse(RefusalReason reason, const std::string &cmd,
                     const std::string &detail, int os_error = 0) {
  return ResolveResult::failure(
      Refusal::make(reason, cmd, detail, os_error));
}

// 按路径分量比较，避免"/usr/bin2"被当成"/usr/bin"的子路径
bool path_within(const fs::path &base, const fs::path &path) {
  auto base_it = base.begin();
  auto path_it = path.begin();
  for (; base_it != base.end(); ++base_it, ++path_it) {
    if (path_it == path.end() || *base_it != *path_it)
      return false;
  }
  return path_it != path.end();
}

} // namespace

bool is_bare_command(const std::string &cmd) {
  return cmd.find('/') == std::string::npos;
}

CommandResolver::CommandResolver(const AllowlistDirectories &allowlist)
    : allowlist_(allowlist) {}

ResolveResult CommandResolver::resolve(const std::string &cmd) const {
  if (cmd.empty())
    return refuse(RefusalReason::UNRESOLVABLE, cmd, "empty command");
  if (cmd.find('\0') != std::string::npos)
    return refuse(RefusalReason::UNRESOLVABLE, cmd,
                  "command contains a NUL byte");

  if (cmd.front() == '/')
    return resolve_absolute(cmd);

  // 含分隔符的相对路径：不碰文件系统，直接拒绝（防止../穿越）
  if (!is_bare_command(cmd))
    return refuse(RefusalReason::UNRESOLVABLE, cmd,
                  "relative paths are not allowed");

  if (cmd == "." || cmd == "..")
    return refuse(RefusalReason::UNRESOLVABLE, cmd, "not a command name");

  return resolve_bare(cmd);
}

ResolveResult CommandResolver::resolve_absolute(const std::string &cmd) const {
  std::error_code ec;
  const fs::file_status status = fs::symlink_status(cmd, ec);
  if (status.type() == fs::file_type::not_found)
    return refuse(RefusalReason::NOT_FOUND, cmd, "no such path");
  if (ec)
    return refuse(RefusalReason::CANONICALIZATION_FAILED, cmd, "cannot stat",
                  ec.value());

  const fs::path canonical = fs::canonical(cmd, ec);
  if (ec)
    return refuse(RefusalReason::CANONICALIZATION_FAILED, cmd, "",
                  ec.value());

  TRACE_DEBUG("RESOLVE", cmd + " -> " + canonical.string());
  return ResolveResult::success(canonical.string());
}

ResolveResult CommandResolver::resolve_bare(const std::string &cmd) const {
  for (const auto &directory : allowlist_.directories) {
    if (!is_usable_directory(directory)) {
      TRACE_DEBUG("RESOLVE", "skipping directory " + directory);
      continue;
    }

    const fs::path candidate = fs::path(directory) / cmd;
    std::error_code ec;
    const fs::file_status status = fs::symlink_status(candidate, ec);
    if (status.type() == fs::file_type::not_found ||
        status.type() == fs::file_type::none) {
      continue;
    }

    // 第一个包含同名条目的目录胜出，后面的目录不再查看
    const fs::path canonical = fs::canonical(candidate, ec);
    if (ec)
      return refuse(RefusalReason::CANONICALIZATION_FAILED, cmd,
                    candidate.string(), ec.value());

    if (allowlist_.confine_symlink_targets &&
        !is_inside_allowlist(canonical.string())) {
      return refuse(RefusalReason::OUTSIDE_ALLOWLIST, cmd,
                    candidate.string() + " -> " + canonical.string());
    }

    TRACE_DEBUG("RESOLVE", cmd + " -> " + canonical.string());
    return ResolveResult::success(canonical.string());
  }

  return refuse(RefusalReason::UNRESOLVABLE, cmd, "");
}

bool CommandResolver::is_usable_directory(const std::string &directory) const {
  if (!fs::path(directory).is_absolute())
    return false;

  std::error_code ec;
  const fs::file_status status = fs::status(directory, ec);
  if (ec || !fs::is_directory(status))
    return false;
  if (!allowlist_.skip_writable_directories)
    return true;

  const fs::perms writable = fs::perms::group_write | fs::perms::others_write;
  return (status.permissions() & writable) == fs::perms::none;
}

bool CommandResolver::is_inside_allowlist(const std::string &canonical) const {
  for (const auto &directory : allowlist_.directories) {
    if (!is_usable_directory(directory))
      continue;
    std::error_code ec;
    const fs::path base = fs::canonical(directory, ec);
    if (ec)
      continue;
    if (path_within(base, canonical))
      return true;
  }
  return false;
}

} // namespace term_launcher
