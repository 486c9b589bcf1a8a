#pragma once

#include "core/refusal.hpp"
#include <optional>
#include <string>

namespace term_launcher {

/**
 * @brief 启动前的可执行文件检查
 *
 * 依次确认：路径存在、跟随符号链接后是普通文件、至少有一个执行位、
 * 当前进程（有效uid/gid）有执行权限。
 *
 * @return 全部通过时为std::nullopt，否则为NOT_EXECUTABLE
 * @note 紧挨着spawn调用以缩小TOCTOU窗口，但不保证消除
 */
std::optional<Refusal> validate_executable(const std::string &path);

} // namespace term_launcher
