#pragma once

#include "core/allowlist.hpp"
#include "core/command_resolver.hpp"
#include "core/process_spawner.hpp"
#include "core/refusal.hpp"
#include "terminal_guard.hpp"
#include "tui_types.hpp"

namespace term_launcher {

struct LaunchOptions {
  /// 子进程退出后显示退出状态并等待按键再回到UI
  bool pause_after_exit = true;
};

/**
 * @brief 启动流程：解析 -> 校验 -> 交出终端 -> 执行 -> 收回终端
 *
 * 所有可预期的失败都以Refusal返回，不抛异常。
 * 协作者（spawner/终端设备）抛出的异常穿过UiSuspendScope继续传播，
 * 终端保持NORMAL。
 */
class LaunchOrchestrator {
public:
  LaunchOrchestrator(const AllowlistDirectories &allowlist,
                     TerminalGuard &guard, ProcessSpawner &spawner,
                     LaunchOptions options = {});

  /// 只做解析和校验，不启动（--check使用）
  Result<ResolvedCommand> prepare(const AppEntry &entry) const;

  Result<ExitStatus> launch(const AppEntry &entry);

private:
  CommandResolver resolver_;
  TerminalGuard &guard_;
  ProcessSpawner &spawner_;
  LaunchOptions options_;
};

} // namespace term_launcher
