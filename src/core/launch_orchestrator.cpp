#include "core/launch_orchestrator.hpp"
#include "core/executable_validator.hpp"
#include "core/sanitizer.hpp"
#include "trace.hpp"

namespace term_launcher {

LaunchOrchestrator::LaunchOrchestrator(const AllowlistDirectories &allowlist,
                                       TerminalGuard &guard,
                                       ProcessSpawner &spawner,
                                       LaunchOptions options)
    : resolver_(allowlist), guard_(guard), spawner_(spawner),
      options_(options) {}

Result<ResolvedCommand>
LaunchOrchestrator::prepare(const AppEntry &entry) const {
  auto resolved = resolver_.resolve(entry.cmd);
  if (!resolved.ok())
    return Result<ResolvedCommand>::failure(*resolved.refusal);

  // 校验紧挨着启动，缩小检查与exec之间的窗口
  if (auto refusal = validate_executable(*resolved.value))
    return Result<ResolvedCommand>::failure(*refusal);

  return Result<ResolvedCommand>::success(
      ResolvedCommand{*resolved.value, entry.args});
}

Result<ExitStatus> LaunchOrchestrator::launch(const AppEntry &entry) {
  TRACE_DEBUG("LAUNCH", "launch requested: " + sanitize(entry.name) + " (" +
                            sanitize(entry.cmd) + ")");

  auto prepared = prepare(entry);
  if (!prepared.ok()) {
    TRACE_WARN("LAUNCH", prepared.refusal->message());
    return Result<ExitStatus>::failure(*prepared.refusal);
  }
  const ResolvedCommand &command = *prepared.value;

  SpawnOutcome outcome;
  {
    UiSuspendScope suspend(guard_);
    outcome = spawner_.run(command, entry.cmd);

    if (outcome.started && suspend.was_active() && options_.pause_after_exit) {
      const int key = guard_.wait_for_key(
          "\nProcess exited with " + outcome.status.describe() +
          "\nPress any key to return to the launcher...");
      if (key == TerminalDevice::READ_EOF)
        TRACE_WARN("LAUNCH", "terminal input closed while waiting for a key");
    }
  }

  if (!outcome.started) {
    Refusal refusal = Refusal::make(RefusalReason::SPAWN_FAILED, entry.cmd,
                                    outcome.stage + " failed",
                                    outcome.os_error);
    TRACE_CRITICAL("LAUNCH", refusal.message());
    return Result<ExitStatus>::failure(refusal);
  }

  TRACE_DEBUG("LAUNCH", command.absolute_path + " -> " +
                            outcome.status.describe());
  return Result<ExitStatus>::success(outcome.status);
}

} // namespace term_launcher
