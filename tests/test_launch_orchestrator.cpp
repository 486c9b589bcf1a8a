#include "core/launch_orchestrator.hpp"
#include "test_support.hpp"

#include <cerrno>
#include <doctest/doctest.h>
#include <filesystem>
#include <stdexcept>

using namespace term_launcher;
using test_support::FakeSpawner;
using test_support::FakeTerminal;
using test_support::TempDir;

namespace {

AppEntry app(const std::string &cmd, std::vector<std::string> args = {}) {
  AppEntry entry;
  entry.name = "test app";
  entry.key = "t";
  entry.cmd = cmd;
  entry.args = std::move(args);
  return entry;
}

AllowlistDirectories allowlist_of(std::vector<std::string> directories) {
  AllowlistDirectories allowlist;
  allowlist.directories = std::move(directories);
  return allowlist;
}

LaunchOptions no_pause() {
  LaunchOptions options;
  options.pause_after_exit = false;
  return options;
}

} // namespace

// ============================================================================
// REFUSALS
// ============================================================================

TEST_CASE("Orchestrator: refusal is returned unchanged and nothing runs") {
  TempDir tmp;
  const std::string bin = tmp.make_dir("bin");
  const AllowlistDirectories allowlist = allowlist_of({bin});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner, no_pause());

  REQUIRE(guard.enter_ui());
  const std::string before = terminal.output;

  const auto missing = orchestrator.launch(app("htop"));
  REQUIRE_FALSE(missing.ok());
  CHECK(missing.refusal->reason == RefusalReason::UNRESOLVABLE);
  CHECK(missing.refusal->command == "htop");

  const auto traversal = orchestrator.launch(app("../../bin/sh"));
  REQUIRE_FALSE(traversal.ok());
  CHECK(traversal.refusal->reason == RefusalReason::UNRESOLVABLE);

  const auto absent = orchestrator.launch(app(tmp.path() + "/nope"));
  REQUIRE_FALSE(absent.ok());
  CHECK(absent.refusal->reason == RefusalReason::NOT_FOUND);

  CHECK(spawner.commands.empty());
  // 拒绝时不交出终端
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
  CHECK(terminal.output == before);
}

TEST_CASE("Orchestrator: validation failure is NotExecutable") {
  TempDir tmp;
  const std::string data = tmp.write_file("data.txt", "text", 0644);
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner, no_pause());

  const auto result = orchestrator.launch(app(data));
  REQUIRE_FALSE(result.ok());
  CHECK(result.refusal->reason == RefusalReason::NOT_EXECUTABLE);
  CHECK(spawner.commands.empty());
}

// ============================================================================
// TERMINAL HAND-OFF
// ============================================================================

TEST_CASE("Orchestrator: terminal is handed to the child and taken back") {
  TempDir tmp;
  const std::string tool = tmp.make_script("tool");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  spawner.observed_guard = &guard;
  spawner.outcome.status.code = 7;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner, no_pause());

  REQUIRE(guard.enter_ui());
  const AppEntry entry = app(tool, {"--flag", "two words", "$HOME"});
  const auto result = orchestrator.launch(entry);

  REQUIRE(result.ok());
  CHECK(result.value->code == 7);
  REQUIRE(spawner.commands.size() == 1);
  CHECK(spawner.commands[0].absolute_path ==
        std::filesystem::canonical(tool).string());
  CHECK(spawner.commands[0].args == entry.args);
  CHECK(spawner.argv0s[0] == entry.cmd);
  REQUIRE(spawner.modes_during_run.size() == 1);
  CHECK(spawner.modes_during_run[0] == TerminalMode::NORMAL);
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
  CHECK(terminal.raw);
  CHECK(terminal.alternate_screen);
}

TEST_CASE("Orchestrator: launch without an active UI stays Normal") {
  TempDir tmp;
  const std::string tool = tmp.make_script("tool");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner);

  const auto result = orchestrator.launch(app(tool));
  REQUIRE(result.ok());
  CHECK(guard.mode() == TerminalMode::NORMAL);
  // 没有UI时不等待按键
  CHECK(terminal.output.find("Press any key") == std::string::npos);
  CHECK(terminal.raw_enables == 0);
}

TEST_CASE("Orchestrator: pause after exit waits for a key") {
  TempDir tmp;
  const std::string tool = tmp.make_script("tool");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  spawner.outcome.status.code = 2;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner);

  REQUIRE(guard.enter_ui());
  terminal.queue("x");
  const auto result = orchestrator.launch(app(tool));

  REQUIRE(result.ok());
  CHECK(terminal.input.empty());
  CHECK(terminal.output.find("Process exited with exit code 2") !=
        std::string::npos);
  CHECK(terminal.output.find("Press any key to return to the launcher") !=
        std::string::npos);
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
}

TEST_CASE("Orchestrator: spawn failure becomes SpawnFailed") {
  TempDir tmp;
  const std::string tool = tmp.make_script("tool");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  spawner.outcome = SpawnOutcome{};
  spawner.outcome.stage = "fork";
  spawner.outcome.os_error = EAGAIN;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner);

  REQUIRE(guard.enter_ui());
  const auto result = orchestrator.launch(app(tool));
  REQUIRE_FALSE(result.ok());
  CHECK(result.refusal->reason == RefusalReason::SPAWN_FAILED);
  CHECK(result.refusal->os_error == EAGAIN);
  CHECK(result.refusal->detail == "fork failed");
  // 没启动成功就不等待按键
  CHECK(terminal.output.find("Press any key") == std::string::npos);
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
}

TEST_CASE("Orchestrator: exception during spawn leaves the terminal Normal") {
  TempDir tmp;
  const std::string tool = tmp.make_script("tool");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  FakeSpawner spawner;
  spawner.throw_on_run = true;
  {
    TerminalGuard guard(terminal, false);
    LaunchOrchestrator orchestrator(allowlist, guard, spawner);
    REQUIRE(guard.enter_ui());

    CHECK_THROWS_AS(orchestrator.launch(app(tool)), std::runtime_error);
    // 异常穿过暂停作用域时不重新进入UI
    CHECK(guard.mode() == TerminalMode::NORMAL);
    CHECK(terminal.in_normal_mode());
  }
  CHECK(terminal.in_normal_mode());
}

TEST_CASE("Orchestrator: prepare resolves and validates without spawning") {
  TempDir tmp;
  const std::string bin = tmp.make_dir("bin");
  tmp.make_script("bin/tool");
  const AllowlistDirectories allowlist = allowlist_of({bin});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  FakeSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner);

  const auto prepared = orchestrator.prepare(app("tool", {"-v"}));
  REQUIRE(prepared.ok());
  CHECK(prepared.value->absolute_path == bin + "/tool");
  CHECK(prepared.value->args == std::vector<std::string>{"-v"});
  CHECK(spawner.commands.empty());
}

// ============================================================================
// END TO END (real processes)
// ============================================================================

TEST_CASE("Orchestrator: real process exit status is returned") {
  TempDir tmp;
  const std::string script = tmp.make_script("exit5", "exit 5\n");
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  PosixSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner, no_pause());

  REQUIRE(guard.enter_ui());
  const auto result = orchestrator.launch(app(script));
  REQUIRE(result.ok());
  CHECK(result.value->code == 5);
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
}

TEST_CASE("Orchestrator: shell arguments reach the child") {
  const AllowlistDirectories allowlist = AllowlistDirectories::standard(nullptr);
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  PosixSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner, no_pause());

  const auto result =
      orchestrator.launch(app("/bin/sh", {"-c", "exit \"$0\"", "4"}));
  REQUIRE(result.ok());
  CHECK(result.value->code == 4);
}

TEST_CASE("Orchestrator: kernel exec failure is SpawnFailed") {
  TempDir tmp;
  const std::string bogus = tmp.write_file("bogus", "garbage\n", 0755);
  const AllowlistDirectories allowlist = allowlist_of({});
  FakeTerminal terminal;
  TerminalGuard guard(terminal, false);
  PosixSpawner spawner;
  LaunchOrchestrator orchestrator(allowlist, guard, spawner);

  REQUIRE(guard.enter_ui());
  const auto result = orchestrator.launch(app(bogus));
  REQUIRE_FALSE(result.ok());
  CHECK(result.refusal->reason == RefusalReason::SPAWN_FAILED);
  CHECK(result.refusal->os_error == ENOEXEC);
  CHECK(guard.mode() == TerminalMode::UI_ACTIVE);
}
