#include "core/process_spawner.hpp"
#include "trace.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace term_launcher {

namespace {

// 启动器自己接管过的信号，子进程exec前全部恢复默认
constexpr int CHILD_DEFAULT_SIGNALS[] = {SIGINT,  SIGQUIT, SIGTERM, SIGHUP,
                                         SIGABRT, SIGPIPE, SIGCHLD, SIGWINCH};

SpawnOutcome spawn_failure(const std::string &stage, int err) {
  SpawnOutcome outcome;
  outcome.stage = stage;
  outcome.os_error = err;
  TRACE_CRITICAL("SPAWN_ERROR", stage + " failed: " + std::strerror(err));
  return outcome;
}

// 只能在fork后的子进程里调用：全部是async-signal-safe操作
void reset_child_signals() {
  struct sigaction action {};
  action.sa_handler = SIG_DFL;
  sigemptyset(&action.sa_mask);
  for (int sig : CHILD_DEFAULT_SIGNALS)
    sigaction(sig, &action, nullptr);

  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
}

} // namespace

std::string ExitStatus::describe() const {
  if (signaled) {
    const char *name = strsignal(signal);
    return "killed by signal " + std::to_string(signal) +
           (name ? " (" + std::string(name) + ")" : std::string());
  }
  return "exit code " + std::to_string(code);
}

ExitStatus ExitStatus::from_wait_status(int wait_status) {
  ExitStatus status;
  if (WIFEXITED(wait_status)) {
    status.code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    status.signaled = true;
    status.signal = WTERMSIG(wait_status);
  }
  return status;
}

SpawnOutcome PosixSpawner::run(const ResolvedCommand &command,
                               const std::string &argv0) {
  // argv在fork之前准备好，子进程里不再分配内存
  std::vector<std::string> storage;
  storage.reserve(command.args.size() + 1);
  storage.push_back(argv0);
  storage.insert(storage.end(), command.args.begin(), command.args.end());
  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &arg : storage)
    argv.push_back(arg.data());
  argv.push_back(nullptr);

  int error_pipe[2];
  if (pipe2(error_pipe, O_CLOEXEC) != 0)
    return spawn_failure("pipe", errno);

  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  struct sigaction old_int {};
  struct sigaction old_quit {};
  sigaction(SIGINT, &ignore, &old_int);
  sigaction(SIGQUIT, &ignore, &old_quit);

  TRACE_DEBUG("SPAWN", "exec " + command.absolute_path + " argc=" +
                           std::to_string(storage.size()));

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGQUIT, &old_quit, nullptr);
    close(error_pipe[0]);
    close(error_pipe[1]);
    return spawn_failure("fork", err);
  }

  if (pid == 0) {
    close(error_pipe[0]);
    reset_child_signals();
    execv(command.absolute_path.c_str(), argv.data());

    // execv只在失败时返回
    int err = errno;
    while (write(error_pipe[1], &err, sizeof(err)) < 0 && errno == EINTR) {
    }
    _exit(127);
  }

  close(error_pipe[1]);

  // exec成功时管道随O_CLOEXEC关闭，read返回0
  int child_errno = 0;
  ssize_t received = 0;
  do {
    received = read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (received < 0 && errno == EINTR);
  close(error_pipe[0]);

  int wait_status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &wait_status, 0);
  } while (waited < 0 && errno == EINTR);
  const int wait_errno = waited < 0 ? errno : 0;

  sigaction(SIGINT, &old_int, nullptr);
  sigaction(SIGQUIT, &old_quit, nullptr);

  if (received == static_cast<ssize_t>(sizeof(child_errno)))
    return spawn_failure("exec", child_errno);
  if (waited < 0)
    return spawn_failure("waitpid", wait_errno);

  SpawnOutcome outcome;
  outcome.started = true;
  outcome.status = ExitStatus::from_wait_status(wait_status);
  TRACE_DEBUG("SPAWN", command.absolute_path + " finished with " +
                           outcome.status.describe());
  return outcome;
}

} // namespace term_launcher
