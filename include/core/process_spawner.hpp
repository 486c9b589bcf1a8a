#pragma once

#include <string>
#include <vector>

namespace term_launcher {

/// 子进程退出状态
struct ExitStatus {
  bool signaled = false; // true: 被信号终止
  int code = 0;          // 正常退出时的退出码
  int signal = 0;        // signaled时的信号编号

  bool success() const { return !signaled && code == 0; }

  /// shell惯例的退出码：被信号终止时为128+signal
  int shell_code() const { return signaled ? 128 + signal : code; }

  /// "exit code 3" / "killed by signal 9 (Killed)"
  std::string describe() const;

  static ExitStatus from_wait_status(int wait_status);
};

/// 解析+校验后的命令，只被消费一次，不缓存
struct ResolvedCommand {
  std::string absolute_path;
  std::vector<std::string> args;
};

struct SpawnOutcome {
  bool started = false;
  ExitStatus status;
  int os_error = 0;
  std::string stage; // 失败阶段：pipe / fork / exec / waitpid
};

/**
 * @brief 进程创建接口
 *
 * 同步执行：run()阻塞到子进程退出。子进程继承控制终端。
 */
class ProcessSpawner {
public:
  virtual ~ProcessSpawner() = default;

  /**
   * @param command 规范化路径 + 参数列表（逐项传递，不经过shell）
   * @param argv0 子进程看到的argv[0]
   */
  virtual SpawnOutcome run(const ResolvedCommand &command,
                           const std::string &argv0) = 0;
};

/**
 * @brief fork + execv实现
 *
 * - exec失败时通过O_CLOEXEC管道把errno传回父进程
 * - 等待期间父进程忽略SIGINT/SIGQUIT，由前台子进程处理
 * - 子进程恢复默认信号处理和空信号掩码后再exec
 */
class PosixSpawner : public ProcessSpawner {
public:
  SpawnOutcome run(const ResolvedCommand &command,
                   const std::string &argv0) override;
};

} // namespace term_launcher
