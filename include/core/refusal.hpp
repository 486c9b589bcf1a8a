#pragma once

#include <optional>
#include <string>
#include <utility>

namespace term_launcher {

/// 拒绝启动的原因（封闭集合）
enum class RefusalReason {
  UNRESOLVABLE,            // 非法命令形式，或白名单目录中不存在
  NOT_FOUND,               // 绝对路径不存在
  NOT_EXECUTABLE,          // 不是可执行的普通文件
  CANONICALIZATION_FAILED, // 符号链接解析失败（循环、悬空、I/O错误）
  SPAWN_FAILED,            // 所有检查通过后进程创建失败
  OUTSIDE_ALLOWLIST        // 白名单内的符号链接指向白名单之外
};

/// 枚举名，用于日志和测试输出
const char *refusal_name(RefusalReason reason);

/// 面向用户的简短说明
const char *refusal_text(RefusalReason reason);

struct Refusal {
  RefusalReason reason = RefusalReason::UNRESOLVABLE;
  std::string command; // 原始命令字符串（未清洗，仅用于诊断）
  std::string detail;
  int os_error = 0;

  static Refusal make(RefusalReason reason, const std::string &command,
                      const std::string &detail = "", int os_error = 0) {
    return {reason, command, detail, os_error};
  }

  /**
   * @brief 生成可直接显示的拒绝信息
   *
   * 格式："Refusing to launch <cmd>: <说明> (<detail>) [<strerror>]"
   * 结果已经过sanitize，可以安全地放进终端UI
   */
  std::string message() const;
};

/**
 * @brief 成功值或拒绝原因二选一
 *
 * 拒绝是预期内的结果，不走异常路径
 */
template <typename T> struct Result {
  std::optional<T> value;
  std::optional<Refusal> refusal;

  bool ok() const { return value.has_value(); }

  static Result success(T v) {
    Result result;
    result.value = std::move(v);
    return result;
  }

  static Result failure(Refusal r) {
    Result result;
    result.refusal = std::move(r);
    return result;
  }
};

} // namespace term_launcher
