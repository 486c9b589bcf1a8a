#pragma once

#include "core/allowlist.hpp"
#include "core/refusal.hpp"
#include <string>

namespace term_launcher {

/// 解析结果：规范化后的绝对路径
using ResolveResult = Result<std::string>;

/// 不含'/'的命令名
bool is_bare_command(const std::string &cmd);

/**
 * @brief 命令路径解析器
 *
 * 只接受两种形式：
 * - 绝对路径：直接作为候选，不做白名单目录检查
 * - 裸命令名：按固定顺序在白名单目录中查找，不信任PATH
 *
 * 含'/'的相对路径在访问文件系统之前直接拒绝
 */
class CommandResolver {
public:
  explicit CommandResolver(const AllowlistDirectories &allowlist);

  /**
   * @brief 解析命令到规范化绝对路径
   * @param cmd 配置中的原始命令（逐字节使用，不清洗）
   * @return 成功时为规范路径，失败时为Refusal
   */
  ResolveResult resolve(const std::string &cmd) const;

  const AllowlistDirectories &allowlist() const { return allowlist_; }

private:
  const AllowlistDirectories &allowlist_;

  ResolveResult resolve_absolute(const std::string &cmd) const;
  ResolveResult resolve_bare(const std::string &cmd) const;

  /// 目录存在且（按策略）不可被组/其他用户写入
  bool is_usable_directory(const std::string &directory) const;

  /// 规范路径是否位于某个白名单目录（规范化后）之下
  bool is_inside_allowlist(const std::string &canonical) const;
};

} // namespace term_launcher
