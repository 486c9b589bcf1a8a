#pragma once

#include <string>
#include <vector>

namespace term_launcher {

/**
 * @brief 裸命令名的查找目录（固定顺序）
 *
 * 启动时构造一次，之后只读，显式传给CommandResolver。
 * 顺序：/usr/bin, /usr/local/bin, /bin, $HOME/.local/bin
 */
struct AllowlistDirectories {
  std::vector<std::string> directories;

  /// 白名单内的符号链接最终目标必须仍在白名单目录内
  bool confine_symlink_targets = true;

  /// 跳过组/其他用户可写的目录
  bool skip_writable_directories = true;

  /**
   * @brief 标准目录集合
   * @param home $HOME的值；为空、nullptr或非绝对路径时省略~/.local/bin
   */
  static AllowlistDirectories standard(const char *home);

  /// 读取环境变量HOME构造标准集合
  static AllowlistDirectories from_environment();
};

} // namespace term_launcher
