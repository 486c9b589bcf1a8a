#pragma once
#include <memory>
#include <string>

namespace term_launcher {
struct ConfigData;

/// 从TOML文件加载；失败时抛出std::runtime_error
std::unique_ptr<ConfigData> load_config(const std::string &file_path);

/**
 * @brief 默认配置路径
 *
 * $XDG_CONFIG_HOME/term-launcher/config.toml，
 * 否则 $HOME/.config/term-launcher/config.toml。
 * 两个变量都不可用（未设置/空/非绝对路径）时返回空字符串
 */
std::string default_config_path();
} // namespace term_launcher
