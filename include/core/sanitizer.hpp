#pragma once

#include <cstdint>
#include <string>

namespace term_launcher {

/// Unicode "Cc"类控制字符：C0、DEL、C1
bool is_control_code_point(std::uint32_t code_point);

/**
 * @brief 清洗显示用字符串，防止终端转义序列注入
 *
 * - 删除所有控制字符（C0、DEL、C1，包括ESC）
 * - Tab替换为空格
 * - 非法UTF-8字节（包括单字节CSI 0x9B）替换为U+FFFD
 *
 * 纯函数，幂等：sanitize(sanitize(s)) == sanitize(s)
 * 只用于name/key等显示字段，绝不用于cmd/args
 */
std::string sanitize(const std::string &input);

} // namespace term_launcher
