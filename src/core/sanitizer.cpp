#include "core/sanitizer.hpp"

namespace term_launcher {

namespace {

constexpr const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD"; // U+FFFD

} // namespace

bool is_control_code_point(std::uint32_t code_point) {
  return code_point < 0x20 || code_point == 0x7F ||
         (code_point >= 0x80 && code_point <= 0x9F);
}

std::string sanitize(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  const size_t size = input.size();
  size_t i = 0;
  while (i < size) {
    const auto lead = static_cast<unsigned char>(input[i]);

    if (lead < 0x80) {
      if (lead == '\t') {
        output += ' ';
      } else if (!is_control_code_point(lead)) {
        output += static_cast<char>(lead);
      }
      ++i;
      continue;
    }

    size_t length = 0;
    std::uint32_t code_point = 0;
    std::uint32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
      minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
      minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
      minimum = 0x10000;
    } else {
      // 孤立的续字节或非法首字节（含单字节C1）
      output += REPLACEMENT_CHARACTER;
      ++i;
      continue;
    }

    bool well_formed = i + length <= size;
    for (size_t k = 1; well_formed && k < length; ++k) {
      const auto next = static_cast<unsigned char>(input[i + k]);
      if ((next & 0xC0) != 0x80) {
        well_formed = false;
        break;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }

    // 截断、过长编码、代理区、超出U+10FFFF
    if (!well_formed || code_point < minimum || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      output += REPLACEMENT_CHARACTER;
      ++i;
      continue;
    }

    if (!is_control_code_point(code_point))
      output.append(input, i, length);
    i += length;
  }

  return output;
}

} // namespace term_launcher
