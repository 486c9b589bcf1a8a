#include "core/sanitizer.hpp"

#include <doctest/doctest.h>
#include <string>
#include <vector>

using namespace term_launcher;

namespace {
const std::string FFFD = "\xEF\xBF\xBD";
}

// ============================================================================
// SANITIZER
// ============================================================================

TEST_CASE("Sanitizer: printable text is unchanged") {
  CHECK(sanitize("htop") == "htop");
  CHECK(sanitize("Midnight Commander") == "Midnight Commander");
  CHECK(sanitize("") == "");
  CHECK(sanitize("\xE7\xBC\x96\xE8\xBE\x91\xE5\x99\xA8") ==
        "\xE7\xBC\x96\xE8\xBE\x91\xE5\x99\xA8"); // "编辑器"
  CHECK(sanitize("\xF0\x9F\x9A\x80 rocket") == "\xF0\x9F\x9A\x80 rocket");
}

TEST_CASE("Sanitizer: escape sequences cannot reach the terminal") {
  CHECK(sanitize("\x1b[31mred\x1b[0m") == "[31mred[0m");
  CHECK(sanitize("\x1b]0;title\x07") == "]0;title");
  CHECK(sanitize("a\x1b") == "a");
}

TEST_CASE("Sanitizer: C0, DEL and C1 controls are removed") {
  CHECK(sanitize("a\nb\rc") == "abc");
  CHECK(sanitize(std::string("a\0b", 3)) == "ab");
  CHECK(sanitize("del\x7f") == "del");
  CHECK(sanitize("next\xC2\x85line") == "nextline");  // U+0085
  CHECK(sanitize("csi\xC2\x9B" "2J") == "csi2J");     // U+009B
}

TEST_CASE("Sanitizer: tab becomes a single space") {
  CHECK(sanitize("a\tb") == "a b");
  CHECK(sanitize("\t\t") == "  ");
}

TEST_CASE("Sanitizer: malformed UTF-8 is replaced") {
  // 单字节CSI
  CHECK(sanitize("\x9b" "2J") == FFFD + "2J");
  // 过长编码的'/'
  CHECK(sanitize("\xC0\xAF") == FFFD + FFFD);
  // 代理区
  CHECK(sanitize("\xED\xA0\x80") == FFFD + FFFD + FFFD);
  // 超出U+10FFFF
  CHECK(sanitize("\xF4\x90\x80\x80") == FFFD + FFFD + FFFD + FFFD);
  // 截断
  CHECK(sanitize("ab\xE2\x82") == "ab" + FFFD + FFFD);
  CHECK(sanitize("\xFF") == FFFD);
}

TEST_CASE("Sanitizer: idempotent") {
  const std::vector<std::string> samples = {
      "plain",
      "\x1b[2J\x1b[H",
      "tab\there",
      "\x9b\xC0\xAF\xED\xA0\x80",
      "mixed \xE2\x82\xAC \x07 \xC2\x85 \xF0\x9F\x98\x80",
      std::string("nul\0byte", 8),
  };
  for (const auto &sample : samples) {
    const std::string once = sanitize(sample);
    CHECK(sanitize(once) == once);
  }
}

TEST_CASE("Sanitizer: control classification") {
  CHECK(is_control_code_point(0x00));
  CHECK(is_control_code_point(0x1B));
  CHECK(is_control_code_point(0x7F));
  CHECK(is_control_code_point(0x9B));
  CHECK_FALSE(is_control_code_point(0x20));
  CHECK_FALSE(is_control_code_point(0xA0));
  CHECK_FALSE(is_control_code_point(0x4E2D));
}
