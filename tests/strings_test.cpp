#include <catch2/catch_test_macros.hpp>
#include "utils/strings.h"

TEST_CASE("utf8_prefix respects codepoint boundaries", "[strings]") {
  using sqlscope::str::utf8_prefix;
  // ASCII
  REQUIRE(utf8_prefix("hello", 5) == "hello");
  REQUIRE(utf8_prefix("hello", 3) == "hel");
  // Multibyte examples: U+3042 (3 bytes), U+3044 (3 bytes)
  std::string s = "あい"; // 6 bytes total
  REQUIRE(utf8_prefix(s, 6) == s);
  REQUIRE(utf8_prefix(s, 5) == "あ"); // should not cut into second codepoint
  REQUIRE(utf8_prefix(s, 3) == "あ");
  REQUIRE(utf8_prefix(s, 2).empty()); // first codepoint doesn't fit fully
}

TEST_CASE("random_hex yields lowercase hex of twice the byte count", "[strings]") {
  auto a = sqlscope::str::random_hex(24);
  auto b = sqlscope::str::random_hex(24);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->size() == 48);
  for (char c : *a) {
    bool is_hex = (('0' <= c && c <= '9') || ('a' <= c && c <= 'f'));
    REQUIRE(is_hex);
  }
  REQUIRE(*a != *b);
}

TEST_CASE("constant_time_equals compares whole strings", "[strings]") {
  using sqlscope::str::constant_time_equals;
  REQUIRE(constant_time_equals("secret", "secret"));
  REQUIRE_FALSE(constant_time_equals("secret", "secreT"));
  REQUIRE_FALSE(constant_time_equals("secret", "secret2"));
  REQUIRE_FALSE(constant_time_equals("", "x"));
  REQUIRE(constant_time_equals("", ""));
}

TEST_CASE("truthy and trim", "[strings]") {
  using sqlscope::str::truthy;
  using sqlscope::str::trim;
  REQUIRE(truthy("1"));
  REQUIRE(truthy("Yes"));
  REQUIRE(truthy("ON"));
  REQUIRE_FALSE(truthy("0"));
  REQUIRE_FALSE(truthy(nullptr));
  REQUIRE(trim("  abc \t") == "abc");
  REQUIRE(trim("   ").empty());
}
