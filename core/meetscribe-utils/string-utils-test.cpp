#include "string-utils.h"

#include <stdexcept>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("string-utils") {
  SUBCASE("trim") {
    CHECK(trim("  hello world  ") == "hello world");
    CHECK(trim("   ") == "");
    CHECK(trim("..hi!", ".!") == "hi");
  }
  SUBCASE("split") {
    CHECK(split("hello world", " ") ==
          std::vector<std::string>{"hello", "world"});
    CHECK(split("a==b", "=") == std::vector<std::string>{"a", "", "b"});
  }
  SUBCASE("to_lowercase") {
    CHECK(to_lowercase("Hello World") == "hello world");
    CHECK(to_lowercase("123") == "123");
    // Multi-byte characters pass through untouched.
    CHECK(to_lowercase("ÑANDÚ") == "ÑandÚ");
  }
  SUBCASE("bool_from_string") {
    CHECK(bool_from_string("true"));
    CHECK(bool_from_string(" TRUE "));
    CHECK(bool_from_string("1"));
    CHECK_FALSE(bool_from_string("false"));
    CHECK_FALSE(bool_from_string("0"));
    CHECK_THROWS_AS(bool_from_string("yes please"), std::runtime_error);
    CHECK_THROWS_AS(bool_from_string(nullptr), std::runtime_error);
  }
  SUBCASE("double_from_string") {
    CHECK(double_from_string("2.5") == 2.5);
    CHECK(double_from_string(" -50 ") == -50.0);
    CHECK(double_from_string("0.8") == 0.8);
    CHECK_THROWS_AS(double_from_string("abc"), std::runtime_error);
    CHECK_THROWS_AS(double_from_string("1.5s"), std::runtime_error);
    CHECK_THROWS_AS(double_from_string(""), std::runtime_error);
  }
  SUBCASE("sanitize_utf8") {
    CHECK(sanitize_utf8("plain text") == "plain text");
    CHECK(sanitize_utf8("привет") == "привет");
    // A truncated two byte sequence at the end.
    CHECK(sanitize_utf8(std::string("abc\xD0", 4)) == "abc?");
    CHECK(sanitize_utf8(std::string("a\xFF" "b", 3)) == "a?b");
  }
  SUBCASE("utf8_code_points") {
    CHECK(utf8_code_points("añ€") ==
          std::vector<uint32_t>{0x61, 0xF1, 0x20AC});
    CHECK(utf8_code_points(std::string("x\x80y", 3)) ==
          std::vector<uint32_t>{'x', 'y'});
  }
}
