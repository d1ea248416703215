#include "language-detector.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("language-detector") {
  LanguageDetector detector;
  SUBCASE("short-text") {
    CHECK_FALSE(detector.detect("hello").has_value());
    CHECK_FALSE(detector.detect("").has_value());
  }
  SUBCASE("english") {
    CHECK(detector.detect("What is the plan for this week?") ==
          std::optional<std::string>("en"));
  }
  SUBCASE("russian") {
    CHECK(detector.detect("Давайте обсудим план на неделю") ==
          std::optional<std::string>("ru"));
  }
  SUBCASE("spanish") {
    CHECK(detector.detect("¿Cuál es el plan para la reunión?") ==
          std::optional<std::string>("es"));
  }
  SUBCASE("no-signal") {
    CHECK_FALSE(detector.detect("1234567890 12345").has_value());
    CHECK_FALSE(detector.detect("zxqv wxyz plmk").has_value());
  }
  SUBCASE("minimum-length-in-code-points") {
    LanguageDetector strict_detector(20);
    // Eleven Cyrillic letters take twenty two bytes.
    CHECK_FALSE(strict_detector.detect("Приветствую").has_value());
    CHECK(detector.detect("Приветствую") == std::optional<std::string>("ru"));
  }
}
