#include "language-detector.h"

#include <cstdint>
#include <set>
#include <vector>

#include "string-utils.h"

namespace {
const std::set<std::string> english_words = {
    "the", "and", "is",  "are", "of",   "to",   "in",  "that", "it",
    "you", "this", "was", "for", "with", "have", "not", "what", "we",
};

const std::set<std::string> spanish_words = {
    "el",  "la",   "los", "las", "que",  "de",   "y",    "en",   "por",
    "una", "es",   "con", "para", "pero", "como", "esta", "muy", "yo",
};

bool is_cyrillic(uint32_t code_point) {
  return code_point >= 0x0400 && code_point <= 0x04FF;
}

bool is_spanish_mark(uint32_t code_point) {
  switch (code_point) {
    case 0x00F1:  // ñ
    case 0x00D1:  // Ñ
    case 0x00E1:  // á
    case 0x00E9:  // é
    case 0x00ED:  // í
    case 0x00F3:  // ó
    case 0x00FA:  // ú
    case 0x00FC:  // ü
    case 0x00BF:  // ¿
    case 0x00A1:  // ¡
      return true;
    default:
      return false;
  }
}

bool is_latin_letter(uint32_t code_point) {
  return (code_point >= 'a' && code_point <= 'z') ||
         (code_point >= 'A' && code_point <= 'Z') ||
         (code_point >= 0x00C0 && code_point <= 0x024F &&
          code_point != 0x00D7 && code_point != 0x00F7);
}
}  // namespace

LanguageDetector::LanguageDetector(size_t minimum_text_length)
    : minimum_text_length(minimum_text_length) {}

std::optional<std::string> LanguageDetector::detect(
    const std::string &text) const {
  const std::vector<uint32_t> code_points = utf8_code_points(text);
  if (code_points.size() < minimum_text_length) {
    return std::nullopt;
  }

  size_t cyrillic_count = 0;
  size_t latin_count = 0;
  size_t spanish_score = 0;
  for (const uint32_t code_point : code_points) {
    if (is_cyrillic(code_point)) {
      cyrillic_count++;
    } else if (is_latin_letter(code_point)) {
      latin_count++;
    }
    if (is_spanish_mark(code_point)) {
      spanish_score++;
    }
  }
  if (cyrillic_count > latin_count) {
    return "ru";
  }
  if (latin_count == 0) {
    return std::nullopt;
  }

  size_t english_score = 0;
  const std::string normalized = to_lowercase(text);
  for (const std::string &raw_word : split(normalized, " ")) {
    const std::string word = trim(raw_word, " \t\r\n.,;:!?\"'()");
    if (english_words.count(word) > 0) {
      english_score++;
    }
    if (spanish_words.count(word) > 0) {
      spanish_score++;
    }
  }
  if (english_score == 0 && spanish_score == 0) {
    return std::nullopt;
  }
  if (spanish_score > english_score) {
    return "es";
  }
  return "en";
}
