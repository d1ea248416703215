#include "string-utils.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
// Number of bytes in the UTF-8 sequence starting at text[i], or 0 if the
// sequence is malformed or truncated.
size_t utf8_sequence_length(const std::string &text, size_t i) {
  const uint8_t c = static_cast<uint8_t>(text[i]);
  size_t length = 0;
  if (c < 0x80) {
    return 1;
  } else if ((c & 0xE0) == 0xC0) {
    length = 2;
  } else if ((c & 0xF0) == 0xE0) {
    length = 3;
  } else if ((c & 0xF8) == 0xF0) {
    length = 4;
  } else {
    return 0;
  }
  if (text.size() - i < length) {
    return 0;
  }
  for (size_t j = 1; j < length; j++) {
    if ((static_cast<uint8_t>(text[i + j]) & 0xC0) != 0x80) {
      return 0;
    }
  }
  return length;
}
}  // namespace

std::string trim(const std::string &str, const std::string &whitespace) {
  const auto begin = str.find_first_not_of(whitespace);
  if (begin == std::string::npos) return "";

  const auto end = str.find_last_not_of(whitespace);
  return str.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string &str,
                               const std::string &delimiter) {
  std::vector<std::string> result;
  size_t start = 0;
  size_t end = 0;
  while ((end = str.find(delimiter, start)) != std::string::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + delimiter.length();
  }
  result.push_back(str.substr(start));
  return result;
}

std::string to_lowercase(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool bool_from_string(const char *input) {
  if (input == nullptr) {
    throw std::runtime_error("Input is null");
  }
  const std::string input_string = to_lowercase(trim(input));
  if (input_string == "true" || input_string == "1") {
    return true;
  }
  if (input_string == "false" || input_string == "0") {
    return false;
  }
  throw std::runtime_error("Invalid boolean string: '" + std::string(input) +
                           "'");
}

double double_from_string(const char *input) {
  if (input == nullptr) {
    throw std::runtime_error("Input is null");
  }
  const std::string input_string = trim(input);
  size_t parsed_length = 0;
  double result = 0.0;
  try {
    result = std::stod(input_string, &parsed_length);
  } catch (const std::exception &e) {
    throw std::runtime_error("Invalid number string: '" + std::string(input) +
                             "': " + e.what());
  }
  if (parsed_length != input_string.size()) {
    throw std::runtime_error("Invalid number string: '" + std::string(input) +
                             "'");
  }
  return result;
}

std::string sanitize_utf8(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const size_t length = utf8_sequence_length(text, i);
    if (length == 0) {
      result.push_back('?');
      i++;
      continue;
    }
    result.append(text, i, length);
    i += length;
  }
  return result;
}

std::vector<uint32_t> utf8_code_points(const std::string &text) {
  std::vector<uint32_t> result;
  size_t i = 0;
  while (i < text.size()) {
    const size_t length = utf8_sequence_length(text, i);
    if (length == 0) {
      i++;
      continue;
    }
    const uint8_t lead = static_cast<uint8_t>(text[i]);
    uint32_t code_point = 0;
    if (length == 1) {
      code_point = lead;
    } else if (length == 2) {
      code_point = lead & 0x1F;
    } else if (length == 3) {
      code_point = lead & 0x0F;
    } else {
      code_point = lead & 0x07;
    }
    for (size_t j = 1; j < length; j++) {
      code_point = (code_point << 6) | (static_cast<uint8_t>(text[i + j]) & 0x3F);
    }
    result.push_back(code_point);
    i += length;
  }
  return result;
}
