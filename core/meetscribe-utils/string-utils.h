#ifndef MEETSCRIBE_STRING_UTILS_H
#define MEETSCRIBE_STRING_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string &str, const std::string &whitespace = " \t");

std::vector<std::string> split(const std::string &str,
                               const std::string &delimiter);

std::string to_lowercase(const std::string &str);

bool bool_from_string(const char *input);

double double_from_string(const char *input);

// Replaces every byte that does not start a well-formed UTF-8 sequence with
// '?'. Backends occasionally return truncated multi-byte characters at window
// boundaries.
std::string sanitize_utf8(const std::string &text);

// Decodes UTF-8 into code points, skipping malformed bytes.
std::vector<uint32_t> utf8_code_points(const std::string &text);

#endif  // MEETSCRIBE_STRING_UTILS_H
