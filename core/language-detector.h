#ifndef LANGUAGE_DETECTOR_H
#define LANGUAGE_DETECTOR_H

#include <cstddef>
#include <optional>
#include <string>

// Guesses the language of a transcribed span. Recognizes English ("en"),
// Russian ("ru") and Spanish ("es") and returns nothing for anything it is
// unsure about, including text shorter than minimum_text_length code points.
class LanguageDetector {
 private:
  const size_t minimum_text_length;

 public:
  explicit LanguageDetector(size_t minimum_text_length = 10);
  virtual ~LanguageDetector() {}

  virtual std::optional<std::string> detect(const std::string &text) const;
};

#endif
