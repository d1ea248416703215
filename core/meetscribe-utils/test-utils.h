#ifndef MEETSCRIBE_TEST_UTILS_H
#define MEETSCRIBE_TEST_UTILS_H

#include <chrono>
#include <cmath>
#include <utility>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "audio-chunk.h"
#include "debug-utils.h"

// Skips the rest of a test case when a model or data file is not available in
// the working directory.
#define RETURN_IF_FILE_MISSING(filename)                                 \
  do {                                                                   \
    if (!std::filesystem::exists(filename)) {                            \
      LOGF("'%s' not found, skipping", std::string(filename).c_str()); \
      return;                                                            \
    }                                                                    \
  } while (0)

inline std::vector<float> generate_tone(float frequency, double duration,
                                        float amplitude = 0.5f,
                                        int32_t sample_rate =
                                            PIPELINE_SAMPLE_RATE) {
  constexpr double pi = 3.14159265358979323846;
  const size_t sample_count =
      static_cast<size_t>(std::llround(duration * sample_rate));
  std::vector<float> samples(sample_count);
  for (size_t i = 0; i < sample_count; ++i) {
    const double phase = 2.0 * pi * frequency * i / sample_rate;
    samples[i] = amplitude * (float)(std::sin(phase));
  }
  return samples;
}

inline std::vector<float> generate_silence(double duration,
                                           int32_t sample_rate =
                                               PIPELINE_SAMPLE_RATE) {
  const size_t sample_count =
      static_cast<size_t>(std::llround(duration * sample_rate));
  return std::vector<float>(sample_count, 0.0f);
}

inline AudioChunk make_chunk(std::vector<float> samples, double timestamp,
                             AudioSource source) {
  AudioChunk chunk;
  chunk.samples = std::move(samples);
  chunk.timestamp = timestamp;
  chunk.source = source;
  return chunk;
}

inline LabeledAudioChunk make_labeled_chunk(std::vector<float> samples,
                                            double timestamp,
                                            const std::string &speaker) {
  LabeledAudioChunk chunk;
  chunk.samples = std::move(samples);
  chunk.timestamp = timestamp;
  chunk.speaker = speaker;
  return chunk;
}

// Polls until the predicate holds or the timeout passes. Returns the final
// value of the predicate.
inline bool wait_until(const std::function<bool()> &predicate,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
  const std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return predicate();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

#endif  // MEETSCRIBE_TEST_UTILS_H
