#include "speaker-buffer.h"

#include <cstdio>

void SpeakerBuffer::append(const LabeledAudioChunk &chunk) {
  if (samples.empty()) {
    start_time = chunk.timestamp;
  }
  samples.insert(samples.end(), chunk.samples.begin(), chunk.samples.end());
  last_chunk_time = chunk.timestamp;
}

double SpeakerBuffer::duration() const {
  return duration_from_sample_count(samples.size());
}

void SpeakerBuffer::clear() {
  samples.clear();
  start_time = 0.0;
  last_chunk_time = 0.0;
}

size_t SpeakerBuffer::trim_to(size_t max_sample_count) {
  if (samples.size() <= max_sample_count) {
    return 0;
  }
  const size_t excess = samples.size() - max_sample_count;
  samples.erase(samples.begin(), samples.begin() + excess);
  start_time += duration_from_sample_count(excess);
  return excess;
}

std::string SpeakerBuffer::to_string() const {
  char buffer[128];
  snprintf(buffer, sizeof(buffer),
           "SpeakerBuffer(samples=%zu, duration=%.2fs, start_time=%.3f, "
           "last_chunk_time=%.3f)",
           samples.size(), duration(), start_time, last_chunk_time);
  return buffer;
}
