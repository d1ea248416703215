#include "audio-chunk.h"

#include <cmath>
#include <cstdio>
#include <utility>

const char *speaker_label_for_source(AudioSource source) {
  switch (source) {
    case AudioSource::MICROPHONE:
      return "You";
    case AudioSource::SYSTEM_AUDIO:
      return "Others";
  }
  return "Unknown";
}

const char *audio_source_to_string(AudioSource source) {
  switch (source) {
    case AudioSource::MICROPHONE:
      return "microphone";
    case AudioSource::SYSTEM_AUDIO:
      return "system_audio";
  }
  return "unknown";
}

double AudioChunk::duration() const {
  return duration_from_sample_count(samples.size());
}

std::string AudioChunk::to_string() const {
  char buffer[128];
  snprintf(buffer, sizeof(buffer),
           "AudioChunk(source=%s, timestamp=%.3f, samples=%zu)",
           audio_source_to_string(source), timestamp, samples.size());
  return buffer;
}

LabeledAudioChunk LabeledAudioChunk::from_chunk(AudioChunk &&chunk) {
  LabeledAudioChunk result;
  result.samples = std::move(chunk.samples);
  result.timestamp = chunk.timestamp;
  result.speaker = speaker_label_for_source(chunk.source);
  return result;
}

double LabeledAudioChunk::duration() const {
  return duration_from_sample_count(samples.size());
}

std::string LabeledAudioChunk::to_string() const {
  char buffer[128];
  snprintf(buffer, sizeof(buffer), "timestamp=%.3f, samples=%zu)", timestamp,
           samples.size());
  return "LabeledAudioChunk(speaker=" + speaker + ", " + buffer;
}

std::string TranscriptSegment::to_string() const {
  char time_str[64];
  snprintf(time_str, sizeof(time_str), "[%.2fs - %.2fs] ", start_time,
           end_time);
  std::string result = std::string(time_str) + speaker;
  if (detected_language.has_value()) {
    result += " (" + *detected_language + ")";
  }
  result += ": " + text;
  return result;
}

double duration_from_sample_count(size_t sample_count) {
  return static_cast<double>(sample_count) / PIPELINE_SAMPLE_RATE;
}

size_t sample_count_from_duration(double duration) {
  if (duration <= 0.0) {
    return 0;
  }
  return static_cast<size_t>(std::llround(duration * PIPELINE_SAMPLE_RATE));
}

float rms_energy(const float *samples, size_t sample_count) {
  if (samples == nullptr || sample_count == 0) {
    return 0.0f;
  }
  double sum_of_squares = 0.0;
  for (size_t i = 0; i < sample_count; i++) {
    sum_of_squares += static_cast<double>(samples[i]) * samples[i];
  }
  return static_cast<float>(std::sqrt(sum_of_squares / sample_count));
}
