#ifndef AUDIO_CHUNK_H
#define AUDIO_CHUNK_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// All audio inside the pipeline is mono float32 at this rate.
constexpr int32_t PIPELINE_SAMPLE_RATE = 16000;

enum class AudioSource {
  MICROPHONE,
  SYSTEM_AUDIO,
};

// "You" for the microphone, "Others" for system audio.
const char *speaker_label_for_source(AudioSource source);

const char *audio_source_to_string(AudioSource source);

struct AudioChunk {
  std::vector<float> samples;
  // Seconds since capture start, non-decreasing within one source.
  double timestamp = 0.0;
  AudioSource source = AudioSource::MICROPHONE;

  double duration() const;
  std::string to_string() const;
};

struct LabeledAudioChunk {
  std::vector<float> samples;
  double timestamp = 0.0;
  std::string speaker;

  static LabeledAudioChunk from_chunk(AudioChunk &&chunk);

  double duration() const;
  std::string to_string() const;
};

// A piece of text returned by a transcription backend. Times are relative to
// the start of the audio window that was submitted.
struct TranscriptionSpan {
  std::string text;
  double start_time = 0.0;
  double end_time = 0.0;
};

struct TranscriptSegment {
  uint64_t id = 0;
  std::string text;
  // Absolute seconds, on the same clock as the chunk timestamps.
  double start_time = 0.0;
  double end_time = 0.0;
  std::string speaker;
  std::optional<std::string> detected_language;

  std::string to_string() const;
};

double duration_from_sample_count(size_t sample_count);
size_t sample_count_from_duration(double duration);

// Root mean square of the samples, 0 for an empty buffer.
float rms_energy(const float *samples, size_t sample_count);

#endif
