#ifndef TRANSCRIPTION_BACKEND_H
#define TRANSCRIPTION_BACKEND_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "audio-chunk.h"

// Speech to text engine that works on raw samples, usually an on-device
// model. Implementations report failures by throwing, and may be called from
// several threads at once (one call per speaker at most).
class TranscriptionBackend {
 public:
  virtual ~TranscriptionBackend() {}

  // Span times are relative to the start of samples.
  virtual std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t sample_rate,
      const std::optional<std::string> &language_hint) = 0;
};

enum class AudioFormat {
  WAV,
  MP3,
  M4A,
  WEBM,
};

const char *audio_format_to_string(AudioFormat format);

// Remote speech to text service that accepts an encoded audio file.
class SpeechToTextProvider {
 public:
  virtual ~SpeechToTextProvider() {}

  virtual std::vector<TranscriptionSpan> transcribe(
      const std::vector<uint8_t> &audio_payload, AudioFormat format) = 0;
};

// Sends each window to a provider as a 16-bit PCM WAV file. The provider is
// not owned and has to outlive the backend.
class CloudTranscriptionBackend : public TranscriptionBackend {
 private:
  SpeechToTextProvider *provider;

 public:
  explicit CloudTranscriptionBackend(SpeechToTextProvider *provider);

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t sample_rate,
      const std::optional<std::string> &language_hint) override;
};

#endif
