#include "transcription-backend.h"

#include <stdexcept>

#include "wav-codec.h"

const char *audio_format_to_string(AudioFormat format) {
  switch (format) {
    case AudioFormat::WAV:
      return "wav";
    case AudioFormat::MP3:
      return "mp3";
    case AudioFormat::M4A:
      return "m4a";
    case AudioFormat::WEBM:
      return "webm";
  }
  return "unknown";
}

CloudTranscriptionBackend::CloudTranscriptionBackend(
    SpeechToTextProvider *provider)
    : provider(provider) {
  if (provider == nullptr) {
    throw std::invalid_argument("CloudTranscriptionBackend needs a provider");
  }
}

std::vector<TranscriptionSpan> CloudTranscriptionBackend::transcribe(
    const std::vector<float> &samples, int32_t sample_rate,
    const std::optional<std::string> & /* language_hint */) {
  const std::vector<uint8_t> payload = encode_wav_pcm16(samples, sample_rate);
  return provider->transcribe(payload, AudioFormat::WAV);
}
