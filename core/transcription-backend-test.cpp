#include "transcription-backend.h"

#include <stdexcept>

#include "wav-codec.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
class RecordingProvider : public SpeechToTextProvider {
 public:
  std::vector<uint8_t> last_payload;
  AudioFormat last_format = AudioFormat::MP3;

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<uint8_t> &audio_payload, AudioFormat format) override {
    last_payload = audio_payload;
    last_format = format;
    return {{"remote text", 0.25, 1.5}};
  }
};
}  // namespace

TEST_CASE("transcription-backend") {
  SUBCASE("cloud-backend-sends-wav") {
    RecordingProvider provider;
    CloudTranscriptionBackend backend(&provider);
    const std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f};
    const std::vector<TranscriptionSpan> spans =
        backend.transcribe(samples, 16000, std::string("en"));

    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "remote text");
    CHECK(spans[0].start_time == 0.25);
    CHECK(spans[0].end_time == 1.5);
    CHECK(provider.last_format == AudioFormat::WAV);
    CHECK(provider.last_payload == encode_wav_pcm16(samples, 16000));
  }

  SUBCASE("format-names") {
    CHECK(std::string(audio_format_to_string(AudioFormat::WAV)) == "wav");
    CHECK(std::string(audio_format_to_string(AudioFormat::MP3)) == "mp3");
    CHECK(std::string(audio_format_to_string(AudioFormat::M4A)) == "m4a");
    CHECK(std::string(audio_format_to_string(AudioFormat::WEBM)) == "webm");
  }

  SUBCASE("null-provider") {
    CHECK_THROWS_AS(CloudTranscriptionBackend(nullptr), std::invalid_argument);
  }
}
