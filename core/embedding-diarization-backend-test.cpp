#include "embedding-diarization-backend.h"

#include <stdexcept>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("embedding-diarization-backend") {
  SUBCASE("speech-windows-skip-silence") {
    EmbeddingDiarizationOptions options;
    options.window_duration = 1.0f;
    options.hop_duration = 0.5f;
    std::vector<float> audio = generate_tone(200.0f, 2.0);
    const std::vector<float> silence = generate_silence(2.0);
    audio.insert(audio.end(), silence.begin(), silence.end());

    const std::vector<size_t> offsets = find_speech_windows(audio, options);
    // Windows start every 8000 samples; the ones from 2.0s on are silent.
    CHECK(offsets == std::vector<size_t>{0, 8000, 16000, 24000});
  }

  SUBCASE("short-recording-gets-one-window") {
    EmbeddingDiarizationOptions options;
    CHECK(find_speech_windows(generate_tone(200.0f, 0.5), options) ==
          std::vector<size_t>{0});
    CHECK(find_speech_windows(generate_silence(0.5), options).empty());
    CHECK(find_speech_windows({}, options).empty());
  }

  SUBCASE("merge-windows") {
    const std::vector<SpeakerWindow> windows = {
        {0.0, 3.0, 0}, {1.5, 4.5, 0}, {3.0, 6.0, 1},
        {4.5, 7.5, 1}, {9.0, 12.0, 1}, {10.5, 13.5, 0},
    };
    const std::vector<SpeakerSegment> segments =
        merge_speaker_windows(windows);
    REQUIRE(segments.size() == 4);
    CHECK(segments[0] == SpeakerSegment{"Speaker 1", 0.0, 3.0});
    CHECK(segments[1] == SpeakerSegment{"Speaker 2", 3.0, 7.5});
    // A gap starts a new segment even for the same speaker.
    CHECK(segments[2] == SpeakerSegment{"Speaker 2", 9.0, 10.5});
    CHECK(segments[3] == SpeakerSegment{"Speaker 1", 10.5, 13.5});
    CHECK(merge_speaker_windows({}).empty());
  }

  SUBCASE("missing-model") {
    EmbeddingDiarizationBackend backend("no-such-speaker-model.ort");
    CHECK_FALSE(backend.is_model_available());
    CHECK_THROWS_AS(backend.process(generate_tone(200.0f, 1.0), 16000),
                    std::runtime_error);
  }

  SUBCASE("two-voices") {
    const std::string model_path = "speaker-embedding-model.ort";
    RETURN_IF_FILE_MISSING(model_path);
    EmbeddingDiarizationBackend backend(model_path);
    REQUIRE(backend.is_model_available());
    std::vector<float> audio = generate_tone(120.0f, 6.0);
    const std::vector<float> second_voice = generate_tone(900.0f, 6.0, 0.3f);
    audio.insert(audio.end(), second_voice.begin(), second_voice.end());
    const std::vector<SpeakerSegment> segments = backend.process(audio, 16000);
    REQUIRE_FALSE(segments.empty());
    CHECK(segments.front().start_time == 0.0);
    CHECK(segments.front().speaker_label == "Speaker 1");
    CHECK(segments.back().end_time == doctest::Approx(12.0));
  }
}
