#include "voice-activity-gate.h"

#include <cmath>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
LabeledAudioChunk speech_at(double timestamp,
                            const std::string &speaker = "You") {
  return make_labeled_chunk(generate_tone(300.0f, 0.1), timestamp, speaker);
}

LabeledAudioChunk silence_at(double timestamp,
                             const std::string &speaker = "You") {
  return make_labeled_chunk(generate_silence(0.1), timestamp, speaker);
}
}  // namespace

TEST_CASE("voice-activity-gate") {
  SUBCASE("linear-threshold") {
    CHECK(VoiceActivityGate::linear_from_db(-20.0f) == doctest::Approx(0.1f));
    CHECK(VoiceActivityGate::linear_from_db(0.0f) == doctest::Approx(1.0f));
    VoiceActivityGate gate;
    CHECK(gate.threshold() ==
          doctest::Approx(std::pow(10.0f, -50.0f / 20.0f)));
  }

  SUBCASE("hold-open-window") {
    VoiceActivityGate gate(-50.0f, 0.8);
    CHECK(gate.filter(speech_at(0.0)).has_value());
    CHECK(gate.filter(silence_at(0.5)).has_value());
    CHECK(gate.filter(silence_at(0.75)).has_value());
    CHECK_FALSE(gate.filter(silence_at(1.0)).has_value());
    CHECK(gate.passed_count() == 3);
    CHECK(gate.filtered_count() == 1);
    REQUIRE(gate.last_speech_timestamp().has_value());
    CHECK(*gate.last_speech_timestamp() == 0.0);
  }

  SUBCASE("silence-before-any-speech-is-dropped") {
    VoiceActivityGate gate;
    CHECK_FALSE(gate.filter(silence_at(0.0)).has_value());
    CHECK_FALSE(gate.last_speech_timestamp().has_value());
  }

  SUBCASE("speech-always-passes-unchanged") {
    VoiceActivityGate gate(-50.0f, 0.0);
    const LabeledAudioChunk chunk = speech_at(12.5, "Others");
    const std::optional<LabeledAudioChunk> passed = gate.filter(chunk);
    REQUIRE(passed.has_value());
    CHECK(passed->speaker == "Others");
    CHECK(passed->timestamp == 12.5);
    CHECK(passed->samples == chunk.samples);
  }

  SUBCASE("quiet-audio-below-threshold") {
    VoiceActivityGate gate(-20.0f, 0.8);
    // RMS of a 0.05 amplitude sine is about 0.035, below 0.1.
    const LabeledAudioChunk quiet =
        make_labeled_chunk(generate_tone(300.0f, 0.1, 0.05f), 0.0, "You");
    CHECK_FALSE(gate.filter(quiet).has_value());
    const LabeledAudioChunk loud =
        make_labeled_chunk(generate_tone(300.0f, 0.1, 0.5f), 1.0, "You");
    CHECK(gate.filter(loud).has_value());
  }

  SUBCASE("hold-open-is-shared-across-speakers") {
    VoiceActivityGate gate(-50.0f, 0.8);
    CHECK(gate.filter(speech_at(0.0, "You")).has_value());
    CHECK(gate.filter(silence_at(0.3, "Others")).has_value());
  }
}
