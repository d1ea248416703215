#include "resampler.h"

#include <cmath>
#include <numeric>
#include <stdexcept>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("resampler") {
  SUBCASE("same-rate-is-unchanged") {
    const std::vector<float> audio = {0.1f, -0.2f, 0.3f};
    CHECK(resample_audio(audio, 16000, 16000) == audio);
  }
  SUBCASE("downsample-48k") {
    const std::vector<float> tone = generate_tone(440.0f, 1.0, 0.5f, 48000);
    const std::vector<float> resampled = resample_audio(tone, 48000, 16000);
    CHECK(resampled.size() == 16000);
    const float mean =
        std::accumulate(resampled.begin(), resampled.end(), 0.0f) /
        resampled.size();
    CHECK(mean == doctest::Approx(0.0f).epsilon(0.01f));
    // A 440 Hz tone is far below the new Nyquist limit, so the level is kept.
    CHECK(rms_energy(resampled.data(), resampled.size()) ==
          doctest::Approx(rms_energy(tone.data(), tone.size())).epsilon(0.02));
  }
  SUBCASE("downsample-constant") {
    const std::vector<float> constant(44100, 0.25f);
    const std::vector<float> resampled = resample_audio(constant, 44100, 16000);
    CHECK(resampled.size() == 16000);
    for (float sample : resampled) {
      REQUIRE(sample == doctest::Approx(0.25f));
    }
  }
  SUBCASE("upsample-interpolates") {
    const std::vector<float> ramp = {0.0f, 1.0f, 2.0f, 3.0f};
    const std::vector<float> resampled = resample_audio(ramp, 8000, 16000);
    REQUIRE(resampled.size() == 8);
    CHECK(resampled[0] == doctest::Approx(0.0f));
    CHECK(resampled[1] == doctest::Approx(0.5f));
    CHECK(resampled[2] == doctest::Approx(1.0f));
    CHECK(resampled[5] == doctest::Approx(2.5f));
    CHECK(resampled[7] == doctest::Approx(3.0f));
  }
  SUBCASE("invalid-rate") {
    CHECK_THROWS_AS(resample_audio({0.0f}, 0, 16000), std::invalid_argument);
  }
}
