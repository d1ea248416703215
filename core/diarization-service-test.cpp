#include "diarization-service.h"

#include <filesystem>
#include <stdexcept>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
class FixedDiarizationBackend : public DiarizationBackend {
 public:
  bool available = true;
  int process_count = 0;
  int32_t last_sample_rate = 0;
  size_t last_sample_count = 0;
  std::vector<SpeakerSegment> segments = {
      {"Speaker 1", 0.0, 2.0},
      {"Speaker 2", 2.0, 3.5},
      {"Speaker 1", 3.5, 5.0},
  };

  std::vector<SpeakerSegment> process(const std::vector<float> &samples,
                                      int32_t sample_rate) override {
    process_count++;
    last_sample_rate = sample_rate;
    last_sample_count = samples.size();
    return segments;
  }
  bool is_model_available() const override { return available; }
};

class FailingDiarizationBackend : public DiarizationBackend {
 public:
  std::vector<SpeakerSegment> process(const std::vector<float> &,
                                      int32_t) override {
    throw std::runtime_error("Diarization failed: out of memory");
  }
  bool is_model_available() const override { return true; }
};
}  // namespace

TEST_CASE("diarization-result") {
  DiarizationResult result = DiarizationResult::from_segments({
      {"Speaker 1", 0.0, 2.0},
      {"Speaker 2", 2.0, 3.0},
      {"Speaker 1", 4.0, 5.0},
  });
  CHECK(result.speaker_count == 2);

  SUBCASE("label-lookup-is-half-open") {
    CHECK(result.speaker_label_at(0.0) == std::optional<std::string>("Speaker 1"));
    CHECK(result.speaker_label_at(1.999) ==
          std::optional<std::string>("Speaker 1"));
    CHECK(result.speaker_label_at(2.0) == std::optional<std::string>("Speaker 2"));
    CHECK_FALSE(result.speaker_label_at(3.5).has_value());
    CHECK_FALSE(result.speaker_label_at(5.0).has_value());
    CHECK_FALSE(result.speaker_label_at(-1.0).has_value());
  }

  SUBCASE("rename-rewrites-every-match") {
    result.rename_speaker("Speaker 1", "Alice");
    CHECK(result.segments[0].speaker_label == "Alice");
    CHECK(result.segments[1].speaker_label == "Speaker 2");
    CHECK(result.segments[2].speaker_label == "Alice");
    CHECK(result.segments[2].start_time == 4.0);
    result.rename_speaker("Nobody", "Bob");
    CHECK(result.speaker_label_at(2.5) == std::optional<std::string>("Speaker 2"));
  }

  SUBCASE("empty") {
    DiarizationResult empty_result = DiarizationResult::from_segments({});
    CHECK(empty_result.speaker_count == 0);
    CHECK_FALSE(empty_result.speaker_label_at(0.0).has_value());
  }
}

TEST_CASE("diarization-service") {
  SUBCASE("diarize-and-cache") {
    FixedDiarizationBackend backend;
    DiarizationService service(&backend);
    CHECK(service.is_available());
    CHECK_FALSE(service.cached_result().has_value());
    CHECK_FALSE(service.speaker_label_at(1.0).has_value());

    const DiarizationResult result =
        service.diarize(generate_tone(200.0f, 5.0), 16000);
    CHECK(backend.process_count == 1);
    CHECK(backend.last_sample_rate == 16000);
    CHECK(backend.last_sample_count == 80000);
    CHECK(result.speaker_count == 2);
    CHECK(result.segments.size() == 3);
    CHECK(service.speaker_label_at(2.5) ==
          std::optional<std::string>("Speaker 2"));

    service.rename_speaker("Speaker 2", "Guest");
    CHECK(service.speaker_label_at(2.5) == std::optional<std::string>("Guest"));
    REQUIRE(service.cached_result().has_value());
    CHECK(service.cached_result()->segments[1].speaker_label == "Guest");
    // The returned copy is not affected.
    CHECK(result.segments[1].speaker_label == "Speaker 2");
  }

  SUBCASE("empty-input-skips-backend") {
    FixedDiarizationBackend backend;
    DiarizationService service(&backend);
    service.diarize(generate_tone(200.0f, 5.0), 16000);
    const DiarizationResult result = service.diarize({}, 16000);
    CHECK(backend.process_count == 1);
    CHECK(result.segments.empty());
    CHECK(result.speaker_count == 0);
    REQUIRE(service.cached_result().has_value());
    CHECK(service.cached_result()->segments.empty());
    CHECK_FALSE(service.speaker_label_at(1.0).has_value());
  }

  SUBCASE("unavailable-backend") {
    FixedDiarizationBackend backend;
    backend.available = false;
    DiarizationService service(&backend);
    CHECK_FALSE(service.is_available());
    CHECK(service.diarize({}, 16000).speaker_count == 0);
    DiarizationResult result;
    CHECK_NOTHROW(result =
                      service.diarize(std::vector<float>(16000, 0.1f), 16000));
    CHECK(result.speaker_count == 0);
    CHECK(result.segments.empty());
    CHECK(backend.process_count == 0);
    REQUIRE(service.cached_result().has_value());
    CHECK(service.cached_result()->speaker_count == 0);
    CHECK_FALSE(service.speaker_label_at(0.5).has_value());
  }

  SUBCASE("backend-failure-keeps-cache") {
    FailingDiarizationBackend backend;
    DiarizationService service(&backend);
    CHECK_THROWS_AS(service.diarize(generate_tone(200.0f, 1.0), 16000),
                    std::runtime_error);
    CHECK_FALSE(service.cached_result().has_value());
  }

  SUBCASE("diarize-file") {
    FixedDiarizationBackend backend;
    DiarizationService service(&backend);
    const std::string wav_path = "diarization-service-test.wav";
    REQUIRE(save_wav_data(wav_path, generate_tone(200.0f, 0.5, 0.5f, 8000),
                          8000));
    const DiarizationResult result = service.diarize_file(wav_path);
    std::filesystem::remove(wav_path);
    CHECK(backend.last_sample_rate == 8000);
    CHECK(backend.last_sample_count == 4000);
    CHECK(result.speaker_count == 2);
    CHECK_THROWS_AS(service.diarize_file("no-such-recording.wav"),
                    std::runtime_error);
  }

  SUBCASE("null-backend") {
    CHECK_THROWS_AS(DiarizationService(nullptr), std::invalid_argument);
  }
}
