#include "speaker-buffer.h"

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("speaker-buffer") {
  SUBCASE("duration-grows-with-each-append") {
    SpeakerBuffer buffer;
    CHECK(buffer.empty());
    CHECK(buffer.duration() == 0.0);
    const std::vector<size_t> chunk_sizes = {1600, 320, 16000, 1, 4800};
    double expected_duration = 0.0;
    double timestamp = 4.0;
    for (size_t chunk_size : chunk_sizes) {
      buffer.append(make_labeled_chunk(std::vector<float>(chunk_size, 0.1f),
                                       timestamp, "You"));
      expected_duration += (double)(chunk_size) / PIPELINE_SAMPLE_RATE;
      CHECK(buffer.duration() == doctest::Approx(expected_duration));
      timestamp += 1.0;
    }
    CHECK(buffer.start_time == 4.0);
    CHECK(buffer.last_chunk_time == 8.0);
  }

  SUBCASE("clear-resets-start") {
    SpeakerBuffer buffer;
    buffer.append(make_labeled_chunk(generate_silence(0.5), 1.0, "You"));
    buffer.clear();
    CHECK(buffer.empty());
    buffer.append(make_labeled_chunk(generate_silence(0.5), 3.0, "You"));
    CHECK(buffer.start_time == 3.0);
  }

  SUBCASE("trim-keeps-newest-samples") {
    SpeakerBuffer buffer;
    std::vector<float> ramp(PIPELINE_SAMPLE_RATE * 5);
    for (size_t i = 0; i < ramp.size(); ++i) {
      ramp[i] = (float)(i);
    }
    buffer.append(make_labeled_chunk(ramp, 10.0, "You"));
    const size_t dropped = buffer.trim_to(sample_count_from_duration(2.0));
    CHECK(dropped == sample_count_from_duration(3.0));
    CHECK(buffer.duration() == doctest::Approx(2.0));
    CHECK(buffer.start_time == doctest::Approx(13.0));
    CHECK(buffer.samples.front() == (float)(dropped));
    CHECK(buffer.samples.back() == ramp.back());

    CHECK(buffer.trim_to(sample_count_from_duration(4.0)) == 0);
    CHECK(buffer.duration() == doctest::Approx(2.0));
  }
}
