#include "transcription-pipeline.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {

constexpr double chunk_duration = 0.1;

// Returns one "hello" span covering the first second of every window.
class HelloBackend : public TranscriptionBackend {
 public:
  std::mutex mutex;
  std::vector<size_t> window_sizes;
  std::vector<int32_t> sample_rates;
  std::vector<std::optional<std::string>> hints;
  std::string text = "hello";

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t sample_rate,
      const std::optional<std::string> &language_hint) override {
    std::lock_guard<std::mutex> lock(mutex);
    window_sizes.push_back(samples.size());
    sample_rates.push_back(sample_rate);
    hints.push_back(language_hint);
    return {{text, 0.0, 1.0}};
  }

  size_t call_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return window_sizes.size();
  }
};

// Holds every call until release() is called. The first sample of each window
// tells the calls apart.
class BlockingBackend : public TranscriptionBackend {
 public:
  std::mutex mutex;
  std::condition_variable released_changed;
  bool released = false;
  size_t started_count = 0;
  size_t finished_count = 0;

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t,
      const std::optional<std::string> &) override {
    std::unique_lock<std::mutex> lock(mutex);
    started_count++;
    released_changed.wait(lock, [this] { return released; });
    finished_count++;
    const std::string text = samples[0] > 0.45f ? "second" : "first";
    return {{text, 0.0, 1.0}};
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      released = true;
    }
    released_changed.notify_all();
  }

  size_t started() {
    std::lock_guard<std::mutex> lock(mutex);
    return started_count;
  }

  size_t finished() {
    std::lock_guard<std::mutex> lock(mutex);
    return finished_count;
  }
};

// Keeps track of how many calls are in flight for each speaker, identified by
// the constant level of its samples.
class ConcurrencyTrackingBackend : public TranscriptionBackend {
 public:
  std::mutex mutex;
  std::map<float, int> in_flight;
  std::map<float, int> max_in_flight;

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t,
      const std::optional<std::string> &) override {
    const float key = samples[0];
    {
      std::lock_guard<std::mutex> lock(mutex);
      in_flight[key]++;
      max_in_flight[key] = std::max(max_in_flight[key], in_flight[key]);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    {
      std::lock_guard<std::mutex> lock(mutex);
      in_flight[key]--;
    }
    return {{"words", 0.0, 0.5}};
  }
};

class FailOnceBackend : public TranscriptionBackend {
 public:
  std::atomic<int> call_count{0};

  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &, int32_t,
      const std::optional<std::string> &) override {
    if (call_count.fetch_add(1) == 0) {
      throw std::runtime_error("backend unavailable");
    }
    return {{"recovered", 0.0, 1.0}};
  }
};

// Pushes duration seconds of constant level audio for a speaker in 100ms
// chunks, starting at start_time.
void push_audio(LabeledChunkChannelPtr channel, const std::string &speaker,
                double start_time, double duration, float level = 0.5f) {
  const int chunk_count = (int)(std::llround(duration / chunk_duration));
  const size_t chunk_size = sample_count_from_duration(chunk_duration);
  for (int i = 0; i < chunk_count; ++i) {
    channel->push(make_labeled_chunk(std::vector<float>(chunk_size, level),
                                     start_time + i * chunk_duration, speaker));
  }
}

// Reads segments until the channel closes. Fails the test if it stays open
// past the timeout.
std::vector<TranscriptSegment> collect_segments(
    TranscriptChannelPtr output,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
  std::vector<TranscriptSegment> segments;
  const std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    TranscriptSegment segment;
    const ChannelPopResult result =
        output->pop_for(&segment, std::chrono::milliseconds(20));
    if (result == ChannelPopResult::CLOSED) {
      return segments;
    }
    if (result == ChannelPopResult::ITEM) {
      segments.push_back(segment);
    }
  }
  FAIL("transcript channel was not closed in time");
  return segments;
}

}  // namespace

TEST_CASE("transcription-pipeline") {
  SUBCASE("window-dispatched-at-min-duration") {
    HelloBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);
    CHECK(pipeline.is_running());

    push_audio(input, "You", 10.0, 2.0);
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);

    REQUIRE(segments.size() == 1);
    CHECK(segments[0].speaker == "You");
    CHECK(segments[0].text == "hello");
    CHECK(segments[0].start_time == doctest::Approx(10.0));
    CHECK(segments[0].end_time == doctest::Approx(11.0));
    CHECK_FALSE(segments[0].detected_language.has_value());
    REQUIRE(backend.call_count() == 1);
    CHECK(backend.window_sizes[0] == sample_count_from_duration(2.0));
    CHECK(backend.sample_rates[0] == PIPELINE_SAMPLE_RATE);
    CHECK(wait_until([&] { return !pipeline.is_running(); }));
  }

  SUBCASE("buffer-trimmed-while-call-in-flight") {
    BlockingBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 10.0, 2.0);
    REQUIRE(wait_until([&] { return backend.started() == 1; }));
    CHECK(pipeline.is_transcribing("You"));

    // Five more seconds arrive while the first call is stuck.
    push_audio(input, "You", 12.0, 5.0);
    REQUIRE(wait_until([&] {
      return pipeline.gate().passed_count() == 70 &&
             std::fabs(pipeline.buffered_duration("You") - 2.0) < 1e-6;
    }));
    CHECK(pipeline.is_transcribing("You"));
    CHECK(backend.started() == 1);

    backend.release();
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);
    REQUIRE(segments.size() == 2);
    CHECK(segments[0].start_time == doctest::Approx(10.0));
    // Only the newest two seconds survived the trim.
    CHECK(segments[1].start_time == doctest::Approx(15.0));
    CHECK(segments[1].end_time == doctest::Approx(16.0));
  }

  SUBCASE("restart-discards-previous-generation") {
    BlockingBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr first_input =
        std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr first_output = pipeline.start(first_input);
    const uint64_t first_generation = pipeline.generation();

    push_audio(first_input, "You", 0.0, 2.0, 0.3f);
    REQUIRE(wait_until([&] { return backend.started() == 1; }));

    LabeledChunkChannelPtr second_input =
        std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr second_output = pipeline.start(second_input);
    CHECK(pipeline.generation() == first_generation + 1);
    CHECK(first_output->is_closed());
    CHECK_FALSE(pipeline.is_transcribing("You"));

    push_audio(second_input, "You", 0.0, 1.0, 0.6f);
    REQUIRE(wait_until([&] {
      return std::fabs(pipeline.buffered_duration("You") - 1.0) < 1e-6;
    }));

    // The stale call finishes but leaves the new run alone.
    backend.release();
    REQUIRE(wait_until([&] { return backend.finished() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(pipeline.buffered_duration("You") == doctest::Approx(1.0));
    CHECK_FALSE(pipeline.is_transcribing("You"));

    push_audio(second_input, "You", 1.0, 1.0, 0.6f);
    second_input->close();
    const std::vector<TranscriptSegment> segments =
        collect_segments(second_output);
    REQUIRE(segments.size() == 1);
    CHECK(segments[0].text == "second");
    CHECK(segments[0].start_time == doctest::Approx(0.0));

    TranscriptSegment stale_segment;
    CHECK_FALSE(first_output->pop(&stale_segment));
  }

  SUBCASE("one-call-in-flight-per-speaker") {
    ConcurrencyTrackingBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    const size_t chunk_size = sample_count_from_duration(chunk_duration);
    for (int i = 0; i < 100; ++i) {
      const double timestamp = i * chunk_duration;
      input->push(make_labeled_chunk(std::vector<float>(chunk_size, 0.5f),
                                     timestamp, "You"));
      input->push(make_labeled_chunk(std::vector<float>(chunk_size, 0.25f),
                                     timestamp, "Others"));
      if (i % 10 == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);

    CHECK(backend.max_in_flight[0.5f] == 1);
    CHECK(backend.max_in_flight[0.25f] == 1);
    std::map<std::string, double> last_end_time;
    for (const TranscriptSegment &segment : segments) {
      if (last_end_time.count(segment.speaker) > 0) {
        CHECK(segment.start_time >= last_end_time[segment.speaker]);
      }
      last_end_time[segment.speaker] = segment.end_time;
    }
    CHECK(last_end_time.count("You") == 1);
    CHECK(last_end_time.count("Others") == 1);
  }

  SUBCASE("end-of-stream-flushes-short-buffers") {
    HelloBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "Others", 3.0, 1.0);
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);
    REQUIRE(segments.size() == 1);
    CHECK(segments[0].speaker == "Others");
    CHECK(segments[0].start_time == doctest::Approx(3.0));
    CHECK(backend.window_sizes[0] == sample_count_from_duration(1.0));
  }

  SUBCASE("silence-never-reaches-backend") {
    HelloBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 3.0, 0.0f);
    input->close();
    CHECK(collect_segments(output).empty());
    CHECK(backend.call_count() == 0);
    CHECK(pipeline.gate().filtered_count() == 30);
  }

  SUBCASE("stop-flushes-and-closes") {
    BlockingBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 2.0);
    REQUIRE(wait_until([&] { return backend.started() == 1; }));
    push_audio(input, "Others", 0.5, 1.0, 0.3f);
    REQUIRE(wait_until([&] {
      return std::fabs(pipeline.buffered_duration("Others") - 1.0) < 1e-6;
    }));

    backend.release();
    pipeline.stop();
    CHECK_FALSE(pipeline.is_running());
    CHECK(output->is_closed());
    const std::vector<TranscriptSegment> segments = collect_segments(output);
    REQUIRE(segments.size() == 2);
    std::map<std::string, TranscriptSegment> by_speaker;
    for (const TranscriptSegment &segment : segments) {
      by_speaker[segment.speaker] = segment;
    }
    CHECK(by_speaker["You"].start_time == doctest::Approx(0.0));
    CHECK(by_speaker["Others"].start_time == doctest::Approx(0.5));

    // A second stop is harmless.
    pipeline.stop();
  }

  SUBCASE("stop-timeout-drops-late-results") {
    BlockingBackend backend;
    PipelineOptions options;
    options.stop_drain_timeout = 0.2;
    TranscriptionPipeline pipeline(&backend, options);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 3.0);
    REQUIRE(wait_until([&] {
      return backend.started() == 1 &&
             std::fabs(pipeline.buffered_duration("You") - 1.0) < 1e-6;
    }));

    pipeline.stop();
    CHECK(output->is_closed());
    CHECK(output->size() == 0);

    backend.release();
    REQUIRE(wait_until([&] { return backend.finished() == 1; }));
    CHECK(wait_until([&] { return !pipeline.is_transcribing("You"); }));
    CHECK(collect_segments(output).empty());
    CHECK(backend.started() == 1);
  }

  SUBCASE("failed-call-is-reported-and-dropped") {
    FailOnceBackend backend;
    std::mutex errors_mutex;
    std::vector<std::string> errors;
    TranscriptionPipeline pipeline(
        &backend, PipelineOptions(), [&](const std::string &message) {
          std::lock_guard<std::mutex> lock(errors_mutex);
          errors.push_back(message);
        });
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 2.0);
    REQUIRE(wait_until([&] { return backend.call_count.load() == 1; }));
    push_audio(input, "You", 2.0, 2.0);
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);

    REQUIRE(segments.size() == 1);
    CHECK(segments[0].text == "recovered");
    CHECK(segments[0].start_time == doctest::Approx(2.0));
    std::lock_guard<std::mutex> lock(errors_mutex);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == "You: backend unavailable");
  }

  SUBCASE("language-hint-and-detection") {
    HelloBackend backend;
    backend.text = "the meeting is about to start";
    PipelineOptions options;
    options.language_hint = "en";
    TranscriptionPipeline pipeline(&backend, options);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 2.0);
    REQUIRE(wait_until([&] { return backend.call_count() == 1; }));
    pipeline.set_language_hint("ru");
    push_audio(input, "You", 2.0, 2.0);
    input->close();
    const std::vector<TranscriptSegment> segments = collect_segments(output);

    REQUIRE(segments.size() == 2);
    REQUIRE(backend.hints.size() == 2);
    CHECK(backend.hints[0] == std::optional<std::string>("en"));
    CHECK(backend.hints[1] == std::optional<std::string>("ru"));
    CHECK(segments[0].detected_language == std::optional<std::string>("en"));
    CHECK(segments[0].id != segments[1].id);
  }

  SUBCASE("silence-at-hold-open-boundary-is-filtered") {
    HelloBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "You", 0.0, 0.1);
    push_audio(input, "You", 0.8, 0.1, 0.0f);
    input->close();
    collect_segments(output);
    CHECK(pipeline.gate().passed_count() == 1);
    CHECK(pipeline.gate().filtered_count() == 1);
    REQUIRE(backend.call_count() == 1);
    CHECK(backend.window_sizes[0] == sample_count_from_duration(0.1));
  }

  SUBCASE("restart-during-end-of-stream-flush-returns-promptly") {
    BlockingBackend backend;
    TranscriptionPipeline pipeline(&backend);
    LabeledChunkChannelPtr first_input =
        std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr first_output = pipeline.start(first_input);

    push_audio(first_input, "You", 0.0, 1.0, 0.3f);
    first_input->close();
    REQUIRE(wait_until([&] { return backend.started() == 1; }));

    LabeledChunkChannelPtr second_input =
        std::make_shared<LabeledChunkChannel>();
    const std::chrono::steady_clock::time_point before =
        std::chrono::steady_clock::now();
    TranscriptChannelPtr second_output = pipeline.start(second_input);
    CHECK(std::chrono::steady_clock::now() - before <
          std::chrono::milliseconds(1000));
    CHECK(first_output->is_closed());
    CHECK(pipeline.is_running());

    backend.release();
    push_audio(second_input, "You", 0.0, 2.0, 0.6f);
    second_input->close();
    const std::vector<TranscriptSegment> segments =
        collect_segments(second_output);
    REQUIRE(segments.size() == 1);
    CHECK(segments[0].text == "second");
    TranscriptSegment stale_segment;
    CHECK_FALSE(first_output->pop(&stale_segment));
  }

  SUBCASE("stop-during-end-of-stream-flush-is-bounded") {
    BlockingBackend backend;
    PipelineOptions options;
    options.stop_drain_timeout = 0.2;
    TranscriptionPipeline pipeline(&backend, options);
    LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
    TranscriptChannelPtr output = pipeline.start(input);

    push_audio(input, "Others", 0.0, 1.0);
    input->close();
    REQUIRE(wait_until([&] { return backend.started() == 1; }));

    const std::chrono::steady_clock::time_point before =
        std::chrono::steady_clock::now();
    pipeline.stop();
    CHECK(std::chrono::steady_clock::now() - before <
          std::chrono::milliseconds(2000));
    CHECK_FALSE(pipeline.is_running());
    CHECK(output->is_closed());

    backend.release();
    REQUIRE(wait_until([&] { return backend.finished() == 1; }));
    CHECK(collect_segments(output).empty());
  }

  SUBCASE("output-closed-once-run-finishes") {
    for (int run = 0; run < 20; ++run) {
      HelloBackend backend;
      TranscriptionPipeline pipeline(&backend);
      LabeledChunkChannelPtr input = std::make_shared<LabeledChunkChannel>();
      TranscriptChannelPtr output = pipeline.start(input);
      push_audio(input, "You", 0.0, 0.1);
      input->close();
      REQUIRE(wait_until([&] { return !pipeline.is_running(); }));
      CHECK(output->is_closed());
      // stop() after a natural finish leaves the closed channel as it is.
      pipeline.stop();
      CHECK(collect_segments(output).size() == 1);
    }
  }

  SUBCASE("invalid-construction") {
    HelloBackend backend;
    CHECK_THROWS_AS(TranscriptionPipeline(nullptr), std::invalid_argument);
    PipelineOptions options;
    options.max_buffer_duration = 1.0;
    CHECK_THROWS_AS(TranscriptionPipeline(&backend, options),
                    std::invalid_argument);
    TranscriptionPipeline pipeline(&backend);
    CHECK_THROWS_AS(pipeline.start(nullptr), std::invalid_argument);
    CHECK_FALSE(pipeline.is_running());
  }
}
