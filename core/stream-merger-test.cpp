#include "stream-merger.h"

#include <map>
#include <stdexcept>
#include <vector>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
std::vector<LabeledAudioChunk> drain(LabeledChunkChannelPtr channel) {
  std::vector<LabeledAudioChunk> chunks;
  LabeledAudioChunk chunk;
  while (channel->pop(&chunk)) {
    chunks.push_back(chunk);
  }
  return chunks;
}
}  // namespace

TEST_CASE("stream-merger") {
  SUBCASE("labels-both-sources") {
    AudioChunkChannelPtr microphone = std::make_shared<AudioChunkChannel>();
    AudioChunkChannelPtr system_audio = std::make_shared<AudioChunkChannel>();
    StreamMerger merger(microphone, system_audio);
    LabeledChunkChannelPtr merged = merger.start();

    for (int i = 0; i < 3; ++i) {
      microphone->push(make_chunk(generate_tone(440.0f, 1.0), i,
                                  AudioSource::MICROPHONE));
      system_audio->push(make_chunk(generate_tone(220.0f, 1.0), i,
                                    AudioSource::SYSTEM_AUDIO));
    }
    microphone->close();
    system_audio->close();

    const std::vector<LabeledAudioChunk> chunks = drain(merged);
    REQUIRE(chunks.size() == 6);
    CHECK(merger.chunks_forwarded() == 6);
    std::map<std::string, std::vector<double>> timestamps;
    for (const LabeledAudioChunk &chunk : chunks) {
      CHECK(chunk.samples.size() == PIPELINE_SAMPLE_RATE);
      timestamps[chunk.speaker].push_back(chunk.timestamp);
    }
    CHECK(timestamps.size() == 2);
    // Order within each source is preserved.
    CHECK(timestamps["You"] == std::vector<double>{0.0, 1.0, 2.0});
    CHECK(timestamps["Others"] == std::vector<double>{0.0, 1.0, 2.0});
  }

  SUBCASE("label-follows-channel") {
    AudioChunkChannelPtr microphone = std::make_shared<AudioChunkChannel>();
    AudioChunkChannelPtr system_audio = std::make_shared<AudioChunkChannel>();
    StreamMerger merger(microphone, system_audio);
    LabeledChunkChannelPtr merged = merger.start();
    microphone->push(
        make_chunk(generate_tone(440.0f, 0.1), 0.0, AudioSource::SYSTEM_AUDIO));
    microphone->close();
    system_audio->close();
    const std::vector<LabeledAudioChunk> chunks = drain(merged);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].speaker == "You");
  }

  SUBCASE("stalled-source-does-not-block") {
    AudioChunkChannelPtr microphone = std::make_shared<AudioChunkChannel>();
    AudioChunkChannelPtr system_audio = std::make_shared<AudioChunkChannel>();
    StreamMerger merger(microphone, system_audio);
    LabeledChunkChannelPtr merged = merger.start();

    system_audio->push(
        make_chunk(generate_tone(220.0f, 0.1), 0.0, AudioSource::SYSTEM_AUDIO));
    LabeledAudioChunk chunk;
    REQUIRE(merged->pop_for(&chunk, std::chrono::seconds(5)) ==
            ChannelPopResult::ITEM);
    CHECK(chunk.speaker == "Others");

    // Only one source has ended, so the merged stream stays open.
    system_audio->close();
    CHECK(merged->pop_for(&chunk, std::chrono::milliseconds(50)) ==
          ChannelPopResult::TIMEOUT);
    microphone->close();
    CHECK(merged->pop_for(&chunk, std::chrono::seconds(5)) ==
          ChannelPopResult::CLOSED);
  }

  SUBCASE("invalid-use") {
    AudioChunkChannelPtr microphone = std::make_shared<AudioChunkChannel>();
    CHECK_THROWS_AS(StreamMerger(microphone, nullptr), std::invalid_argument);
    AudioChunkChannelPtr system_audio = std::make_shared<AudioChunkChannel>();
    StreamMerger merger(microphone, system_audio);
    merger.start();
    CHECK_THROWS_AS(merger.start(), std::runtime_error);
  }
}
