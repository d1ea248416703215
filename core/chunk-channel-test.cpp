#include "chunk-channel.h"

#include <chrono>
#include <thread>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("chunk-channel") {
  SUBCASE("fifo-order") {
    ChunkChannel<int> channel;
    CHECK(channel.push(1));
    CHECK(channel.push(2));
    CHECK(channel.size() == 2);
    int value = 0;
    REQUIRE(channel.pop(&value));
    CHECK(value == 1);
    REQUIRE(channel.pop(&value));
    CHECK(value == 2);
  }
  SUBCASE("drains-after-close") {
    ChunkChannel<int> channel;
    channel.push(7);
    channel.close();
    CHECK(channel.is_closed());
    CHECK_FALSE(channel.push(8));
    int value = 0;
    REQUIRE(channel.pop(&value));
    CHECK(value == 7);
    CHECK_FALSE(channel.pop(&value));
    CHECK(channel.pop_for(&value, std::chrono::milliseconds(10)) ==
          ChannelPopResult::CLOSED);
  }
  SUBCASE("pop-for-times-out") {
    ChunkChannel<int> channel;
    int value = 0;
    CHECK(channel.pop_for(&value, std::chrono::milliseconds(10)) ==
          ChannelPopResult::TIMEOUT);
  }
  SUBCASE("close-wakes-blocked-consumer") {
    ChunkChannel<int> channel;
    bool popped = true;
    std::thread consumer([&] {
      int value = 0;
      popped = channel.pop(&value);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    consumer.join();
    CHECK_FALSE(popped);
  }
  SUBCASE("cross-thread-delivery") {
    AudioChunkChannel channel;
    std::thread producer([&] {
      for (int i = 0; i < 100; ++i) {
        AudioChunk chunk;
        chunk.timestamp = i;
        channel.push(chunk);
      }
      channel.close();
    });
    AudioChunk chunk;
    double expected_timestamp = 0.0;
    while (channel.pop(&chunk)) {
      CHECK(chunk.timestamp == expected_timestamp);
      expected_timestamp += 1.0;
    }
    producer.join();
    CHECK(expected_timestamp == 100.0);
  }
}
