#include "wav-codec.h"

#include <cstring>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
uint32_t read_le32(const std::vector<uint8_t> &data, size_t offset) {
  return data[offset] | (data[offset + 1] << 8) | (data[offset + 2] << 16) |
         ((uint32_t)(data[offset + 3]) << 24);
}

uint16_t read_le16(const std::vector<uint8_t> &data, size_t offset) {
  return (uint16_t)(data[offset] | (data[offset + 1] << 8));
}

int16_t sample_at(const std::vector<uint8_t> &data, size_t index) {
  return (int16_t)(read_le16(data, 44 + index * 2));
}
}  // namespace

TEST_CASE("wav-codec") {
  SUBCASE("header-fields") {
    const std::vector<uint8_t> wav =
        encode_wav_pcm16(std::vector<float>(100, 0.0f), 16000);
    REQUIRE(wav.size() == 44 + 200);
    CHECK(std::memcmp(wav.data(), "RIFF", 4) == 0);
    CHECK(read_le32(wav, 4) == 36 + 200);
    CHECK(std::memcmp(wav.data() + 8, "WAVE", 4) == 0);
    CHECK(std::memcmp(wav.data() + 12, "fmt ", 4) == 0);
    CHECK(read_le32(wav, 16) == 16);
    CHECK(read_le16(wav, 20) == 1);
    CHECK(read_le16(wav, 22) == 1);
    CHECK(read_le32(wav, 24) == 16000);
    CHECK(read_le32(wav, 28) == 32000);
    CHECK(read_le16(wav, 32) == 2);
    CHECK(read_le16(wav, 34) == 16);
    CHECK(std::memcmp(wav.data() + 36, "data", 4) == 0);
    CHECK(read_le32(wav, 40) == 200);
  }

  SUBCASE("samples-are-clamped-and-scaled") {
    const std::vector<uint8_t> wav =
        encode_wav_pcm16({0.0f, 1.0f, -1.0f, 2.5f, -3.0f, 0.5f}, 16000);
    CHECK(sample_at(wav, 0) == 0);
    CHECK(sample_at(wav, 1) == 32767);
    CHECK(sample_at(wav, 2) == -32767);
    CHECK(sample_at(wav, 3) == 32767);
    CHECK(sample_at(wav, 4) == -32767);
    CHECK(sample_at(wav, 5) == 16383);
    // Little-endian byte order.
    CHECK(wav[46] == 0xFF);
    CHECK(wav[47] == 0x7F);
  }

  SUBCASE("decode-encoded-audio") {
    const std::vector<float> tone = generate_tone(440.0f, 0.25, 0.5f, 8000);
    const std::vector<uint8_t> wav = encode_wav_pcm16(tone, 8000);
    std::vector<float> decoded;
    int32_t sample_rate = 0;
    REQUIRE(decode_wav_pcm16(wav.data(), wav.size(), &decoded, &sample_rate));
    CHECK(sample_rate == 8000);
    REQUIRE(decoded.size() == tone.size());
    for (size_t i = 0; i < tone.size(); ++i) {
      REQUIRE(decoded[i] == doctest::Approx(tone[i]).epsilon(0.001));
    }
  }

  SUBCASE("stereo-is-mixed-to-mono") {
    std::vector<uint8_t> wav = encode_wav_pcm16({0.0f, 0.0f}, 22050);
    // Rewrite the header for a single stereo frame: left 0.5, right -0.25.
    wav[22] = 2;
    wav[32] = 4;
    const int16_t left = 16384;
    const int16_t right = -8192;
    wav[44] = (uint8_t)(left & 0xFF);
    wav[45] = (uint8_t)((left >> 8) & 0xFF);
    wav[46] = (uint8_t)(right & 0xFF);
    wav[47] = (uint8_t)((right >> 8) & 0xFF);
    std::vector<float> decoded;
    int32_t sample_rate = 0;
    REQUIRE(decode_wav_pcm16(wav.data(), wav.size(), &decoded, &sample_rate));
    CHECK(sample_rate == 22050);
    REQUIRE(decoded.size() == 1);
    CHECK(decoded[0] == doctest::Approx(0.125f));
  }

  SUBCASE("rejects-invalid-data") {
    std::vector<float> decoded;
    const std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', ' ',
                                          'w', 'a', 'v', 'e', '!', '!'};
    CHECK_FALSE(
        decode_wav_pcm16(garbage.data(), garbage.size(), &decoded, nullptr));
    std::vector<uint8_t> wav = encode_wav_pcm16({0.1f}, 16000);
    wav[34] = 8;
    CHECK_FALSE(decode_wav_pcm16(wav.data(), wav.size(), &decoded, nullptr));
    CHECK_FALSE(decode_wav_pcm16(nullptr, 0, &decoded, nullptr));
  }
}
