#include "debug-utils.h"

#include <cmath>
#include <cstdio>
#include <filesystem>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

namespace {
int return_on_error_test() {
  RETURN_ON_ERROR(1);
  return 0;
}

int return_on_false_test() {
  RETURN_ON_FALSE(false);
  return 0;
}

int return_on_null_test() {
  RETURN_ON_NULL(nullptr);
  return 0;
}

void throw_with_log_test() { THROW_WITH_LOG("Something went wrong"); }
}  // namespace

TEST_CASE("debug-utils") {
  SUBCASE("LOG") {
    LOG("Hello, world!");
    LOGF("%d chunks", 3);
    CHECK(true);
  }
  SUBCASE("RETURN_ON_ERROR") { CHECK(return_on_error_test() == -1); }
  SUBCASE("RETURN_ON_FALSE") { CHECK(return_on_false_test() == -1); }
  SUBCASE("RETURN_ON_NULL") { CHECK(return_on_null_test() == -1); }
  SUBCASE("THROW_WITH_LOG") {
    CHECK_THROWS_WITH_AS(
        throw_with_log_test(),
        doctest::Contains("throw_with_log_test - Something went wrong"),
        std::runtime_error);
  }
  SUBCASE("TIMER") {
    TIMER_START(my_timer);
    TIMER_END(my_timer);
    CHECK(true);
  }
  SUBCASE("should_log_count") {
    CHECK(should_log_count(1));
    CHECK(should_log_count(5));
    CHECK_FALSE(should_log_count(6));
    CHECK_FALSE(should_log_count(9));
    CHECK(should_log_count(10));
    CHECK_FALSE(should_log_count(11));
    CHECK(should_log_count(20));
  }
  SUBCASE("gate") {
    CHECK(gate(2.0f, -1.0f, 1.0f) == 1.0f);
    CHECK(gate(-2.0f, -1.0f, 1.0f) == -1.0f);
    CHECK(gate(0.25f, -1.0f, 1.0f) == 0.25f);
  }
  SUBCASE("load_file_into_memory") {
    std::string file_contents = "Hello, world!";
    FILE *file = std::fopen("test.txt", "w");
    std::fwrite(file_contents.c_str(), 1, file_contents.size(), file);
    std::fclose(file);

    std::vector<uint8_t> data = load_file_into_memory("test.txt");
    CHECK(data.size() == file_contents.size());
    CHECK(std::string(data.begin(), data.end()) == file_contents);
    std::remove("test.txt");
    CHECK_THROWS_AS(load_file_into_memory("no-such-file.txt"),
                    std::runtime_error);
  }
  SUBCASE("save_memory_to_file") {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    save_memory_to_file("test.bin", data);
    REQUIRE(std::filesystem::exists("test.bin"));
    REQUIRE(std::filesystem::file_size("test.bin") == data.size());
    CHECK(load_file_into_memory("test.bin") == data);
    std::remove("test.bin");
  }
  SUBCASE("save_and_load_wav_data") {
    std::string wav_path = "output/test.wav";
    std::filesystem::create_directory("output");
    std::filesystem::remove(wav_path);
    REQUIRE(!std::filesystem::exists(wav_path));
    std::vector<float> audio_data = {-0.1f, 0.0f, 0.3f, 0.4f, 0.5f};
    const int32_t sample_rate = 16000;
    CHECK(save_wav_data(wav_path, audio_data, sample_rate));
    REQUIRE(std::filesystem::exists(wav_path));
    std::vector<float> read_audio_data;
    int32_t read_sample_rate = 0;
    CHECK(load_wav_data(wav_path, &read_audio_data, &read_sample_rate));
    REQUIRE(read_audio_data.size() == audio_data.size());
    CHECK(read_sample_rate == sample_rate);
    for (size_t i = 0; i < audio_data.size(); i++) {
      const float delta = std::abs(audio_data[i] - read_audio_data[i]);
      const float epsilon = 0.0001f;
      if (delta > epsilon) {
        LOGF("audio_data[%zu] = %f, read_audio_data[%zu] = %f", i,
             audio_data[i], i, read_audio_data[i]);
        CHECK(false);
      }
    }
    std::filesystem::remove(wav_path);
  }
  SUBCASE("load_wav_data_missing") {
    std::vector<float> samples;
    CHECK_FALSE(load_wav_data("no-such-file.wav", &samples));
    CHECK(samples.empty());
  }
}
