#include "speaker-embedding-model.h"

#include <string>

#include "test-utils.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("speaker-embedding-model") {
  SUBCASE("load-missing-model") {
    SpeakerEmbeddingModel model;
    CHECK(model.load("no-such-speaker-model.ort") != 0);
    CHECK_FALSE(model.is_loaded());
    std::vector<float> embedding;
    const std::vector<float> audio = generate_tone(200.0f, 1.0);
    CHECK(model.calculate_embedding(audio.data(), audio.size(), &embedding) !=
          0);
  }
  SUBCASE("calculate-embedding") {
    const std::string model_path = "speaker-embedding-model.ort";
    RETURN_IF_FILE_MISSING(model_path);
    SpeakerEmbeddingModel model;
    REQUIRE(model.load(model_path.c_str()) == 0);
    REQUIRE(model.is_loaded());

    const std::vector<float> audio =
        generate_tone(180.0f, 5.0, 0.4f, SpeakerEmbeddingModel::input_sample_rate);
    REQUIRE(audio.size() == SpeakerEmbeddingModel::ideal_input_size);
    std::vector<float> embedding;
    REQUIRE(model.calculate_embedding(audio.data(), audio.size(), &embedding) ==
            0);
    CHECK(embedding.size() == SpeakerEmbeddingModel::embedding_size);

    // Short clips are looped up to the ideal input size.
    std::vector<float> short_embedding;
    REQUIRE(model.calculate_embedding(audio.data(), 12345, &short_embedding) ==
            0);
    CHECK(short_embedding.size() == SpeakerEmbeddingModel::embedding_size);
  }
}
