#include "online-clusterer.h"

#include <stdexcept>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

TEST_CASE("online-clusterer") {
  SUBCASE("cosine-distance") {
    CHECK(cosine_distance({1.0f, 2.0f, 3.0f}, {2.0f, 4.0f, 6.0f}) ==
          doctest::Approx(0.0f));
    CHECK(cosine_distance({1.0f, 0.0f}, {0.0f, 1.0f}) == doctest::Approx(1.0f));
    CHECK(cosine_distance({1.0f, 0.0f}, {-1.0f, 0.0f}) ==
          doctest::Approx(2.0f));
    CHECK(cosine_distance({0.0f, 0.0f}, {1.0f, 0.0f}) == doctest::Approx(1.0f));
    CHECK_THROWS_AS(cosine_distance({1.0f}, {1.0f, 2.0f}),
                    std::invalid_argument);
  }

  SUBCASE("speakers-numbered-in-order") {
    OnlineClustererOptions options;
    options.embedding_size = 3;
    options.threshold = 0.5f;
    OnlineClusterer clusterer(options);
    CHECK(clusterer.embed_and_cluster({1.0f, 2.0f, 3.0f}, 5.0f) == 0);
    CHECK(clusterer.embed_and_cluster({0.0f, -1.0f, -2.0f}, 5.0f) == 1);
    CHECK(clusterer.embed_and_cluster({2.0f, 4.0f, 6.1f}, 5.0f) == 0);
    CHECK(clusterer.embed_and_cluster({-3.0f, 1.0f, 0.0f}, 5.0f) == 2);
    CHECK(clusterer.speaker_count() == 3);
    clusterer.reset();
    CHECK(clusterer.speaker_count() == 0);
    CHECK(clusterer.embed_and_cluster({-3.0f, 1.0f, 0.0f}, 5.0f) == 0);
  }

  SUBCASE("short-clips-follow-previous-speaker") {
    OnlineClustererOptions options;
    options.embedding_size = 2;
    options.threshold = 0.5f;
    OnlineClusterer clusterer(options);
    CHECK(clusterer.embed_and_cluster({1.0f, 0.0f}, 4.0f) == 0);
    CHECK(clusterer.embed_and_cluster({-1.0f, 0.1f}, 4.0f) == 1);
    // Under a second, the embedding is not trusted at all.
    CHECK(clusterer.embed_and_cluster({1.0f, 0.0f}, 0.5f) == 1);
    // Distance 0.8 from speaker 0 would be a new voice in a long clip, but a
    // clip under two seconds joins the nearest speaker.
    CHECK(clusterer.embed_and_cluster({0.2f, 1.0f}, 1.5f) == 0);
    CHECK(clusterer.speaker_count() == 2);
  }

  SUBCASE("embedding-size-mismatch") {
    OnlineClustererOptions options;
    options.embedding_size = 4;
    OnlineClusterer clusterer(options);
    CHECK_THROWS_AS(clusterer.embed_and_cluster({1.0f}, 5.0f),
                    std::invalid_argument);
  }
}
