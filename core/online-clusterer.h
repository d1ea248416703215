#ifndef ONLINE_CLUSTERER_H
#define ONLINE_CLUSTERER_H

#include <cstddef>
#include <cstdint>
#include <vector>

struct OnlineClustererOptions {
  size_t embedding_size = 512;
  // Cosine distance below which an embedding joins an existing speaker.
  float threshold = 0.8f;
};

struct SpeakerCluster {
  uint32_t index;
  std::vector<float> centroid;
  size_t sample_count = 0;
};

// 1 - cosine similarity, in [0, 2]. A zero vector is treated as unrelated to
// everything and gives 1. Throws std::invalid_argument on a size mismatch.
float cosine_distance(const std::vector<float> &a, const std::vector<float> &b);

// Assigns voice embeddings to speakers as they arrive, using a sequential
// leader algorithm with running centroids. Speakers are numbered from zero in
// order of first appearance.
class OnlineClusterer {
  std::vector<SpeakerCluster> clusters;
  OnlineClustererOptions options;

  uint32_t previous_speaker_index = 0;
  bool has_previous_speaker = false;

 public:
  explicit OnlineClusterer(const OnlineClustererOptions &options);

  // audio_duration is the length in seconds of the audio the embedding came
  // from. Short clips are less reliable, so they are more readily folded into
  // an existing speaker.
  uint32_t embed_and_cluster(const std::vector<float> &embedding,
                             float audio_duration);

  size_t speaker_count() const { return clusters.size(); }
  void reset();
};

#endif
