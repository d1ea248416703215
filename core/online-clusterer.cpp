#include "online-clusterer.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "debug-utils.h"

// Sequential leader clustering.
//
// Each incoming embedding is compared against the centroid of every speaker
// seen so far. If the closest centroid is within the threshold the embedding
// joins that speaker and the centroid moves towards it, otherwise it starts a
// new speaker. The result depends on arrival order, and two clusters created
// for the same voice are never merged, so the threshold has to be tuned for
// the embedding model in use.
//
// Short clips give noisy embeddings. Between 1 and 3 seconds the threshold is
// relaxed so those clips land in the nearest existing speaker, and clips under
// a second simply inherit the previous speaker.

float cosine_distance(const std::vector<float> &a,
                      const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument(
        "cosine distance: vectors must have the same length");
  }
  double dot = 0.0;
  double norm_a_sq = 0.0;
  double norm_b_sq = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += (double)(a[i]) * b[i];
    norm_a_sq += (double)(a[i]) * a[i];
    norm_b_sq += (double)(b[i]) * b[i];
  }
  if (norm_a_sq == 0.0 || norm_b_sq == 0.0) {
    return 1.0f;
  }
  const double similarity = dot / (std::sqrt(norm_a_sq) * std::sqrt(norm_b_sq));
  return (float)(1.0 - similarity);
}

OnlineClusterer::OnlineClusterer(const OnlineClustererOptions &options)
    : options(options) {}

uint32_t OnlineClusterer::embed_and_cluster(const std::vector<float> &embedding,
                                            float audio_duration) {
  if (embedding.size() != options.embedding_size) {
    throw std::invalid_argument("embedding size " +
                                std::to_string(embedding.size()) +
                                " must match the options embedding size " +
                                std::to_string(options.embedding_size));
  }
  float min_distance = std::numeric_limits<float>::max();
  size_t closest = 0;
  for (size_t i = 0; i < clusters.size(); ++i) {
    const float distance = cosine_distance(embedding, clusters[i].centroid);
    if (distance < min_distance) {
      min_distance = distance;
      closest = i;
    }
  }

  constexpr float scale_min = 2.0f;
  constexpr float scale_max = 3.0f;
  constexpr float duration_min = 1.0f;
  constexpr float threshold_max = 1.5f;
  float current_threshold;
  if (audio_duration > scale_max) {
    current_threshold = options.threshold;
  } else if (audio_duration > scale_min) {
    const float scale_factor =
        (audio_duration - scale_min) / (scale_max - scale_min);
    current_threshold = (options.threshold * scale_factor) +
                        (threshold_max * (1.0f - scale_factor));
  } else if (audio_duration > duration_min || !has_previous_speaker) {
    current_threshold = threshold_max;
  } else {
    return previous_speaker_index;
  }

  uint32_t speaker_index;
  if (!clusters.empty() && min_distance < current_threshold) {
    SpeakerCluster &cluster = clusters[closest];
    const float n = static_cast<float>(cluster.sample_count);
    for (size_t i = 0; i < cluster.centroid.size(); ++i) {
      cluster.centroid[i] = (n * cluster.centroid[i] + embedding[i]) / (n + 1);
    }
    cluster.sample_count++;
    speaker_index = cluster.index;
  } else {
    speaker_index = static_cast<uint32_t>(clusters.size());
    clusters.push_back({speaker_index, embedding, 1});
    LOGF("New speaker %u (closest distance %.3f, threshold %.3f)",
         speaker_index, clusters.size() > 1 ? min_distance : 0.0f,
         current_threshold);
  }
  previous_speaker_index = speaker_index;
  has_previous_speaker = true;
  return speaker_index;
}

void OnlineClusterer::reset() {
  clusters.clear();
  previous_speaker_index = 0;
  has_previous_speaker = false;
}
