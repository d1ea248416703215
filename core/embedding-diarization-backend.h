#ifndef EMBEDDING_DIARIZATION_BACKEND_H
#define EMBEDDING_DIARIZATION_BACKEND_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "diarization-service.h"
#include "speaker-embedding-model.h"

struct EmbeddingDiarizationOptions {
  float window_duration = 3.0f;
  float hop_duration = 1.5f;
  // Windows quieter than this are not analyzed.
  float silence_threshold_db = -50.0f;
  float cluster_threshold = 0.8f;
  bool log_ort_run = false;
};

// A stretch of audio that has been attributed to a speaker, in seconds.
struct SpeakerWindow {
  double start_time = 0.0;
  double end_time = 0.0;
  uint32_t speaker_index = 0;
};

// Start offsets, in samples, of every analysis window that is loud enough to
// hold speech. A recording shorter than one window gets a single window.
std::vector<size_t> find_speech_windows(
    const std::vector<float> &samples,
    const EmbeddingDiarizationOptions &options);

// Joins consecutive overlapping windows of the same speaker into segments
// labeled "Speaker N", numbered from 1. Where the speaker changes inside an
// overlap, the earlier segment ends where the later window starts.
std::vector<SpeakerSegment> merge_speaker_windows(
    const std::vector<SpeakerWindow> &windows);

// On-device diarization with a speaker embedding model. The recording is cut
// into overlapping windows, each window is embedded and the embeddings are
// clustered into speakers.
class EmbeddingDiarizationBackend : public DiarizationBackend {
 private:
  EmbeddingDiarizationOptions options;
  std::unique_ptr<SpeakerEmbeddingModel> model;
  bool model_loaded = false;
  std::mutex process_mutex;

 public:
  // A model that fails to load is logged and leaves the backend unavailable.
  explicit EmbeddingDiarizationBackend(
      const std::string &model_path,
      const EmbeddingDiarizationOptions &options =
          EmbeddingDiarizationOptions());

  std::vector<SpeakerSegment> process(const std::vector<float> &samples,
                                      int32_t sample_rate) override;
  bool is_model_available() const override { return model_loaded; }
};

#endif
