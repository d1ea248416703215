#include "embedding-diarization-backend.h"

#include <algorithm>
#include <stdexcept>

#include "audio-chunk.h"
#include "debug-utils.h"
#include "online-clusterer.h"
#include "resampler.h"
#include "voice-activity-gate.h"

std::vector<size_t> find_speech_windows(
    const std::vector<float> &samples,
    const EmbeddingDiarizationOptions &options) {
  std::vector<size_t> offsets;
  const size_t window_size = sample_count_from_duration(options.window_duration);
  const size_t hop_size = sample_count_from_duration(options.hop_duration);
  if (samples.empty() || window_size == 0 || hop_size == 0) {
    return offsets;
  }
  const float threshold =
      VoiceActivityGate::linear_from_db(options.silence_threshold_db);
  size_t offset = 0;
  while (true) {
    const size_t length = std::min(window_size, samples.size() - offset);
    if (rms_energy(samples.data() + offset, length) > threshold) {
      offsets.push_back(offset);
    }
    if (offset + window_size >= samples.size()) {
      break;
    }
    offset += hop_size;
  }
  return offsets;
}

std::vector<SpeakerSegment> merge_speaker_windows(
    const std::vector<SpeakerWindow> &windows) {
  std::vector<SpeakerSegment> segments;
  uint32_t current_speaker = 0;
  for (const SpeakerWindow &window : windows) {
    const std::string label =
        "Speaker " + std::to_string(window.speaker_index + 1);
    if (!segments.empty()) {
      SpeakerSegment &last = segments.back();
      const bool contiguous = window.start_time <= last.end_time;
      if (contiguous && window.speaker_index == current_speaker) {
        last.end_time = std::max(last.end_time, window.end_time);
        continue;
      }
      if (contiguous) {
        last.end_time = window.start_time;
      }
    }
    segments.push_back({label, window.start_time, window.end_time});
    current_speaker = window.speaker_index;
  }
  return segments;
}

EmbeddingDiarizationBackend::EmbeddingDiarizationBackend(
    const std::string &model_path, const EmbeddingDiarizationOptions &options)
    : options(options),
      model(std::make_unique<SpeakerEmbeddingModel>(options.log_ort_run)) {
  if (options.window_duration <= 0.0f || options.hop_duration <= 0.0f) {
    throw std::invalid_argument(
        "Diarization window and hop durations must be positive");
  }
  const int load_error = this->model->load(model_path.c_str());
  if (load_error != 0) {
    LOGF("Failed to load speaker embedding model from '%s': %d",
         model_path.c_str(), load_error);
    return;
  }
  this->model_loaded = true;
}

std::vector<SpeakerSegment> EmbeddingDiarizationBackend::process(
    const std::vector<float> &samples, int32_t sample_rate) {
  if (!this->model_loaded) {
    throw std::runtime_error("Diarization model is not available");
  }
  std::lock_guard<std::mutex> lock(this->process_mutex);
  const std::vector<float> audio =
      resample_audio(samples, sample_rate, PIPELINE_SAMPLE_RATE);
  const std::vector<size_t> offsets = find_speech_windows(audio, this->options);
  const size_t window_size =
      sample_count_from_duration(this->options.window_duration);

  OnlineClusterer clusterer(OnlineClustererOptions(
      {.embedding_size = SpeakerEmbeddingModel::embedding_size,
       .threshold = this->options.cluster_threshold}));
  std::vector<SpeakerWindow> windows;
  std::vector<float> embedding;
  for (size_t offset : offsets) {
    const size_t length = std::min(window_size, audio.size() - offset);
    const int embedding_error = this->model->calculate_embedding(
        audio.data() + offset, length, &embedding);
    if (embedding_error != 0) {
      THROW_WITH_LOG(("Failed to calculate speaker embedding: " +
                      std::to_string(embedding_error))
                         .c_str());
    }
    SpeakerWindow window;
    window.start_time = duration_from_sample_count(offset);
    window.end_time = duration_from_sample_count(offset + length);
    window.speaker_index = clusterer.embed_and_cluster(
        embedding, (float)(duration_from_sample_count(length)));
    windows.push_back(window);
  }
  LOGF("Analyzed %zu speech windows in %.2fs, found %zu speakers",
       windows.size(), duration_from_sample_count(audio.size()),
       clusterer.speaker_count());
  return merge_speaker_windows(windows);
}
