#include "diarization-service.h"

#include <stdexcept>

#include "debug-utils.h"

DiarizationService::DiarizationService(DiarizationBackend *backend)
    : backend(backend) {
  if (backend == nullptr) {
    throw std::invalid_argument("DiarizationService needs a backend");
  }
}

bool DiarizationService::is_available() const {
  return this->backend->is_model_available();
}

DiarizationResult DiarizationService::diarize(const std::vector<float> &samples,
                                              int32_t sample_rate) {
  if (samples.empty() || !this->backend->is_model_available()) {
    if (!samples.empty()) {
      LOG("Diarization requested but the model is not available");
    }
    DiarizationResult empty_result;
    std::lock_guard<std::mutex> lock(this->cache_mutex);
    this->cached = empty_result;
    return empty_result;
  }

  TIMER_START(diarize);
  std::vector<SpeakerSegment> segments =
      this->backend->process(samples, sample_rate);
  TIMER_END(diarize);

  DiarizationResult result =
      DiarizationResult::from_segments(std::move(segments));
  LOGF("Diarized %.2fs of audio: %zu speakers, %zu segments",
       (double)(samples.size()) / sample_rate, result.speaker_count,
       result.segments.size());
  std::lock_guard<std::mutex> lock(this->cache_mutex);
  this->cached = result;
  return result;
}

DiarizationResult DiarizationService::diarize_file(const std::string &path) {
  LOGF("Starting diarization for file: %s", path.c_str());
  std::vector<float> samples;
  int32_t sample_rate = 0;
  if (!load_wav_data(path, &samples, &sample_rate)) {
    THROW_WITH_LOG(("Failed to read audio file: " + path).c_str());
  }
  return diarize(samples, sample_rate);
}

std::optional<std::string> DiarizationService::speaker_label_at(
    double time) const {
  std::lock_guard<std::mutex> lock(this->cache_mutex);
  if (!this->cached.has_value()) {
    return std::nullopt;
  }
  return this->cached->speaker_label_at(time);
}

void DiarizationService::rename_speaker(const std::string &old_label,
                                        const std::string &new_label) {
  std::lock_guard<std::mutex> lock(this->cache_mutex);
  if (this->cached.has_value()) {
    this->cached->rename_speaker(old_label, new_label);
  }
}

std::optional<DiarizationResult> DiarizationService::cached_result() const {
  std::lock_guard<std::mutex> lock(this->cache_mutex);
  return this->cached;
}
