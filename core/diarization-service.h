#ifndef DIARIZATION_SERVICE_H
#define DIARIZATION_SERVICE_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "diarization-result.h"

// Splits a complete recording into speaker attributed segments.
// Implementations report failures by throwing.
class DiarizationBackend {
 public:
  virtual ~DiarizationBackend() {}

  virtual std::vector<SpeakerSegment> process(const std::vector<float> &samples,
                                              int32_t sample_rate) = 0;
  virtual bool is_model_available() const = 0;
};

// Offline diarization of whole recordings, independent of the live pipeline.
// The most recent result is cached so callers can look up and rename
// speakers after the fact. Safe to use from several threads.
class DiarizationService {
 private:
  DiarizationBackend *backend;

  mutable std::mutex cache_mutex;
  std::optional<DiarizationResult> cached;

 public:
  // The backend is not owned and must outlive the service.
  explicit DiarizationService(DiarizationBackend *backend);

  bool is_available() const;

  // Empty input produces an empty result without calling the backend.
  // Throws std::runtime_error if the backend has no model, and passes on
  // anything the backend throws. The cache only changes on success.
  DiarizationResult diarize(const std::vector<float> &samples,
                            int32_t sample_rate);

  // Loads a 16-bit PCM WAV file, mixes it down to mono and diarizes it.
  DiarizationResult diarize_file(const std::string &path);

  std::optional<std::string> speaker_label_at(double time) const;
  void rename_speaker(const std::string &old_label,
                      const std::string &new_label);
  std::optional<DiarizationResult> cached_result() const;
};

#endif
