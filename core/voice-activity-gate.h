#ifndef VOICE_ACTIVITY_GATE_H
#define VOICE_ACTIVITY_GATE_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "audio-chunk.h"

// Energy based voice activity detection. A chunk whose RMS is above the
// threshold is speech and passes. Quieter chunks still pass while they are
// within the hold-open window of the last speech chunk, so trailing phonemes
// are not cut off; everything else is dropped.
//
// The last speech time is shared by every chunk that goes through one gate,
// whichever speaker it belongs to, so speech on one channel also holds the
// gate open for silence on the other.
class VoiceActivityGate {
 private:
  const float threshold_db;
  const float threshold_linear;
  const double hold_open_window;
  const bool log_chunk_activity;

  mutable std::mutex state_mutex;
  std::optional<double> last_speech_time;
  uint64_t chunk_count = 0;
  uint64_t passed_count_value = 0;
  uint64_t filtered_count_value = 0;

 public:
  VoiceActivityGate(float threshold_db = -50.0f,
                    double hold_open_window = 0.8,
                    bool log_chunk_activity = false);

  // Returns the chunk unchanged if it should be kept, nothing if it is
  // silence.
  std::optional<LabeledAudioChunk> filter(LabeledAudioChunk chunk);

  // Linear amplitude equivalent of a dB threshold, 10^(dB/20).
  static float linear_from_db(float db);

  float threshold() const { return threshold_linear; }
  std::optional<double> last_speech_timestamp() const;
  uint64_t passed_count() const;
  uint64_t filtered_count() const;
  std::string to_string() const;
};

#endif
