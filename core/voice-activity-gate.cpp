#include "voice-activity-gate.h"

#include <algorithm>
#include <cmath>

#include "debug-utils.h"

VoiceActivityGate::VoiceActivityGate(float threshold_db,
                                     double hold_open_window,
                                     bool log_chunk_activity)
    : threshold_db(threshold_db),
      threshold_linear(linear_from_db(threshold_db)),
      hold_open_window(hold_open_window),
      log_chunk_activity(log_chunk_activity) {}

float VoiceActivityGate::linear_from_db(float db) {
  return std::pow(10.0f, db / 20.0f);
}

std::optional<LabeledAudioChunk> VoiceActivityGate::filter(
    LabeledAudioChunk chunk) {
  const float rms = rms_energy(chunk.samples.data(), chunk.samples.size());
  const bool is_speech = rms > threshold_linear;

  std::lock_guard<std::mutex> lock(state_mutex);
  chunk_count++;
  if (log_chunk_activity && should_log_count(chunk_count)) {
    const float rms_db = 20.0f * std::log10(std::max(rms, 1e-10f));
    LOGF("VAD chunk #%llu [%s]: rms=%.6f (%.1f dB), threshold=%.6f (%.1f dB), "
         "is_speech=%d",
         (unsigned long long)chunk_count, chunk.speaker.c_str(), rms, rms_db,
         threshold_linear, threshold_db, is_speech);
  }

  if (is_speech) {
    last_speech_time = chunk.timestamp;
    passed_count_value++;
    return chunk;
  }

  if (last_speech_time.has_value() &&
      chunk.timestamp - *last_speech_time < hold_open_window) {
    passed_count_value++;
    if (log_chunk_activity && should_log_count(passed_count_value)) {
      LOGF("VAD passed hold-open chunk at %.3f (total passed: %llu)",
           chunk.timestamp, (unsigned long long)passed_count_value);
    }
    return chunk;
  }

  filtered_count_value++;
  if (log_chunk_activity && should_log_count(filtered_count_value)) {
    LOGF("VAD filtered chunk at %.3f (total filtered: %llu)", chunk.timestamp,
         (unsigned long long)filtered_count_value);
  }
  return std::nullopt;
}

std::optional<double> VoiceActivityGate::last_speech_timestamp() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  return last_speech_time;
}

uint64_t VoiceActivityGate::passed_count() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  return passed_count_value;
}

uint64_t VoiceActivityGate::filtered_count() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  return filtered_count_value;
}

std::string VoiceActivityGate::to_string() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  std::string result =
      "VoiceActivityGate(threshold_db=" + std::to_string(threshold_db);
  result += ", hold_open_window=" + std::to_string(hold_open_window);
  result += ", passed=" + std::to_string(passed_count_value);
  result += ", filtered=" + std::to_string(filtered_count_value) + ")";
  return result;
}
