#include "diarization-result.h"

#include <cstdio>
#include <set>
#include <utility>

std::string SpeakerSegment::to_string() const {
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "[%.3f-%.3f] ", start_time, end_time);
  return std::string(buffer) + speaker_label;
}

DiarizationResult DiarizationResult::from_segments(
    std::vector<SpeakerSegment> segments) {
  std::set<std::string> labels;
  for (const SpeakerSegment &segment : segments) {
    labels.insert(segment.speaker_label);
  }
  DiarizationResult result;
  result.segments = std::move(segments);
  result.speaker_count = labels.size();
  return result;
}

std::optional<std::string> DiarizationResult::speaker_label_at(
    double time) const {
  for (const SpeakerSegment &segment : segments) {
    if (time >= segment.start_time && time < segment.end_time) {
      return segment.speaker_label;
    }
  }
  return std::nullopt;
}

void DiarizationResult::rename_speaker(const std::string &old_label,
                                       const std::string &new_label) {
  for (SpeakerSegment &segment : segments) {
    if (segment.speaker_label == old_label) {
      segment.speaker_label = new_label;
    }
  }
}

std::string DiarizationResult::to_string() const {
  std::string result = "DiarizationResult(" + std::to_string(speaker_count) +
                       " speakers, " + std::to_string(segments.size()) +
                       " segments)";
  for (const SpeakerSegment &segment : segments) {
    result += "\n  " + segment.to_string();
  }
  return result;
}
