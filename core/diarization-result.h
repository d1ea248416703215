#ifndef DIARIZATION_RESULT_H
#define DIARIZATION_RESULT_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SpeakerSegment {
  std::string speaker_label;
  double start_time = 0.0;
  double end_time = 0.0;

  bool operator==(const SpeakerSegment &other) const = default;
  std::string to_string() const;
};

struct DiarizationResult {
  std::vector<SpeakerSegment> segments;
  // Number of distinct labels among the segments.
  size_t speaker_count = 0;

  static DiarizationResult from_segments(std::vector<SpeakerSegment> segments);

  // Label of the first segment whose [start_time, end_time) contains time.
  std::optional<std::string> speaker_label_at(double time) const;

  // Replaces old_label with new_label on every matching segment.
  void rename_speaker(const std::string &old_label,
                      const std::string &new_label);

  std::string to_string() const;
};

#endif
