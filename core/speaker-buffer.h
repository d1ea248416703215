#ifndef SPEAKER_BUFFER_H
#define SPEAKER_BUFFER_H

#include <cstddef>
#include <string>
#include <vector>

#include "audio-chunk.h"

// Audio accumulated for one speaker while it waits to be transcribed.
struct SpeakerBuffer {
  std::vector<float> samples;
  // Timestamp of the first sample currently held.
  double start_time = 0.0;
  // Timestamp of the most recently appended chunk.
  double last_chunk_time = 0.0;

  // The first chunk after a clear sets start_time.
  void append(const LabeledAudioChunk &chunk);

  double duration() const;
  bool empty() const { return samples.empty(); }

  // Keeps capacity so the next window does not reallocate.
  void clear();

  // Discards the oldest samples so at most max_sample_count remain, moving
  // start_time forward by the discarded duration. Returns the number of
  // samples dropped.
  size_t trim_to(size_t max_sample_count);

  std::string to_string() const;
};

#endif
