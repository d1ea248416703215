#ifndef STREAM_MERGER_H
#define STREAM_MERGER_H

#include <atomic>
#include <cstdint>
#include <thread>

#include "chunk-channel.h"

// Fans the microphone and system audio streams into one stream of labeled
// chunks. Each source has its own reader thread, so a stalled source never
// holds back the other. Chunks are forwarded as soon as they arrive, without
// reordering or mixing samples. The merged stream is closed once both
// sources have closed.
class StreamMerger {
 private:
  AudioChunkChannelPtr microphone_input;
  AudioChunkChannelPtr system_audio_input;
  LabeledChunkChannelPtr merged_output;
  bool log_chunk_activity;

  std::thread microphone_reader;
  std::thread system_audio_reader;
  std::atomic<int32_t> open_source_count{0};
  std::atomic<uint64_t> forwarded_count{0};

 public:
  StreamMerger(AudioChunkChannelPtr microphone_input,
               AudioChunkChannelPtr system_audio_input,
               bool log_chunk_activity = false);
  // Closes both inputs and waits for the readers to finish.
  ~StreamMerger();

  StreamMerger(const StreamMerger &) = delete;
  StreamMerger &operator=(const StreamMerger &) = delete;

  // Starts the reader threads. Can only be called once.
  LabeledChunkChannelPtr start();

  // Blocks until both sources have ended and the merged stream is closed.
  void wait();

  uint64_t chunks_forwarded() const { return forwarded_count.load(); }

 private:
  void read_source(AudioChunkChannelPtr input, AudioSource source);
};

#endif
