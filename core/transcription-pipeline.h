#ifndef TRANSCRIPTION_PIPELINE_H
#define TRANSCRIPTION_PIPELINE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "chunk-channel.h"
#include "language-detector.h"
#include "pipeline-options.h"
#include "speaker-buffer.h"
#include "transcription-backend.h"
#include "voice-activity-gate.h"

typedef std::function<void(const std::string &)> ErrorReporter;

// Turns the merged, labeled audio stream into speaker attributed transcript
// segments.
//
// Chunks that pass the voice activity gate are appended to a buffer per
// speaker. Once a buffer holds min_buffer_duration of audio and that speaker
// has no call in flight, the buffer contents are handed to the backend on a
// worker thread and the buffer starts over, so the loop reading the stream
// never waits on the backend. A speaker never has two calls in flight, which
// keeps each speaker's segments in chronological order. Segments from
// different speakers can arrive in any order.
//
// If a speaker keeps talking while its call is slow, the buffer is trimmed
// back to min_buffer_duration whenever it reaches max_buffer_duration. The
// oldest audio is lost, but memory and latency stay bounded.
//
// Every start() begins a new generation. Work that belongs to an earlier
// generation, such as a backend call that returns after a restart, is
// discarded without touching the current buffers.
//
// All buffer, in-flight and generation state is guarded by state_mutex.
class TranscriptionPipeline {
 private:
  struct PendingWindow {
    std::string speaker;
    std::vector<float> samples;
    double start_time = 0.0;
  };

  const PipelineOptions options;
  TranscriptionBackend *backend;
  LanguageDetector default_language_detector;
  const LanguageDetector *language_detector;
  ErrorReporter error_reporter;
  VoiceActivityGate vad_gate;
  std::atomic<uint64_t> next_segment_id{0};

  // Serializes start() and stop() against each other.
  std::mutex control_mutex;

  mutable std::mutex state_mutex;
  std::map<std::string, SpeakerBuffer> buffers;
  std::set<std::string> active_transcriptions;
  uint64_t current_generation = 0;
  bool _is_running = false;
  LabeledChunkChannelPtr input;
  TranscriptChannelPtr output;
  std::optional<std::string> language_hint;
  std::thread consume_thread;
  std::list<std::future<void>> transcription_jobs;

 public:
  // The backend and language detector are not owned and must outlive the
  // pipeline. A null detector selects the built-in one, a null reporter logs.
  TranscriptionPipeline(TranscriptionBackend *backend,
                        const PipelineOptions &options = PipelineOptions(),
                        ErrorReporter error_reporter = nullptr,
                        const LanguageDetector *language_detector = nullptr);
  // Stops the current run and waits for outstanding backend calls.
  ~TranscriptionPipeline();

  TranscriptionPipeline(const TranscriptionPipeline &) = delete;
  TranscriptionPipeline &operator=(const TranscriptionPipeline &) = delete;

  // Begins consuming the merged stream and returns the channel segments are
  // delivered on. The channel is closed once the stream has ended and every
  // buffer has been transcribed, or when stop() completes. Calling start()
  // while a run is active supersedes it and closes its output channel.
  TranscriptChannelPtr start(LabeledChunkChannelPtr merged_stream);

  // Stops reading the stream, waits up to stop_drain_timeout for calls in
  // flight, transcribes whatever is still buffered (again waiting at most
  // stop_drain_timeout) and then closes the output channel. Does nothing if no
  // run is active.
  void stop();

  void set_language_hint(const std::optional<std::string> &hint);

  uint64_t generation() const;
  bool is_running() const;
  double buffered_duration(const std::string &speaker) const;
  bool is_transcribing(const std::string &speaker) const;
  const VoiceActivityGate &gate() const { return vad_gate; }

 private:
  void consume_stream(LabeledChunkChannelPtr stream, uint64_t generation);
  void ingest_chunk(const LabeledAudioChunk &chunk, uint64_t generation);
  void finish_at_end_of_stream(uint64_t generation);
  // Waits until none of the given speakers, or no speaker at all if speakers
  // is null, has a call in flight. Returns false on timeout.
  bool wait_for_active_transcriptions(
      uint64_t generation, std::chrono::duration<double> timeout,
      const std::set<std::string> *speakers = nullptr);
  // The *_locked methods expect state_mutex to be held.
  std::set<std::string> flush_buffers_locked(uint64_t generation);
  void dispatch_window_locked(PendingWindow window, uint64_t generation);
  void transcribe_window(PendingWindow window, uint64_t generation);
  bool is_current_run(uint64_t generation) const;
  void reap_finished_jobs();
  void report_error(const std::string &message);
  std::chrono::duration<double> poll_interval() const;
};

#endif
