#include "transcription-pipeline.h"

#include <random>
#include <stdexcept>

#include "debug-utils.h"
#include "string-utils.h"

TranscriptionPipeline::TranscriptionPipeline(
    TranscriptionBackend *backend, const PipelineOptions &options,
    ErrorReporter error_reporter, const LanguageDetector *language_detector)
    : options(options),
      backend(backend),
      language_detector(language_detector),
      error_reporter(error_reporter),
      vad_gate(options.vad_threshold_db, options.vad_hold_open_window,
               options.log_chunk_activity) {
  if (backend == nullptr) {
    throw std::invalid_argument("TranscriptionPipeline needs a backend");
  }
  validate_pipeline_options(options);
  if (this->language_detector == nullptr) {
    this->language_detector = &this->default_language_detector;
  }
  if (!options.language_hint.empty()) {
    this->language_hint = options.language_hint;
  }
  // Segment IDs start from a random 64-bit value and count up, so they stay
  // unique across runs and pipeline instances.
  std::random_device rd;
  this->next_segment_id = (uint64_t)(rd()) << 32 | (uint64_t)(rd());
}

TranscriptionPipeline::~TranscriptionPipeline() {
  stop();
  std::thread loop_thread;
  std::list<std::future<void>> jobs;
  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    // Anything still running belongs to a finished run.
    this->current_generation++;
    loop_thread = std::move(this->consume_thread);
    jobs = std::move(this->transcription_jobs);
  }
  if (loop_thread.joinable()) {
    loop_thread.join();
  }
  for (std::future<void> &job : jobs) {
    job.wait();
  }
}

TranscriptChannelPtr TranscriptionPipeline::start(
    LabeledChunkChannelPtr merged_stream) {
  if (merged_stream == nullptr) {
    throw std::invalid_argument("TranscriptionPipeline::start needs a stream");
  }
  std::lock_guard<std::mutex> control_lock(this->control_mutex);
  TranscriptChannelPtr new_output = std::make_shared<TranscriptChannel>();
  TranscriptChannelPtr previous_output;
  std::thread previous_loop;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    this->current_generation++;
    generation = this->current_generation;
    previous_output = this->output;
    previous_loop = std::move(this->consume_thread);
    this->input = merged_stream;
    this->output = new_output;
    this->_is_running = true;
    this->buffers.clear();
    this->active_transcriptions.clear();
    this->consume_thread = std::thread(&TranscriptionPipeline::consume_stream,
                                       this, merged_stream, generation);
  }
  LOGF("Starting generation %llu", (unsigned long long)generation);
  if (previous_output != nullptr) {
    LOG("Superseding the previous run, closing its output");
    previous_output->close();
  }
  // The superseded loop notices the new generation the next time it wakes.
  if (previous_loop.joinable()) {
    previous_loop.join();
  }
  return new_output;
}

void TranscriptionPipeline::stop() {
  std::lock_guard<std::mutex> control_lock(this->control_mutex);
  std::thread loop_thread;
  LabeledChunkChannelPtr stream;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    if (!this->_is_running) {
      return;
    }
    this->_is_running = false;
    loop_thread = std::move(this->consume_thread);
    stream = this->input;
    generation = this->current_generation;
  }
  LOGF("Stopping generation %llu", (unsigned long long)generation);
  // Closing the stream wakes the loop if it is waiting for the next chunk.
  if (stream != nullptr) {
    stream->close();
  }
  if (loop_thread.joinable()) {
    loop_thread.join();
  }

  const std::chrono::duration<double> drain_timeout(
      this->options.stop_drain_timeout);
  if (!wait_for_active_transcriptions(generation, drain_timeout)) {
    LOGF("Transcriptions still in flight after %.2fs", drain_timeout.count());
  }
  std::set<std::string> flushed_speakers;
  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    flushed_speakers = flush_buffers_locked(generation);
  }
  if (!wait_for_active_transcriptions(generation, drain_timeout,
                                      &flushed_speakers)) {
    LOGF("Final windows still in flight after %.2fs, dropping their results",
         drain_timeout.count());
  }

  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    if (generation == this->current_generation) {
      if (this->output != nullptr) {
        this->output->close();
      }
      this->output = nullptr;
      this->input = nullptr;
      this->buffers.clear();
      this->active_transcriptions.clear();
    }
  }
  LOGF("Generation %llu stopped", (unsigned long long)generation);
}

void TranscriptionPipeline::set_language_hint(
    const std::optional<std::string> &hint) {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  this->language_hint = hint;
}

uint64_t TranscriptionPipeline::generation() const {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  return this->current_generation;
}

bool TranscriptionPipeline::is_running() const {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  return this->_is_running;
}

double TranscriptionPipeline::buffered_duration(
    const std::string &speaker) const {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  auto found = this->buffers.find(speaker);
  if (found == this->buffers.end()) {
    return 0.0;
  }
  return found->second.duration();
}

bool TranscriptionPipeline::is_transcribing(const std::string &speaker) const {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  return this->active_transcriptions.count(speaker) > 0;
}

void TranscriptionPipeline::consume_stream(LabeledChunkChannelPtr stream,
                                           uint64_t generation) {
  LOGF("Consuming merged stream for generation %llu",
       (unsigned long long)generation);
  uint64_t chunk_count = 0;
  uint64_t passed_count = 0;
  uint64_t filtered_count = 0;
  const std::chrono::duration<double> poll = poll_interval();
  while (true) {
    LabeledAudioChunk chunk;
    const ChannelPopResult result = stream->pop_for(&chunk, poll);
    if (!is_current_run(generation)) {
      LOGF("Generation %llu stopped or superseded, leaving stream loop",
           (unsigned long long)generation);
      return;
    }
    if (result == ChannelPopResult::TIMEOUT) {
      continue;
    }
    if (result == ChannelPopResult::CLOSED) {
      break;
    }
    chunk_count++;
    if (this->options.log_chunk_activity && should_log_count(chunk_count)) {
      LOGF("Received chunk #%llu: %s", (unsigned long long)chunk_count,
           chunk.to_string().c_str());
    }
    std::optional<LabeledAudioChunk> passed_chunk =
        this->vad_gate.filter(std::move(chunk));
    if (!passed_chunk.has_value()) {
      filtered_count++;
      continue;
    }
    passed_count++;
    ingest_chunk(*passed_chunk, generation);
  }
  LOGF("Stream ended for generation %llu: %llu chunks, %llu passed, %llu "
       "filtered",
       (unsigned long long)generation, (unsigned long long)chunk_count,
       (unsigned long long)passed_count, (unsigned long long)filtered_count);
  finish_at_end_of_stream(generation);
}

void TranscriptionPipeline::ingest_chunk(const LabeledAudioChunk &chunk,
                                         uint64_t generation) {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  if (generation != this->current_generation || !this->_is_running) {
    return;
  }
  auto found = this->buffers.find(chunk.speaker);
  if (found == this->buffers.end()) {
    found = this->buffers.emplace(chunk.speaker, SpeakerBuffer()).first;
    LOGF("Created buffer for speaker [%s]", chunk.speaker.c_str());
  }
  SpeakerBuffer &buffer = found->second;
  buffer.append(chunk);

  const double duration = buffer.duration();
  const bool in_flight =
      this->active_transcriptions.count(chunk.speaker) > 0;
  if (duration >= this->options.min_buffer_duration && !in_flight) {
    PendingWindow window;
    window.speaker = chunk.speaker;
    window.samples = std::move(buffer.samples);
    window.start_time = buffer.start_time;
    buffer.clear();
    LOGF("Dispatching %.2fs window for [%s] starting at %.3f", duration,
         chunk.speaker.c_str(), window.start_time);
    dispatch_window_locked(std::move(window), generation);
  } else if (duration >= this->options.max_buffer_duration && in_flight) {
    const size_t dropped = buffer.trim_to(
        sample_count_from_duration(this->options.min_buffer_duration));
    if (dropped > 0) {
      LOGF("Trimmed %zu samples from [%s] while its transcription is in "
           "flight",
           dropped, chunk.speaker.c_str());
    }
  }
}

void TranscriptionPipeline::finish_at_end_of_stream(uint64_t generation) {
  // Flush windows run on worker threads like any other window, so this loop
  // only polls and leaves promptly once the run is stopped or superseded.
  const std::chrono::duration<double> poll = poll_interval();
  while (true) {
    {
      std::lock_guard<std::mutex> lock(this->state_mutex);
      if (generation != this->current_generation || !this->_is_running) {
        LOGF("Generation %llu ended elsewhere, leaving end of stream flush",
             (unsigned long long)generation);
        return;
      }
      if (this->active_transcriptions.empty()) {
        if (flush_buffers_locked(generation).empty()) {
          if (this->output != nullptr) {
            this->output->close();
          }
          this->output = nullptr;
          this->input = nullptr;
          this->_is_running = false;
          this->buffers.clear();
          break;
        }
      }
    }
    std::this_thread::sleep_for(poll);
  }
  LOGF("Generation %llu finished", (unsigned long long)generation);
}

bool TranscriptionPipeline::wait_for_active_transcriptions(
    uint64_t generation, std::chrono::duration<double> timeout,
    const std::set<std::string> *speakers) {
  const std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::now() +
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
  const std::chrono::duration<double> poll = poll_interval();
  while (true) {
    {
      std::lock_guard<std::mutex> lock(this->state_mutex);
      if (generation != this->current_generation) {
        return true;
      }
      bool any_active = false;
      if (speakers == nullptr) {
        any_active = !this->active_transcriptions.empty();
      } else {
        for (const std::string &speaker : *speakers) {
          if (this->active_transcriptions.count(speaker) > 0) {
            any_active = true;
            break;
          }
        }
      }
      if (!any_active) {
        return true;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(poll);
  }
}

std::set<std::string> TranscriptionPipeline::flush_buffers_locked(
    uint64_t generation) {
  std::set<std::string> flushed_speakers;
  if (generation != this->current_generation) {
    return flushed_speakers;
  }
  for (auto &entry : this->buffers) {
    SpeakerBuffer &buffer = entry.second;
    if (buffer.empty()) {
      continue;
    }
    if (this->active_transcriptions.count(entry.first) > 0) {
      LOGF("Dropping %.2fs buffered for [%s], its transcription is still in "
           "flight",
           buffer.duration(), entry.first.c_str());
      buffer.clear();
      continue;
    }
    PendingWindow window;
    window.speaker = entry.first;
    window.samples = std::move(buffer.samples);
    window.start_time = buffer.start_time;
    buffer.clear();
    LOGF("Flushing %.2fs for [%s]",
         duration_from_sample_count(window.samples.size()),
         window.speaker.c_str());
    flushed_speakers.insert(window.speaker);
    dispatch_window_locked(std::move(window), generation);
  }
  return flushed_speakers;
}

void TranscriptionPipeline::dispatch_window_locked(PendingWindow window,
                                                   uint64_t generation) {
  reap_finished_jobs();
  this->active_transcriptions.insert(window.speaker);
  this->transcription_jobs.push_back(std::async(
      std::launch::async,
      [this, window = std::move(window), generation]() mutable {
        transcribe_window(std::move(window), generation);
      }));
}

void TranscriptionPipeline::transcribe_window(PendingWindow window,
                                              uint64_t generation) {
  std::optional<std::string> hint;
  {
    std::lock_guard<std::mutex> lock(this->state_mutex);
    if (generation != this->current_generation) {
      return;
    }
    hint = this->language_hint;
  }

  std::vector<TranscriptSegment> segments;
  try {
    const std::vector<TranscriptionSpan> spans =
        this->backend->transcribe(window.samples, PIPELINE_SAMPLE_RATE, hint);
    for (const TranscriptionSpan &span : spans) {
      TranscriptSegment segment;
      segment.id = this->next_segment_id.fetch_add(1);
      segment.text = sanitize_utf8(span.text);
      segment.start_time = window.start_time + span.start_time;
      segment.end_time = window.start_time + span.end_time;
      segment.speaker = window.speaker;
      segment.detected_language = this->language_detector->detect(segment.text);
      segments.push_back(std::move(segment));
    }
  } catch (const std::exception &e) {
    // The window's audio is dropped; the speaker carries on from the next
    // chunk.
    segments.clear();
    report_error(window.speaker + ": " + e.what());
  }

  std::lock_guard<std::mutex> lock(this->state_mutex);
  if (generation != this->current_generation) {
    LOGF("Discarding %zu segments for [%s] from superseded generation %llu",
         segments.size(), window.speaker.c_str(),
         (unsigned long long)generation);
    return;
  }
  if (this->output != nullptr) {
    for (TranscriptSegment &segment : segments) {
      this->output->push(std::move(segment));
    }
  } else if (!segments.empty()) {
    LOGF("Discarding %zu segments for [%s] that finished after stop",
         segments.size(), window.speaker.c_str());
  }
  this->active_transcriptions.erase(window.speaker);
}

bool TranscriptionPipeline::is_current_run(uint64_t generation) const {
  std::lock_guard<std::mutex> lock(this->state_mutex);
  return generation == this->current_generation && this->_is_running;
}

void TranscriptionPipeline::reap_finished_jobs() {
  for (auto it = this->transcription_jobs.begin();
       it != this->transcription_jobs.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it = this->transcription_jobs.erase(it);
    } else {
      ++it;
    }
  }
}

void TranscriptionPipeline::report_error(const std::string &message) {
  if (this->error_reporter) {
    this->error_reporter(message);
  } else {
    LOGF("Transcription failed: %s", message.c_str());
  }
}

std::chrono::duration<double> TranscriptionPipeline::poll_interval() const {
  return std::chrono::duration<double>(this->options.drain_poll_interval);
}
