#include "stream-merger.h"

#include <stdexcept>

#include "debug-utils.h"

StreamMerger::StreamMerger(AudioChunkChannelPtr microphone_input,
                           AudioChunkChannelPtr system_audio_input,
                           bool log_chunk_activity)
    : microphone_input(microphone_input),
      system_audio_input(system_audio_input),
      log_chunk_activity(log_chunk_activity) {
  if (microphone_input == nullptr || system_audio_input == nullptr) {
    throw std::invalid_argument("StreamMerger needs two input channels");
  }
}

StreamMerger::~StreamMerger() {
  microphone_input->close();
  system_audio_input->close();
  wait();
}

LabeledChunkChannelPtr StreamMerger::start() {
  if (merged_output != nullptr) {
    throw std::runtime_error("StreamMerger has already been started");
  }
  LOG("StreamMerger starting");
  merged_output = std::make_shared<LabeledChunkChannel>();
  open_source_count = 2;
  microphone_reader = std::thread(&StreamMerger::read_source, this,
                                  microphone_input, AudioSource::MICROPHONE);
  system_audio_reader =
      std::thread(&StreamMerger::read_source, this, system_audio_input,
                  AudioSource::SYSTEM_AUDIO);
  return merged_output;
}

void StreamMerger::wait() {
  if (microphone_reader.joinable()) {
    microphone_reader.join();
  }
  if (system_audio_reader.joinable()) {
    system_audio_reader.join();
  }
}

void StreamMerger::read_source(AudioChunkChannelPtr input,
                               AudioSource source) {
  const char *source_name = audio_source_to_string(source);
  uint64_t chunk_count = 0;
  AudioChunk chunk;
  while (input->pop(&chunk)) {
    chunk_count++;
    if (log_chunk_activity && should_log_count(chunk_count)) {
      LOGF("%s chunk #%llu: %zu samples at %.3f", source_name,
           (unsigned long long)chunk_count, chunk.samples.size(),
           chunk.timestamp);
    }
    // The chunk is labeled from the reader's own source, whatever the
    // producer put in the source field.
    chunk.source = source;
    if (merged_output->push(LabeledAudioChunk::from_chunk(std::move(chunk)))) {
      forwarded_count++;
    }
    chunk = AudioChunk();
  }
  LOGF("%s stream ended after %llu chunks", source_name,
       (unsigned long long)chunk_count);
  if (open_source_count.fetch_sub(1) == 1) {
    LOG("Both audio streams completed, closing merged stream");
    merged_output->close();
  }
}
