#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "debug-utils.h"
#include "diarization-service.h"
#include "embedding-diarization-backend.h"
#include "pipeline-options.h"
#include "resampler.h"
#include "stream-merger.h"
#include "transcription-pipeline.h"

namespace {
class AudioProducer {
 public:
  AudioProducer(const std::string &wav_path, AudioSource source,
                float chunk_duration_seconds = 0.1f)
      : source_(source) {
    std::vector<float> file_samples;
    int32_t file_sample_rate = 0;
    if (!load_wav_data(wav_path, &file_samples, &file_sample_rate)) {
      throw std::runtime_error("Failed to load WAV file '" + wav_path + "'");
    }
    audio_data_ =
        resample_audio(file_samples, file_sample_rate, PIPELINE_SAMPLE_RATE);
    chunk_size_ = sample_count_from_duration(chunk_duration_seconds);
  }

  // Feeds the whole file into the channel and closes it. In realtime mode
  // each chunk is held back until its capture time has passed.
  void run(AudioChunkChannelPtr channel, bool realtime) {
    const std::chrono::steady_clock::time_point start_time =
        std::chrono::steady_clock::now();
    for (size_t offset = 0; offset < audio_data_.size(); offset += chunk_size_) {
      const size_t end_index =
          std::min(offset + chunk_size_, audio_data_.size());
      AudioChunk chunk;
      chunk.samples.assign(audio_data_.begin() + offset,
                           audio_data_.begin() + end_index);
      chunk.timestamp = duration_from_sample_count(offset);
      chunk.source = source_;
      if (realtime) {
        std::this_thread::sleep_until(
            start_time + std::chrono::duration_cast<
                             std::chrono::steady_clock::duration>(
                             std::chrono::duration<double>(chunk.timestamp)));
      }
      channel->push(std::move(chunk));
    }
    channel->close();
  }

  const std::vector<float> &audio_data() const { return audio_data_; }

 private:
  AudioSource source_;
  size_t chunk_size_;
  std::vector<float> audio_data_;
};

// Stands in for a speech model by describing each window it is given.
class WindowSummaryBackend : public TranscriptionBackend {
 public:
  std::vector<TranscriptionSpan> transcribe(
      const std::vector<float> &samples, int32_t sample_rate,
      const std::optional<std::string> &) override {
    const float rms = rms_energy(samples.data(), samples.size());
    const double duration = (double)(samples.size()) / sample_rate;
    char text[96];
    snprintf(text, sizeof(text), "<%.2fs of speech at %.1f dB>", duration,
             20.0f * std::log10(std::max(rms, 1e-10f)));
    return {{text, 0.0, duration}};
  }
};

std::vector<float> mix_down(const std::vector<float> &a,
                            const std::vector<float> &b) {
  std::vector<float> result(std::max(a.size(), b.size()), 0.0f);
  for (size_t i = 0; i < result.size(); ++i) {
    const float a_value = i < a.size() ? a[i] : 0.0f;
    const float b_value = i < b.size() ? b[i] : 0.0f;
    result[i] = 0.5f * (a_value + b_value);
  }
  return result;
}

void print_usage(const char *program) {
  std::cerr << "Usage: " << program
            << " --mic <wav> --system <wav> [--option name=value]..."
               " [--realtime] [--diarize --embedding-model <path>]"
            << std::endl;
}
}  // namespace

int main(int argc, char *argv[]) {
  std::string microphone_path;
  std::string system_audio_path;
  std::string embedding_model_path = "speaker-embedding-model.ort";
  bool realtime = false;
  bool diarize = false;
  PipelineOptionList option_list;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if ((arg == "-m" || arg == "--mic") && has_value) {
      microphone_path = argv[++i];
    } else if ((arg == "-s" || arg == "--system") && has_value) {
      system_audio_path = argv[++i];
    } else if ((arg == "-o" || arg == "--option") && has_value) {
      option_list.push_back(parse_option_assignment(argv[++i]));
    } else if ((arg == "-e" || arg == "--embedding-model") && has_value) {
      embedding_model_path = argv[++i];
    } else if (arg == "-r" || arg == "--realtime") {
      realtime = true;
    } else if (arg == "-d" || arg == "--diarize") {
      diarize = true;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }
  if (microphone_path.empty() || system_audio_path.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    PipelineOptions options;
    parse_pipeline_options(option_list, options);
    LOG(pipeline_options_to_string(options).c_str());

    AudioProducer microphone_producer(microphone_path, AudioSource::MICROPHONE);
    AudioProducer system_audio_producer(system_audio_path,
                                        AudioSource::SYSTEM_AUDIO);
    AudioChunkChannelPtr microphone = std::make_shared<AudioChunkChannel>();
    AudioChunkChannelPtr system_audio = std::make_shared<AudioChunkChannel>();

    WindowSummaryBackend backend;
    TranscriptionPipeline pipeline(&backend, options);
    StreamMerger merger(microphone, system_audio, options.log_chunk_activity);
    TranscriptChannelPtr transcript = pipeline.start(merger.start());

    std::thread microphone_thread(&AudioProducer::run, &microphone_producer,
                                  microphone, realtime);
    std::thread system_audio_thread(&AudioProducer::run,
                                    &system_audio_producer, system_audio,
                                    realtime);

    TranscriptSegment segment;
    size_t segment_count = 0;
    while (transcript->pop(&segment)) {
      std::cout << segment.to_string() << std::endl;
      segment_count++;
    }
    microphone_thread.join();
    system_audio_thread.join();
    merger.wait();
    std::cout << segment_count << " segments, "
              << pipeline.gate().to_string() << std::endl;

    if (diarize) {
      EmbeddingDiarizationBackend diarization_backend(embedding_model_path);
      DiarizationService diarization(&diarization_backend);
      if (!diarization.is_available()) {
        std::cerr << "Speaker embedding model not found at '"
                  << embedding_model_path << "'" << std::endl;
        return 1;
      }
      const DiarizationResult result = diarization.diarize(
          mix_down(microphone_producer.audio_data(),
                   system_audio_producer.audio_data()),
          PIPELINE_SAMPLE_RATE);
      std::cout << result.to_string() << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
