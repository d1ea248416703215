#include "speaker-embedding-model.h"

#include <algorithm>

#ifndef _WIN32
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include "debug-utils.h"
#include "ort-utils.h"

SpeakerEmbeddingModel::SpeakerEmbeddingModel(bool log_ort_run)
    : ort_env(nullptr),
      ort_session_options(nullptr),
      ort_memory_info(nullptr),
      embedding_session(nullptr),
      log_ort_run(log_ort_run) {
  ort_api = OrtGetApiBase()->GetApi(ORT_API_VERSION);
  LOG_ORT_ERROR(ort_api, ort_api->CreateEnv(ORT_LOGGING_LEVEL_WARNING,
                                            "SpeakerEmbeddingModel", &ort_env));
  LOG_ORT_ERROR(ort_api,
                ort_api->CreateCpuMemoryInfo(
                    OrtDeviceAllocator, OrtMemTypeDefault, &ort_memory_info));

  LOG_ORT_ERROR(ort_api, ort_api->CreateSessionOptions(&ort_session_options));
  LOG_ORT_ERROR(ort_api, ort_api->SetSessionGraphOptimizationLevel(
                             ort_session_options, ORT_ENABLE_EXTENDED));
  LOG_ORT_ERROR(ort_api, ort_api->AddSessionConfigEntry(
                             ort_session_options,
                             "session.use_ort_model_bytes_directly", "1"));
  LOG_ORT_ERROR(ort_api,
                ort_api->AddSessionConfigEntry(
                    ort_session_options, "session.disable_prepacking", "1"));
  LOG_ORT_ERROR(ort_api, ort_api->DisableCpuMemArena(ort_session_options));
}

SpeakerEmbeddingModel::~SpeakerEmbeddingModel() {
  // The session can still point into the mapping, so it goes first.
  if (embedding_session != nullptr) {
    ort_api->ReleaseSession(embedding_session);
  }
  if (ort_session_options != nullptr) {
    ort_api->ReleaseSessionOptions(ort_session_options);
  }
  if (ort_memory_info != nullptr) {
    ort_api->ReleaseMemoryInfo(ort_memory_info);
  }
  if (ort_env != nullptr) {
    ort_api->ReleaseEnv(ort_env);
  }
#ifndef _WIN32
  if (embedding_mmapped_data) {
    munmap(const_cast<char *>(embedding_mmapped_data),
           embedding_mmapped_data_size);
  }
#endif
}

int SpeakerEmbeddingModel::load(const char *embedding_model_path) {
  RETURN_ON_NULL(embedding_model_path);
  RETURN_ON_ERROR(ort_session_from_path(
      ort_api, ort_env, ort_session_options, embedding_model_path,
      &embedding_session, &embedding_mmapped_data,
      &embedding_mmapped_data_size));
  RETURN_ON_NULL(embedding_session);
  LOGF("Loaded speaker embedding model from %s", embedding_model_path);
  return 0;
}

int SpeakerEmbeddingModel::load_from_memory(const uint8_t *embedding_model_data,
                                            size_t embedding_model_data_size) {
  RETURN_ON_ERROR(ort_session_from_memory(
      ort_api, ort_env, ort_session_options, embedding_model_data,
      embedding_model_data_size, &embedding_session));
  RETURN_ON_NULL(embedding_session);
  return 0;
}

int SpeakerEmbeddingModel::calculate_embedding(
    const float *input_audio_data, size_t input_audio_data_size,
    std::vector<float> *out_embedding) {
  RETURN_ON_NULL(out_embedding);
  RETURN_ON_NULL(input_audio_data);
  RETURN_ON_NULL(embedding_session);
  RETURN_ON_FALSE(input_audio_data_size > 0);
  std::lock_guard<std::mutex> lock(processing_mutex);

  std::vector<float> padded_input_audio_data;
  // If the input audio is too short, extend it by repeating the audio data.
  if (input_audio_data_size < ideal_input_size) {
    padded_input_audio_data.resize(ideal_input_size);
    for (size_t offset = 0; offset < ideal_input_size;
         offset += input_audio_data_size) {
      const size_t copy_size =
          std::min(input_audio_data_size, ideal_input_size - offset);
      std::copy(input_audio_data, input_audio_data + copy_size,
                padded_input_audio_data.data() + offset);
    }
    input_audio_data = padded_input_audio_data.data();
    input_audio_data_size = ideal_input_size;
  }

  const int64_t embedding_input_shape[] = {
      1, static_cast<int64_t>(input_audio_data_size)};
  OrtValue *embedding_input = nullptr;
  RETURN_ON_ORT_ERROR(
      ort_api, ort_api->CreateTensorWithDataAsOrtValue(
                   ort_memory_info, const_cast<float *>(input_audio_data),
                   input_audio_data_size * sizeof(float),
                   embedding_input_shape, 2,
                   ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT, &embedding_input));

  const char *embedding_input_name = "waveform";
  const char *embedding_output_name = "embeddings";

  OrtValue *embedding_output = nullptr;
  OrtStatus *run_status =
      ORT_RUN(ort_api, embedding_session, &embedding_input_name,
              &embedding_input, 1, &embedding_output_name, 1,
              &embedding_output);
  ort_api->ReleaseValue(embedding_input);
  RETURN_ON_ORT_ERROR(ort_api, run_status);
  RETURN_ON_NULL(embedding_output);

  OrtTensorTypeAndShapeInfo *output_info = nullptr;
  size_t element_count = 0;
  float *embedding_data = nullptr;
  OrtStatus *status =
      ort_api->GetTensorTypeAndShape(embedding_output, &output_info);
  if (status == nullptr) {
    status = ort_api->GetTensorShapeElementCount(output_info, &element_count);
    ort_api->ReleaseTensorTypeAndShapeInfo(output_info);
  }
  if (status == nullptr) {
    status = ort_api->GetTensorMutableData(
        embedding_output, reinterpret_cast<void **>(&embedding_data));
  }
  if (status != nullptr) {
    ort_api->ReleaseValue(embedding_output);
  }
  RETURN_ON_ORT_ERROR(ort_api, status);

  out_embedding->assign(embedding_data, embedding_data + element_count);
  ort_api->ReleaseValue(embedding_output);
  return 0;
}
