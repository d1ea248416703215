#include "ort-utils.h"

#include <chrono>
#include <filesystem>
#include <string>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#ifdef _WIN32
// No memory mapping on Windows and wchar for the file path.
int ort_session_from_path(const OrtApi *ort_api, OrtEnv *env,
                          OrtSessionOptions *session_options, const char *path,
                          OrtSession **session, const char **mmapped_data,
                          size_t *mmapped_data_size) {
  if (!std::filesystem::exists(path)) {
    LOGF("Model file '%s' does not exist", path);
    return -1;
  }
  std::filesystem::path fs_path(path);
  std::wstring wpath = fs_path.wstring();
  RETURN_ON_ORT_ERROR(
      ort_api,
      ort_api->CreateSession(env, wpath.c_str(), session_options, session));
  *mmapped_data = nullptr;
  *mmapped_data_size = 0;
  return 0;
}
#else
int ort_session_from_path(const OrtApi *ort_api, OrtEnv *env,
                          OrtSessionOptions *session_options, const char *path,
                          OrtSession **session, const char **mmapped_data,
                          size_t *mmapped_data_size) {
  RETURN_ON_NULL(ort_api);
  RETURN_ON_NULL(path);
  *mmapped_data = nullptr;
  *mmapped_data_size = 0;
  if (!std::filesystem::exists(path)) {
    LOGF("Model file '%s' does not exist", path);
    return -1;
  }
  const std::string cpp_path(path);
  if (cpp_path.find(".ort") == std::string::npos) {
    RETURN_ON_ORT_ERROR(
        ort_api, ort_api->CreateSession(env, path, session_options, session));
    return 0;
  }
  int fd = open(path, O_RDONLY);
  if (fd == -1) {
    LOGF("Failed to open memory map file %s", path);
    return -1;
  }
  struct stat st;
  if (fstat(fd, &st) == -1) {
    LOGF("Failed to get file size for %s", path);
    close(fd);
    return -1;
  }
  void *mapping = mmap(nullptr, st.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  close(fd);
  if (mapping == MAP_FAILED) {
    LOGF("Failed to memory map file %s", path);
    return -1;
  }
  *mmapped_data = static_cast<const char *>(mapping);
  *mmapped_data_size = st.st_size;
  RETURN_ON_ORT_ERROR(ort_api, ort_api->CreateSessionFromArray(
                                   env, *mmapped_data, *mmapped_data_size,
                                   session_options, session));
  return 0;
}
#endif

int ort_session_from_memory(const OrtApi *ort_api, OrtEnv *env,
                            OrtSessionOptions *session_options,
                            const uint8_t *data, size_t data_size,
                            OrtSession **session) {
  RETURN_ON_NULL(ort_api);
  RETURN_ON_NULL(data);
  RETURN_ON_ORT_ERROR(
      ort_api, ort_api->CreateSessionFromArray(env, data, data_size,
                                               session_options, session));
  return 0;
}

std::vector<int64_t> ort_get_value_shape(const OrtApi *ort_api,
                                         const OrtValue *value) {
  std::vector<int64_t> shape;
  OrtTensorTypeAndShapeInfo *tensor_info = nullptr;
  OrtStatus *status = ort_api->GetTensorTypeAndShape(value, &tensor_info);
  if (status != nullptr) {
    LOGF("ORT Error: %s", ort_api->GetErrorMessage(status));
    ort_api->ReleaseStatus(status);
    return shape;
  }
  size_t num_dims = 0;
  LOG_ORT_ERROR(ort_api, ort_api->GetDimensionsCount(tensor_info, &num_dims));
  shape.resize(num_dims);
  LOG_ORT_ERROR(ort_api,
                ort_api->GetDimensions(tensor_info, shape.data(), num_dims));
  ort_api->ReleaseTensorTypeAndShapeInfo(tensor_info);
  return shape;
}

OrtStatus *ort_run(const OrtApi *ort_api, OrtSession *session,
                   const char *const *input_names,
                   const OrtValue *const *inputs, size_t input_len,
                   const char *const *output_names, size_t output_names_len,
                   OrtValue **outputs, const char *session_name,
                   bool log_ort_run) {
  if (!log_ort_run) {
    return ort_api->Run(session, nullptr, input_names, inputs, input_len,
                        output_names, output_names_len, outputs);
  }
  std::chrono::steady_clock::time_point start_time =
      std::chrono::steady_clock::now();
  OrtStatus *status =
      ort_api->Run(session, nullptr, input_names, inputs, input_len,
                   output_names, output_names_len, outputs);
  std::chrono::steady_clock::time_point end_time =
      std::chrono::steady_clock::now();
  std::chrono::duration<double, std::milli> duration = end_time - start_time;
  LOGF("ORT Run %s took %.2f ms for inputs:", session_name, duration.count());
  for (size_t i = 0; i < input_len; i++) {
    const std::vector<int64_t> shape = ort_get_value_shape(ort_api, inputs[i]);
    std::string description = std::string(input_names[i]) + " = [";
    for (size_t j = 0; j < shape.size(); j++) {
      description += std::to_string(shape[j]);
      if (j + 1 < shape.size()) {
        description += ", ";
      }
    }
    description += "]";
    LOG(description.c_str());
  }
  return status;
}
