#include "debug-utils.h"

#include <cstdio>

#include "wav-codec.h"

bool load_wav_data(const std::string &path, std::vector<float> *out_samples,
                   int32_t *out_sample_rate) {
  if (out_samples == nullptr) {
    LOG("Error: out_samples is nullptr");
    return false;
  }
  out_samples->clear();
  std::vector<uint8_t> file_data;
  try {
    file_data = load_file_into_memory(path);
  } catch (const std::exception &e) {
    LOGF("Failed to read WAV file '%s': %s", path.c_str(), e.what());
    return false;
  }
  int32_t sample_rate = 0;
  if (!decode_wav_pcm16(file_data.data(), file_data.size(), out_samples,
                        &sample_rate)) {
    LOGF("Failed to decode WAV file '%s'", path.c_str());
    return false;
  }
  if (out_sample_rate != nullptr) {
    *out_sample_rate = sample_rate;
  }
  return true;
}

bool save_wav_data(const std::string &path, const std::vector<float> &samples,
                   int32_t sample_rate) {
  try {
    save_memory_to_file(path, encode_wav_pcm16(samples, sample_rate));
  } catch (const std::exception &e) {
    LOGF("Failed to save WAV file '%s': %s", path.c_str(), e.what());
    return false;
  }
  return true;
}

std::vector<uint8_t> load_file_into_memory(const std::string &path) {
  FILE *file = std::fopen(path.c_str(), "rb");
  if (!file) {
    THROW_WITH_LOG(("Failed to open file: '" + path + "'").c_str());
  }
  std::fseek(file, 0, SEEK_END);
  long size = std::ftell(file);
  std::fseek(file, 0, SEEK_SET);
  if (size < 0) {
    std::fclose(file);
    THROW_WITH_LOG(("Failed to get size of file: '" + path + "'").c_str());
  }
  std::vector<uint8_t> data(static_cast<size_t>(size));
  size_t bytes_read = std::fread(data.data(), 1, data.size(), file);
  std::fclose(file);
  if (bytes_read != data.size()) {
    THROW_WITH_LOG(("Failed to read file: '" + path +
                    "' completely. Expected " + std::to_string(data.size()) +
                    " bytes, but read " + std::to_string(bytes_read) +
                    " bytes.")
                       .c_str());
  }
  return data;
}

void save_memory_to_file(const std::string &path,
                         const std::vector<uint8_t> &data) {
  FILE *file = std::fopen(path.c_str(), "wb");
  if (!file) {
    THROW_WITH_LOG(("Failed to open file: '" + path + "'").c_str());
  }
  size_t bytes_written = std::fwrite(data.data(), 1, data.size(), file);
  std::fclose(file);
  if (bytes_written != data.size()) {
    THROW_WITH_LOG(("Failed to write file: '" + path +
                    "' completely. Expected " + std::to_string(data.size()) +
                    " bytes, but wrote " + std::to_string(bytes_written) +
                    " bytes.")
                       .c_str());
  }
}
