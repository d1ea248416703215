#include "wav-codec.h"

#include <algorithm>
#include <cstring>

#include "debug-utils.h"

namespace {
constexpr size_t wav_header_size = 44;
constexpr uint16_t pcm_format_tag = 1;
constexpr uint16_t pcm_bits_per_sample = 16;

void append_uint16(std::vector<uint8_t> *out, uint16_t value) {
  out->push_back(static_cast<uint8_t>(value & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void append_uint32(std::vector<uint8_t> *out, uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    out->push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

void append_tag(std::vector<uint8_t> *out, const char *tag) {
  out->insert(out->end(), tag, tag + 4);
}

uint16_t read_uint16(const uint8_t *data) {
  return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t read_uint32(const uint8_t *data) {
  return static_cast<uint32_t>(data[0]) |
         (static_cast<uint32_t>(data[1]) << 8) |
         (static_cast<uint32_t>(data[2]) << 16) |
         (static_cast<uint32_t>(data[3]) << 24);
}
}  // namespace

std::vector<uint8_t> encode_wav_pcm16(const std::vector<float> &samples,
                                      int32_t sample_rate) {
  const uint16_t channel_count = 1;
  const uint16_t block_align = channel_count * (pcm_bits_per_sample / 8);
  const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
  const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);

  std::vector<uint8_t> result;
  result.reserve(wav_header_size + data_size);
  append_tag(&result, "RIFF");
  append_uint32(&result, 36 + data_size);
  append_tag(&result, "WAVE");

  append_tag(&result, "fmt ");
  append_uint32(&result, 16);
  append_uint16(&result, pcm_format_tag);
  append_uint16(&result, channel_count);
  append_uint32(&result, static_cast<uint32_t>(sample_rate));
  append_uint32(&result, byte_rate);
  append_uint16(&result, block_align);
  append_uint16(&result, pcm_bits_per_sample);

  append_tag(&result, "data");
  append_uint32(&result, data_size);
  for (const float sample : samples) {
    const float clamped = gate(sample, -1.0f, 1.0f);
    const int16_t value = static_cast<int16_t>(clamped * 32767.0f);
    append_uint16(&result, static_cast<uint16_t>(value));
  }
  return result;
}

bool decode_wav_pcm16(const uint8_t *data, size_t data_size,
                      std::vector<float> *out_samples,
                      int32_t *out_sample_rate) {
  if (data == nullptr || out_samples == nullptr) {
    LOG("Error: null WAV input or output");
    return false;
  }
  out_samples->clear();
  if (data_size < 12 || std::memcmp(data, "RIFF", 4) != 0 ||
      std::memcmp(data + 8, "WAVE", 4) != 0) {
    LOG("Not a RIFF/WAVE container");
    return false;
  }

  uint16_t format_tag = 0;
  uint16_t channel_count = 0;
  uint32_t sample_rate = 0;
  uint16_t bits_per_sample = 0;
  bool found_fmt = false;
  const uint8_t *pcm_data = nullptr;
  size_t pcm_data_size = 0;

  size_t offset = 12;
  while (offset + 8 <= data_size) {
    const uint8_t *chunk_id = data + offset;
    const size_t chunk_size = read_uint32(data + offset + 4);
    const uint8_t *chunk_body = data + offset + 8;
    const size_t available = data_size - (offset + 8);
    if (std::memcmp(chunk_id, "fmt ", 4) == 0) {
      if (chunk_size < 16 || available < 16) {
        LOG("fmt chunk too small");
        return false;
      }
      format_tag = read_uint16(chunk_body);
      channel_count = read_uint16(chunk_body + 2);
      sample_rate = read_uint32(chunk_body + 4);
      bits_per_sample = read_uint16(chunk_body + 14);
      found_fmt = true;
    } else if (std::memcmp(chunk_id, "data", 4) == 0) {
      pcm_data = chunk_body;
      // Streaming writers leave the data size unset, so clip to what exists.
      pcm_data_size = std::min(chunk_size, available);
      break;
    }
    // Chunks are padded to an even number of bytes.
    offset += 8 + chunk_size + (chunk_size & 1);
  }

  if (!found_fmt) {
    LOG("No fmt chunk found");
    return false;
  }
  if (pcm_data == nullptr) {
    LOG("No data chunk found");
    return false;
  }
  if (format_tag != pcm_format_tag || bits_per_sample != pcm_bits_per_sample) {
    LOGF("Only 16-bit PCM WAV data is supported, got format %d with %d bits",
         format_tag, bits_per_sample);
    return false;
  }
  if (channel_count == 0) {
    LOG("WAV data has no channels");
    return false;
  }

  const size_t frame_size = static_cast<size_t>(channel_count) * 2;
  const size_t frame_count = pcm_data_size / frame_size;
  out_samples->resize(frame_count);
  for (size_t frame = 0; frame < frame_count; frame++) {
    float sum = 0.0f;
    for (size_t channel = 0; channel < channel_count; channel++) {
      const int16_t value = static_cast<int16_t>(
          read_uint16(pcm_data + frame * frame_size + channel * 2));
      sum += static_cast<float>(value) / 32768.0f;
    }
    (*out_samples)[frame] = sum / channel_count;
  }
  if (out_sample_rate != nullptr) {
    *out_sample_rate = static_cast<int32_t>(sample_rate);
  }
  return true;
}
