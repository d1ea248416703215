#ifndef WAV_CODEC_H
#define WAV_CODEC_H

#include <cstddef>
#include <cstdint>
#include <vector>

// Encodes mono float samples as a 16-bit linear PCM RIFF/WAVE container.
// Each sample is clamped to [-1, 1], scaled by 32767 and written
// little-endian.
std::vector<uint8_t> encode_wav_pcm16(const std::vector<float> &samples,
                                      int32_t sample_rate);

// Decodes a 16-bit PCM WAV container. Multi-channel audio is averaged down to
// mono. Returns false if the data is not a supported WAV file.
bool decode_wav_pcm16(const uint8_t *data, size_t data_size,
                      std::vector<float> *out_samples,
                      int32_t *out_sample_rate);

#endif
