#include "resampler.h"

#include <stdexcept>
#include <string>

namespace {

std::vector<float> box_downsample(const std::vector<float> &audio,
                                  double ratio, size_t output_size) {
  std::vector<float> output(output_size);
  for (size_t i = 0; i < output_size; ++i) {
    size_t begin = static_cast<size_t>(i * ratio);
    size_t end = static_cast<size_t>((i + 1) * ratio);
    if (end > audio.size()) {
      end = audio.size();
    }
    if (end <= begin) {
      end = begin + 1;
    }
    double sum = 0.0;
    for (size_t j = begin; j < end; ++j) {
      sum += audio[j];
    }
    output[i] = (float)(sum / (end - begin));
  }
  return output;
}

std::vector<float> linear_upsample(const std::vector<float> &audio,
                                   double ratio, size_t output_size) {
  std::vector<float> output(output_size);
  const size_t last = audio.size() - 1;
  for (size_t i = 0; i < output_size; ++i) {
    const double position = i * ratio;
    const size_t index = static_cast<size_t>(position);
    if (index >= last) {
      output[i] = audio[last];
      continue;
    }
    const float fraction = (float)(position - index);
    output[i] = audio[index] + fraction * (audio[index + 1] - audio[index]);
  }
  return output;
}

}  // namespace

std::vector<float> resample_audio(const std::vector<float> &audio,
                                  int32_t input_sample_rate,
                                  int32_t output_sample_rate) {
  if (input_sample_rate <= 0 || output_sample_rate <= 0) {
    throw std::invalid_argument(
        "Sample rates must be positive, got " +
        std::to_string(input_sample_rate) + " and " +
        std::to_string(output_sample_rate));
  }
  if (input_sample_rate == output_sample_rate || audio.empty()) {
    return audio;
  }
  const size_t output_size = static_cast<size_t>(
      (uint64_t)(audio.size()) * output_sample_rate / input_sample_rate);
  // Input samples per output sample.
  const double ratio = (double)(input_sample_rate) / output_sample_rate;
  if (input_sample_rate > output_sample_rate) {
    return box_downsample(audio, ratio, output_size);
  }
  return linear_upsample(audio, ratio, output_size);
}
