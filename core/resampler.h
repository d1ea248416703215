#ifndef RESAMPLER_H
#define RESAMPLER_H

#include <cstdint>
#include <vector>

// Converts mono audio between sample rates. Downsampling averages the input
// samples that fall inside each output sample, upsampling interpolates
// linearly between neighbours. Throws std::invalid_argument for non-positive
// rates.
std::vector<float> resample_audio(const std::vector<float> &audio,
                                  int32_t input_sample_rate,
                                  int32_t output_sample_rate);

#endif
