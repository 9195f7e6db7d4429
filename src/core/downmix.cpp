#include "core/downmix.h"

#include <algorithm>


namespace notescribe {

std::vector<float> downmix(const SampleBuffer& buffer) {
  int channels = buffer.channels();
  if (channels == 0) {
    return {};
  }
  if (channels == 1) {
    return buffer.channel(0);
  }

  size_t n_frames = buffer.size();
  std::vector<float> mono(n_frames, 0.0f);
  for (int ch = 0; ch < channels; ++ch) {
    const std::vector<float>& samples = buffer.channel(ch);
    size_t n = std::min(n_frames, samples.size());
    for (size_t i = 0; i < n; ++i) {
      mono[i] += samples[i];
    }
  }

  for (float& sample : mono) {
    sample /= static_cast<float>(channels);
  }
  return mono;
}

}  // namespace notescribe
