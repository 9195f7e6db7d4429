#include "core/sample_buffer.h"

#include <string>
#include <utility>

#include "core/convert.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace notescribe {

SampleBuffer::SampleBuffer() : channels_(nullptr), sample_rate_(0) {}

SampleBuffer::SampleBuffer(std::shared_ptr<const std::vector<std::vector<float>>> channels,
                           int sample_rate)
    : channels_(std::move(channels)), sample_rate_(sample_rate) {}

SampleBuffer SampleBuffer::from_channels(std::vector<std::vector<float>> channels,
                                         int sample_rate) {
  auto storage = std::make_shared<std::vector<std::vector<float>>>(std::move(channels));
  return SampleBuffer(storage, sample_rate);
}

SampleBuffer SampleBuffer::from_mono(std::vector<float> samples, int sample_rate) {
  std::vector<std::vector<float>> channels;
  channels.push_back(std::move(samples));
  return from_channels(std::move(channels), sample_rate);
}

SampleBuffer SampleBuffer::from_interleaved(const float* data, size_t n_frames, int n_channels,
                                            int sample_rate) {
  NOTESCRIBE_CHECK(n_channels > 0, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK(data != nullptr || n_frames == 0, ErrorCode::InvalidParameter);

  std::vector<std::vector<float>> channels(n_channels, std::vector<float>(n_frames));
  for (size_t i = 0; i < n_frames; ++i) {
    for (int ch = 0; ch < n_channels; ++ch) {
      channels[ch][i] = data[i * n_channels + ch];
    }
  }
  return from_channels(std::move(channels), sample_rate);
}

int SampleBuffer::channels() const {
  if (!channels_) {
    return 0;
  }
  return static_cast<int>(channels_->size());
}

size_t SampleBuffer::size() const {
  if (!channels_ || channels_->empty()) {
    return 0;
  }
  return channels_->front().size();
}

float SampleBuffer::duration() const {
  if (sample_rate_ <= 0) {
    return 0.0f;
  }
  return samples_to_time(size(), sample_rate_);
}

const std::vector<float>& SampleBuffer::channel(int index) const {
  NOTESCRIBE_CHECK(index >= 0 && index < channels(), ErrorCode::InvalidParameter);
  return (*channels_)[index];
}

void SampleBuffer::validate() const {
  NOTESCRIBE_CHECK_MSG(sample_rate_ > 0, ErrorCode::InvalidInput,
                       "Invalid sample rate: " + std::to_string(sample_rate_));
  NOTESCRIBE_CHECK_MSG(channels() > 0, ErrorCode::InvalidInput, "Buffer has no channels");

  size_t length = channels_->front().size();
  for (int ch = 0; ch < channels(); ++ch) {
    const std::vector<float>& samples = (*channels_)[ch];
    NOTESCRIBE_CHECK_MSG(samples.size() == length, ErrorCode::InvalidInput,
                         "Channel " + std::to_string(ch) + " has " +
                             std::to_string(samples.size()) + " samples, expected " +
                             std::to_string(length));
    NOTESCRIBE_CHECK_MSG(all_finite(samples.data(), samples.size()), ErrorCode::InvalidInput,
                         "Channel " + std::to_string(ch) + " contains non-finite samples");
  }
}

}  // namespace notescribe
