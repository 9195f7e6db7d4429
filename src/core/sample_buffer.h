#pragma once

/// @file sample_buffer.h
/// @brief Decoded multi-channel PCM buffer with shared ownership.

#include <cstddef>
#include <memory>
#include <vector>

namespace notescribe {

/// @brief Planar multi-channel PCM buffer, samples normalized to [-1, 1].
/// @details The buffer is immutable once constructed; copies share the underlying
/// channel storage. Factories do not validate the contents so that a malformed
/// buffer can be handed to the analysis and rejected there (see validate()).
class SampleBuffer {
 public:
  /// @brief Default constructor creates an empty buffer with no channels.
  SampleBuffer();

  /// @brief Creates a buffer from planar channel data.
  /// @param channels One sample vector per channel (moved)
  /// @param sample_rate Sample rate in Hz
  static SampleBuffer from_channels(std::vector<std::vector<float>> channels, int sample_rate);

  /// @brief Creates a single-channel buffer.
  /// @param samples Mono samples (moved)
  /// @param sample_rate Sample rate in Hz
  static SampleBuffer from_mono(std::vector<float> samples, int sample_rate);

  /// @brief Creates a buffer by de-interleaving frame-ordered samples.
  /// @param data Interleaved samples [n_frames * n_channels]
  /// @param n_frames Number of frames
  /// @param n_channels Number of channels (must be > 0)
  /// @param sample_rate Sample rate in Hz
  /// @throws NotescribeException(InvalidParameter) if data is null with frames, or n_channels <= 0
  static SampleBuffer from_interleaved(const float* data, size_t n_frames, int n_channels,
                                       int sample_rate);

  /// @brief Returns number of channels.
  int channels() const;

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns number of frames (length of the first channel, 0 without channels).
  size_t size() const;

  /// @brief Returns duration in seconds.
  float duration() const;

  /// @brief Returns true if the buffer holds no samples.
  bool empty() const { return size() == 0; }

  /// @brief Returns samples of a channel.
  /// @param index Channel index
  /// @throws NotescribeException(InvalidParameter) if index is out of range
  const std::vector<float>& channel(int index) const;

  /// @brief Checks that the buffer is well formed.
  /// @details Requires at least one channel, equal channel lengths, finite samples and a
  /// positive sample rate.
  /// @throws NotescribeException(InvalidInput) describing the first violation found
  void validate() const;

 private:
  SampleBuffer(std::shared_ptr<const std::vector<std::vector<float>>> channels, int sample_rate);

  std::shared_ptr<const std::vector<std::vector<float>>> channels_;
  int sample_rate_;
};

}  // namespace notescribe
