#pragma once

/// @file pitch.h
/// @brief Fundamental frequency estimation by windowed autocorrelation.

#include <vector>

namespace notescribe {

/// @brief Default parameters of the pitch estimator.
namespace pitch_constants {
/// @brief Analysis window length in samples.
constexpr int kSegmentLength = 4096;

/// @brief Lowest detectable frequency in Hz (around E2).
constexpr float kMinFrequency = 80.0f;

/// @brief Highest detectable frequency in Hz (around B5).
constexpr float kMaxFrequency = 1000.0f;
}  // namespace pitch_constants

/// @brief Pitch tracking configuration.
struct PitchConfig {
  int segment_length = pitch_constants::kSegmentLength;  ///< Window length in samples
  float fmin = pitch_constants::kMinFrequency;           ///< Minimum frequency in Hz
  float fmax = pitch_constants::kMaxFrequency;           ///< Maximum frequency in Hz
};

/// @brief Half-open range of autocorrelation lags [min_lag, max_lag).
struct LagRange {
  int min_lag;  ///< floor(sr / fmax), at least 1
  int max_lag;  ///< ceil(sr / fmin), at most the frame length

  /// @brief Returns true if the range holds no lag.
  bool empty() const { return min_lag >= max_lag; }
};

/// @brief Per-segment pitch track.
struct PitchTrack {
  std::vector<float> f0;  ///< Frequency per segment in Hz, 0 where no pitch was found
  int segment_length = 0;  ///< Segment length in samples
  int sample_rate = 0;     ///< Sample rate in Hz

  /// @brief Returns number of analyzed segments.
  int n_segments() const { return static_cast<int>(f0.size()); }

  /// @brief Returns number of segments with a pitch.
  int voiced_count() const;

  /// @brief Start time of a segment in seconds.
  float start_time(int index) const;

  /// @brief End time of a segment in seconds.
  float end_time(int index) const;
};

/// @brief Computes the lag search range for a frequency band.
/// @param sr Sample rate in Hz
/// @param fmin Minimum frequency in Hz
/// @param fmax Maximum frequency in Hz
/// @param frame_length Frame length in samples (upper bound for max_lag)
LagRange lag_range(int sr, float fmin, float fmax, int frame_length);

/// @brief Computes the raw autocorrelation R[lag] = sum_i x[i] * x[i + lag].
/// @param frame Input samples
/// @param length Number of samples
/// @param min_lag First lag (inclusive)
/// @param max_lag Last lag (exclusive, <= length)
/// @return R values for lags [min_lag, max_lag)
std::vector<float> autocorrelation(const float* frame, int length, int min_lag, int max_lag);

/// @brief Returns the lag with the largest positive correlation.
/// @param corr Correlation values, corr[k] belongs to lag min_lag + k
/// @param min_lag Lag of corr[0]
/// @return Best lag, ties resolved to the lowest lag; 0 if no value is positive
int find_peak_lag(const std::vector<float>& corr, int min_lag);

/// @brief Estimates the fundamental frequency of one frame.
/// @details Applies a Hann window, then picks the autocorrelation maximum
/// inside the lag range of [fmin, fmax].
/// @param frame Input samples
/// @param length Number of samples
/// @param sr Sample rate in Hz
/// @param fmin Minimum frequency in Hz
/// @param fmax Maximum frequency in Hz
/// @return Frequency in Hz, or 0 if no pitch inside [fmin, fmax] was found
float estimate_pitch(const float* frame, int length, int sr,
                     float fmin = pitch_constants::kMinFrequency,
                     float fmax = pitch_constants::kMaxFrequency);

/// @brief Estimates the pitch of every segment of a mono signal.
/// @param samples Mono samples
/// @param sr Sample rate in Hz
/// @param config Pitch configuration
/// @return Pitch track in segment order
/// @throws NotescribeException(InvalidParameter) on invalid configuration
PitchTrack track_pitch(const std::vector<float>& samples, int sr,
                       const PitchConfig& config = PitchConfig());

}  // namespace notescribe
