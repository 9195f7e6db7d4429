#include "feature/pitch.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

#include "core/convert.h"
#include "core/segmenter.h"
#include "core/window.h"
#include "util/exception.h"

namespace notescribe {

int PitchTrack::voiced_count() const {
  return static_cast<int>(std::count_if(f0.begin(), f0.end(), [](float f) { return f > 0.0f; }));
}

float PitchTrack::start_time(int index) const {
  return segment_start_time(index, segment_length, sample_rate);
}

float PitchTrack::end_time(int index) const {
  return segment_end_time(index, segment_length, sample_rate);
}

LagRange lag_range(int sr, float fmin, float fmax, int frame_length) {
  LagRange range;
  range.min_lag = static_cast<int>(std::floor(static_cast<double>(sr) / fmax));
  range.max_lag = static_cast<int>(std::ceil(static_cast<double>(sr) / fmin));

  // Lag 0 is the signal energy, not a period.
  range.min_lag = std::max(1, range.min_lag);
  range.max_lag = std::min(range.max_lag, frame_length);
  return range;
}

std::vector<float> autocorrelation(const float* frame, int length, int min_lag, int max_lag) {
  NOTESCRIBE_CHECK(frame != nullptr, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK(min_lag >= 0 && max_lag <= length, ErrorCode::InvalidParameter);

  if (min_lag >= max_lag) {
    return {};
  }

  Eigen::Map<const Eigen::VectorXf> x(frame, length);
  std::vector<float> corr(max_lag - min_lag);
  for (int lag = min_lag; lag < max_lag; ++lag) {
    int overlap = length - lag;
    corr[lag - min_lag] = x.head(overlap).dot(x.segment(lag, overlap));
  }
  return corr;
}

int find_peak_lag(const std::vector<float>& corr, int min_lag) {
  float best = 0.0f;
  int best_lag = 0;
  for (size_t k = 0; k < corr.size(); ++k) {
    // Strict comparison keeps the lowest lag on ties.
    if (corr[k] > best) {
      best = corr[k];
      best_lag = min_lag + static_cast<int>(k);
    }
  }
  return best_lag;
}

float estimate_pitch(const float* frame, int length, int sr, float fmin, float fmax) {
  NOTESCRIBE_CHECK(frame != nullptr && length >= 2, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK(sr > 0, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK(fmin > 0.0f && fmax > fmin, ErrorCode::InvalidParameter);

  LagRange range = lag_range(sr, fmin, fmax, length);
  if (range.empty()) {
    return 0.0f;
  }

  std::vector<float> windowed = apply_hann_window(frame, length);
  std::vector<float> corr = autocorrelation(windowed.data(), length, range.min_lag, range.max_lag);

  int lag = find_peak_lag(corr, range.min_lag);
  if (lag <= 0) {
    return 0.0f;
  }

  float freq = static_cast<float>(sr) / static_cast<float>(lag);
  if (freq < fmin || freq > fmax) {
    return 0.0f;
  }
  return freq;
}

PitchTrack track_pitch(const std::vector<float>& samples, int sr, const PitchConfig& config) {
  NOTESCRIBE_CHECK(sr > 0, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK_MSG(config.segment_length >= 2, ErrorCode::InvalidParameter,
                       "segment_length must be at least 2");
  NOTESCRIBE_CHECK_MSG(config.fmin > 0.0f && config.fmax > config.fmin,
                       ErrorCode::InvalidParameter, "Frequency range must satisfy 0 < fmin < fmax");

  PitchTrack track;
  track.segment_length = config.segment_length;
  track.sample_rate = sr;

  Segmenter segmenter(samples.data(), samples.size(), config.segment_length);
  track.f0.assign(segmenter.count(), 0.0f);

  // Each result lands at its segment index, so evaluation order does not matter.
  Segment segment;
  while (segmenter.next(segment)) {
    track.f0[segment.index] =
        estimate_pitch(segment.data, segment.length, sr, config.fmin, config.fmax);
  }

  return track;
}

}  // namespace notescribe
