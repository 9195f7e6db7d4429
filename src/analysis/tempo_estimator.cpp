#include "analysis/tempo_estimator.h"

#include "util/exception.h"
#include "util/math_utils.h"

namespace notescribe {

float fold_tempo(float bpm, float tempo_min, float tempo_max) {
  if (bpm <= 0.0f) {
    return bpm;
  }
  while (bpm > tempo_max) {
    bpm *= 0.5f;
  }
  while (bpm < tempo_min) {
    bpm *= 2.0f;
  }
  return bpm;
}

float estimate_tempo(const std::vector<ConsolidatedNote>& notes, const TempoConfig& config) {
  NOTESCRIBE_CHECK_MSG(config.tempo_min > 0.0f && config.tempo_max >= 2.0f * config.tempo_min,
                       ErrorCode::InvalidParameter,
                       "tempo range must satisfy 0 < tempo_min and 2 * tempo_min <= tempo_max");
  NOTESCRIBE_CHECK(config.default_tempo > 0.0f, ErrorCode::InvalidParameter);

  if (notes.size() < static_cast<size_t>(tempo_constants::kMinNotes)) {
    return config.default_tempo;
  }

  std::vector<float> intervals;
  intervals.reserve(notes.size() - 1);
  for (size_t i = 1; i < notes.size(); ++i) {
    float ioi = notes[i].start - notes[i - 1].start;
    if (ioi >= tempo_constants::kMinInterval) {
      intervals.push_back(ioi);
    }
  }
  if (intervals.empty()) {
    return config.default_tempo;
  }

  float beat = median(intervals.data(), intervals.size());
  if (beat < tempo_constants::kMinInterval) {
    return config.default_tempo;
  }
  return fold_tempo(60.0f / beat, config.tempo_min, config.tempo_max);
}

}  // namespace notescribe
