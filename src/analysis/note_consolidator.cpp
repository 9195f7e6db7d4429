#include "analysis/note_consolidator.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace notescribe {

std::vector<ConsolidatedNote> consolidate_notes(const std::vector<PitchSample>& samples,
                                                float gap_tolerance) {
  NOTESCRIBE_CHECK_MSG(gap_tolerance >= 0.0f, ErrorCode::InvalidParameter,
                       "gap_tolerance must not be negative");

  std::vector<ConsolidatedNote> notes;
  if (samples.empty()) {
    return notes;
  }

  ConsolidatedNote current = samples.front();
  for (size_t i = 1; i < samples.size(); ++i) {
    const PitchSample& sample = samples[i];
    if (sample.note.same_pitch(current.note) &&
        std::abs(sample.start - current.end) < gap_tolerance) {
      current.end = std::max(current.end, sample.end);
    } else {
      notes.push_back(current);
      current = sample;
    }
  }
  notes.push_back(current);

  return notes;
}

}  // namespace notescribe
