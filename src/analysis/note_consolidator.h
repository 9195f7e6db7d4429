#pragma once

/// @file note_consolidator.h
/// @brief Merging of adjacent same-note pitch samples into note events.

#include <vector>

#include "analysis/note_mapper.h"

namespace notescribe {

/// @brief Default gap tolerance between merged samples in seconds.
constexpr float kDefaultGapTolerance = 0.05f;

/// @brief Merges consecutive samples that resolve to the same note.
/// @details A sample extends the running note when pitch class and octave match and
/// |sample.start - running.end| < gap_tolerance. Only the end time is extended; the
/// frequency and cents of the first sample of the run are kept. Applying the
/// function to its own output returns the same sequence.
/// @param samples Pitch samples ordered by start time
/// @param gap_tolerance Maximum gap in seconds (exclusive)
/// @return Consolidated notes ordered by start time (empty for empty input)
/// @throws NotescribeException(InvalidParameter) if gap_tolerance is negative
std::vector<ConsolidatedNote> consolidate_notes(const std::vector<PitchSample>& samples,
                                                float gap_tolerance = kDefaultGapTolerance);

}  // namespace notescribe
