#pragma once

/// @file tempo_estimator.h
/// @brief Tempo estimation from note onsets.

#include <vector>

#include "analysis/note_mapper.h"

namespace notescribe {

/// @brief Constants for onset-interval tempo estimation.
namespace tempo_constants {
constexpr float kDefaultTempo = 120.0f;  ///< Fallback tempo in BPM
constexpr float kMinTempo = 60.0f;       ///< Lower bound of the folding range
constexpr float kMaxTempo = 200.0f;      ///< Upper bound of the folding range
constexpr int kMinNotes = 3;             ///< Notes required for an estimate
constexpr float kMinInterval = 1e-3f;    ///< Shorter inter-onset intervals are ignored
}  // namespace tempo_constants

/// @brief Configuration for tempo estimation.
struct TempoConfig {
  float tempo_min = tempo_constants::kMinTempo;          ///< Minimum BPM
  float tempo_max = tempo_constants::kMaxTempo;          ///< Maximum BPM
  float default_tempo = tempo_constants::kDefaultTempo;  ///< Returned when no estimate exists
};

/// @brief Folds a tempo by octaves into [tempo_min, tempo_max].
/// @param bpm Tempo in BPM (> 0)
/// @param tempo_min Lower bound
/// @param tempo_max Upper bound (must be at least 2 * tempo_min to always fit)
/// @return Folded tempo
float fold_tempo(float bpm, float tempo_min, float tempo_max);

/// @brief Estimates tempo from the median inter-onset interval of notes.
/// @details Notes are assumed ordered by start time. Intervals shorter than
/// tempo_constants::kMinInterval are skipped.
/// @param notes Consolidated notes
/// @param config Tempo range and default
/// @return Tempo in BPM, or config.default_tempo for fewer than kMinNotes notes
/// @throws NotescribeException(InvalidParameter) if the range is invalid
float estimate_tempo(const std::vector<ConsolidatedNote>& notes,
                     const TempoConfig& config = TempoConfig());

}  // namespace notescribe
