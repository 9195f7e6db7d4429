#pragma once

/// @file key_analyzer.h
/// @brief Key estimation from transcribed notes.

#include <string>
#include <vector>

#include "analysis/key_profiles.h"
#include "analysis/note_mapper.h"
#include "util/types.h"

namespace notescribe {

/// @brief Detected musical key.
struct Key {
  PitchClass root;   ///< Root pitch class
  Mode mode;         ///< Major or Minor
  float confidence;  ///< Confidence score [0, 1]

  /// @brief Returns key name (e.g., "C major", "A minor").
  std::string to_string() const;

  /// @brief Returns short key name (e.g., "C", "Am").
  std::string to_short_string() const;
};

/// @brief Builds a duration-weighted pitch-class histogram.
/// @param notes Consolidated notes
/// @return Total seconds per pitch class
PitchClassWeights pitch_class_histogram(const std::vector<ConsolidatedNote>& notes);

/// @brief Picks the major or minor key whose profile best matches a histogram.
/// @details Ties keep the lower tonic, and major before minor. Confidence blends
/// the winning correlation with its lead over the runner-up.
/// @param histogram Pitch-class weights
/// @return Best key; C major with zero confidence for an empty histogram
Key estimate_key(const PitchClassWeights& histogram);

/// @brief Estimates the key of a note sequence.
/// @details Without notes the result is C major with zero confidence.
/// @param notes Consolidated notes
/// @return Detected key
Key detect_key(const std::vector<ConsolidatedNote>& notes);

}  // namespace notescribe
