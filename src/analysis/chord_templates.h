#pragma once

/// @file chord_templates.h
/// @brief Chord interval patterns for chord recognition from note sets.

#include <array>
#include <string>
#include <vector>

#include "util/types.h"

namespace notescribe {

/// @brief Interval pattern of a chord type.
struct ChordTemplate {
  ChordType type;                ///< Chord type
  std::array<int, 4> intervals;  ///< Semitone offsets from the root, ascending
  int n_intervals;               ///< Number of used entries in intervals
};

/// @brief Chord interval table in matching order, indexed like ChordType.
constexpr std::array<ChordTemplate, kNumChordTypes> kChordTemplates = {{
    {ChordType::Major, {0, 4, 7, 0}, 3},
    {ChordType::Minor, {0, 3, 7, 0}, 3},
    {ChordType::Diminished, {0, 3, 6, 0}, 3},
    {ChordType::Augmented, {0, 4, 8, 0}, 3},
    {ChordType::Major7, {0, 4, 7, 11}, 4},
    {ChordType::Dominant7, {0, 4, 7, 10}, 4},
    {ChordType::Minor7, {0, 3, 7, 10}, 4},
    {ChordType::Sus4, {0, 5, 7, 0}, 3},
    {ChordType::Sus2, {0, 2, 7, 0}, 3},
}};

/// @brief Result of comparing detected intervals with a template.
struct IntervalMatch {
  int matched;  ///< Template tones present in the detected set
  int total;    ///< Template tones

  /// @brief Fraction of template tones present.
  float ratio() const { return total > 0 ? static_cast<float>(matched) / total : 0.0f; }
};

/// @brief Semitone interval from root to target in [0, 12).
int pitch_class_interval(PitchClass root, PitchClass target);

/// @brief Sorted, de-duplicated intervals of every pitch class relative to a root.
/// @param pitch_classes Pitch classes present
/// @param root Candidate root
/// @return Ascending intervals in [0, 12)
std::vector<int> intervals_from_root(const std::vector<PitchClass>& pitch_classes,
                                     PitchClass root);

/// @brief Counts how many template tones occur in the detected interval set.
/// @param intervals Detected intervals (ascending)
/// @param tmpl Chord template
IntervalMatch match_intervals(const std::vector<int>& intervals, const ChordTemplate& tmpl);

/// @brief Returns the descriptive chord type name (e.g., "Major", "Dominant 7").
std::string chord_type_name(ChordType type);

}  // namespace notescribe
