#pragma once

/// @file chord_analyzer.h
/// @brief Chord identification from co-occurring note events.

#include <vector>

#include "analysis/chord_templates.h"
#include "analysis/note_mapper.h"
#include "util/types.h"

namespace notescribe {

/// @brief Constants for chord identification.
namespace chord_constants {
/// @brief Width of a chord time bucket in seconds.
constexpr float kTimeWindowSec = 0.2f;

/// @brief Minimum number of template tones that must be present.
constexpr int kMinMatchingTones = 3;

/// @brief Minimum fraction of template tones that must be present.
constexpr float kMinMatchRatio = 0.75f;

/// @brief Minimum number of notes in a bucket to attempt a match.
constexpr int kMinNotesPerBucket = 2;
}  // namespace chord_constants

/// @brief Identified chord with timing information.
struct Chord {
  PitchClass root;                 ///< Root pitch class
  ChordType type;                  ///< Chord type
  std::vector<PitchClass> notes;   ///< Distinct pitch classes in first-observed order
  float start;                     ///< Start time in seconds
  float end;                       ///< End time in seconds

  /// @brief Returns duration in seconds.
  float duration() const { return end - start; }
};

/// @brief Configuration for chord identification.
struct ChordConfig {
  float time_window = chord_constants::kTimeWindowSec;        ///< Bucket width in seconds
  int min_matching_tones = chord_constants::kMinMatchingTones;  ///< Required template tones
  float min_match_ratio = chord_constants::kMinMatchRatio;      ///< Required template fraction
};

/// @brief Outcome of matching a pitch-class set against the chord table.
struct ChordMatch {
  bool found;      ///< True if some root/type pair matched
  PitchClass root;  ///< Matched root
  ChordType type;   ///< Matched chord type
};

/// @brief Matches a set of pitch classes against the chord table.
/// @details Candidate roots are tried in the order given; the first root with any
/// matching type wins. For that root the type with the most matched tones is chosen,
/// then the higher matched fraction, then table order.
/// @param pitch_classes Distinct pitch classes in first-observed order
/// @param config Match thresholds
/// @return Match result (found == false if nothing matched)
ChordMatch match_chord(const std::vector<PitchClass>& pitch_classes,
                       const ChordConfig& config = ChordConfig());

/// @brief Chord identifier over consolidated notes.
/// @details Groups notes into buckets keyed by floor(start / time_window) and matches
/// each bucket holding at least two notes. Buckets without a match are skipped.
class ChordAnalyzer {
 public:
  /// @brief Identifies chords in a note sequence.
  /// @param notes Consolidated notes ordered by start time
  /// @param config Chord configuration
  /// @throws NotescribeException(InvalidParameter) on invalid configuration
  explicit ChordAnalyzer(const std::vector<ConsolidatedNote>& notes,
                         const ChordConfig& config = ChordConfig());

  /// @brief Returns identified chords ordered by start time.
  const std::vector<Chord>& chords() const { return chords_; }

 private:
  void analyze(const std::vector<ConsolidatedNote>& notes);

  std::vector<Chord> chords_;
  ChordConfig config_;
};

/// @brief Quick chord identification function.
/// @param notes Consolidated notes ordered by start time
/// @param config Chord configuration
/// @return Identified chords
std::vector<Chord> identify_chords(const std::vector<ConsolidatedNote>& notes,
                                   const ChordConfig& config = ChordConfig());

}  // namespace notescribe
