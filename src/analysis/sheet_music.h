#pragma once

/// @file sheet_music.h
/// @brief Duration quantization and sheet-music packaging.

#include <vector>

#include "analysis/note_mapper.h"
#include "analysis/tempo_estimator.h"
#include "util/types.h"

namespace notescribe {

/// @brief Duration class thresholds.
namespace sheet_constants {
constexpr float kWholeMs = 1000.0f;     ///< Lower bound of a whole note
constexpr float kHalfMs = 500.0f;       ///< Lower bound of a half note
constexpr float kQuarterMs = 250.0f;    ///< Lower bound of a quarter note
constexpr float kEighthMs = 125.0f;     ///< Lower bound of an eighth note
}  // namespace sheet_constants

/// @brief Time signature.
struct TimeSignature {
  int numerator = 4;    ///< Beats per measure
  int denominator = 4;  ///< Beat unit
};

/// @brief One note of the sheet-music representation.
struct SheetMusicNote {
  PitchClass pitch;       ///< Pitch class
  int octave;             ///< Octave
  NoteDuration duration;  ///< Notated duration class
  float start;            ///< Start time in seconds
};

/// @brief Sheet music handed to a renderer; measure layout is left to the renderer.
struct SheetMusic {
  std::vector<SheetMusicNote> notes;  ///< Notes ordered by start time
  TimeSignature time_signature;       ///< Time signature (4/4 by default)
  Clef clef = Clef::Treble;           ///< Clef
  float tempo_bpm = tempo_constants::kDefaultTempo;  ///< Tempo in BPM
};

/// @brief Configuration for sheet-music generation.
struct SheetMusicConfig {
  TimeSignature time_signature;                      ///< Time signature
  Clef clef = Clef::Treble;                          ///< Clef
  float tempo_bpm = tempo_constants::kDefaultTempo;  ///< Tempo in BPM
};

/// @brief Maps a duration to a notation class (inclusive lower bounds).
/// @param duration_ms Duration in milliseconds
/// @return >=1000 whole, >=500 half, >=250 quarter, >=125 eighth, else sixteenth
NoteDuration quantize_duration(float duration_ms);

/// @brief Packages notes as sheet music.
/// @param notes Consolidated notes ordered by start time
/// @param config Notation settings
/// @return Sheet music with one entry per note
SheetMusic generate_sheet_music(const std::vector<ConsolidatedNote>& notes,
                                const SheetMusicConfig& config = SheetMusicConfig());

}  // namespace notescribe
