#pragma once

/// @file note_mapper.h
/// @brief Frequency to note conversion and pitch samples.

#include <string>
#include <vector>

#include "feature/pitch.h"
#include "util/types.h"

namespace notescribe {

/// @brief Nearest equal-tempered note of a frequency (A4 = 440 Hz).
struct Note {
  PitchClass pitch_class;  ///< Pitch class of the nearest note
  int octave;              ///< Scientific pitch octave (C4 = middle C)
  float frequency;         ///< Measured frequency in Hz
  int cents;               ///< Deviation from the nearest note in cents [-50, 50]

  /// @brief Returns the pitch-class name (e.g., "C#").
  const char* name() const { return pitch_class_name(pitch_class); }

  /// @brief Returns name with octave (e.g., "C#4").
  std::string to_string() const;

  /// @brief Returns true if pitch class and octave match.
  bool same_pitch(const Note& other) const {
    return pitch_class == other.pitch_class && octave == other.octave;
  }
};

/// @brief Pitch detected in one segment.
struct PitchSample {
  float frequency;  ///< Detected frequency in Hz
  Note note;        ///< Nearest note
  float start;      ///< Start time in seconds
  float end;        ///< End time in seconds

  /// @brief Returns duration in seconds.
  float duration() const { return end - start; }
};

/// @brief A run of same-note pitch samples merged into one note event.
using ConsolidatedNote = PitchSample;

/// @brief Signed semitone distance from A4, rounded half up.
/// @param frequency Frequency in Hz (> 0)
int semitones_from_a4(float frequency);

/// @brief Maps a frequency to its nearest note.
/// @details Octaves change at C (scientific pitch notation), so A, A# and B share
/// the octave of the C below them: 440 Hz is A4 and 523.25 Hz is C5.
/// @param frequency Frequency in Hz (> 0)
/// @return Note with pitch class, octave and cents deviation
/// @throws NotescribeException(InvalidParameter) if frequency is not positive and finite
Note frequency_to_note(float frequency);

/// @brief Converts the voiced segments of a pitch track into pitch samples.
/// @details Segments without a pitch produce nothing, so the result is ordered by
/// segment index but may skip indices.
/// @param track Pitch track
/// @return Pitch samples ordered by start time
std::vector<PitchSample> pitch_samples_from_track(const PitchTrack& track);

}  // namespace notescribe
