#pragma once

/// @file types.h
/// @brief Common type definitions for notescribe.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace notescribe {

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  InvalidInput,
  OutOfMemory,
};

/// @brief Pitch class (0-11, C=0).
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Musical mode.
enum class Mode {
  Major,
  Minor,
};

/// @brief Chord types recognized by the interval matcher.
/// @details Declaration order is the matching order of the chord table.
enum class ChordType {
  Major,
  Minor,
  Diminished,
  Augmented,
  Major7,
  Dominant7,
  Minor7,
  Sus4,
  Sus2,
};

/// @brief Number of chord types in ChordType.
constexpr int kNumChordTypes = 9;

/// @brief Notated duration classes.
enum class NoteDuration {
  Whole,
  Half,
  Quarter,
  Eighth,
  Sixteenth,
};

/// @brief Staff clef.
enum class Clef {
  Treble,
  Bass,
};

/// @brief Returns the name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  return names[static_cast<int>(pc)];
}

/// @brief Returns the name of a mode.
/// @param m Mode
/// @return "major" or "minor"
inline const char* mode_name(Mode m) { return m == Mode::Major ? "major" : "minor"; }

/// @brief Returns the name of a duration class ("whole", "half", ...).
inline const char* note_duration_name(NoteDuration d) {
  switch (d) {
    case NoteDuration::Whole:
      return "whole";
    case NoteDuration::Half:
      return "half";
    case NoteDuration::Quarter:
      return "quarter";
    case NoteDuration::Eighth:
      return "eighth";
    case NoteDuration::Sixteenth:
      return "sixteenth";
  }
  return "quarter";
}

/// @brief Returns the name of a clef ("treble" or "bass").
inline const char* clef_name(Clef c) { return c == Clef::Treble ? "treble" : "bass"; }

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::InvalidInput:
      return "Invalid input";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
  }
  return "Unknown error";
}

}  // namespace notescribe
