#pragma once

/// @file notescribe_c.h
/// @brief C API for notescribe.
/// @details Provides a C-compatible interface to the transcription pipeline.

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Error codes
typedef enum {
  NOTESCRIBE_OK = 0,
  NOTESCRIBE_ERROR_FILE_NOT_FOUND = 1,
  NOTESCRIBE_ERROR_INVALID_FORMAT = 2,
  NOTESCRIBE_ERROR_DECODE_FAILED = 3,
  NOTESCRIBE_ERROR_INVALID_PARAMETER = 4,
  NOTESCRIBE_ERROR_OUT_OF_MEMORY = 5,
  NOTESCRIBE_ERROR_INVALID_INPUT = 6,
  NOTESCRIBE_ERROR_UNKNOWN = 99
} NotescribeError;

// Pitch class enum
typedef enum {
  NOTESCRIBE_PITCH_C = 0,
  NOTESCRIBE_PITCH_CS = 1,
  NOTESCRIBE_PITCH_D = 2,
  NOTESCRIBE_PITCH_DS = 3,
  NOTESCRIBE_PITCH_E = 4,
  NOTESCRIBE_PITCH_F = 5,
  NOTESCRIBE_PITCH_FS = 6,
  NOTESCRIBE_PITCH_G = 7,
  NOTESCRIBE_PITCH_GS = 8,
  NOTESCRIBE_PITCH_A = 9,
  NOTESCRIBE_PITCH_AS = 10,
  NOTESCRIBE_PITCH_B = 11
} NotescribePitchClass;

// Mode enum
typedef enum { NOTESCRIBE_MODE_MAJOR = 0, NOTESCRIBE_MODE_MINOR = 1 } NotescribeMode;

// Chord type enum
typedef enum {
  NOTESCRIBE_CHORD_MAJOR = 0,
  NOTESCRIBE_CHORD_MINOR = 1,
  NOTESCRIBE_CHORD_DIMINISHED = 2,
  NOTESCRIBE_CHORD_AUGMENTED = 3,
  NOTESCRIBE_CHORD_MAJOR7 = 4,
  NOTESCRIBE_CHORD_DOMINANT7 = 5,
  NOTESCRIBE_CHORD_MINOR7 = 6,
  NOTESCRIBE_CHORD_SUS4 = 7,
  NOTESCRIBE_CHORD_SUS2 = 8
} NotescribeChordType;

// Note duration enum
typedef enum {
  NOTESCRIBE_DURATION_WHOLE = 0,
  NOTESCRIBE_DURATION_HALF = 1,
  NOTESCRIBE_DURATION_QUARTER = 2,
  NOTESCRIBE_DURATION_EIGHTH = 3,
  NOTESCRIBE_DURATION_SIXTEENTH = 4
} NotescribeDuration;

// Clef enum
typedef enum { NOTESCRIBE_CLEF_TREBLE = 0, NOTESCRIBE_CLEF_BASS = 1 } NotescribeClef;

// Opaque result
typedef struct NotescribeResult NotescribeResult;

// Pipeline configuration (see notescribe_default_config)
typedef struct {
  int segment_length;
  float min_frequency;
  float max_frequency;
  float gap_tolerance;
  float chord_window;
  int min_chord_tones;
  float min_chord_match_ratio;
} NotescribeConfig;

// Consolidated note
typedef struct {
  NotescribePitchClass pitch;
  int octave;
  float start;
  float duration;
} NotescribeNote;

// Chord; notes points into storage owned by the result
typedef struct {
  NotescribePitchClass root;
  NotescribeChordType type;
  const NotescribePitchClass* notes;
  size_t note_count;
  float start;
  float end;
} NotescribeChord;

// Sheet-music note
typedef struct {
  NotescribePitchClass pitch;
  int octave;
  NotescribeDuration duration;
  float start;
} NotescribeSheetNote;

// Sheet-music header
typedef struct {
  int numerator;
  int denominator;
  NotescribeClef clef;
  float tempo;
} NotescribeSheetInfo;

// Unconsolidated pitch sample
typedef struct {
  float frequency;
  NotescribePitchClass pitch;
  int octave;
  int cents;
  float start;
  float end;
} NotescribePitchSample;

// Key structure
typedef struct {
  NotescribePitchClass root;
  NotescribeMode mode;
  float confidence;
} NotescribeKey;

// Configuration
NotescribeConfig notescribe_default_config(void);

// Transcription (config may be NULL for defaults)
NotescribeError notescribe_transcribe(const float* const* channels, size_t n_channels,
                                      size_t length, int sample_rate,
                                      const NotescribeConfig* config, NotescribeResult** out);

// Result accessors
size_t notescribe_result_note_count(const NotescribeResult* result);
NotescribeError notescribe_result_note(const NotescribeResult* result, size_t index,
                                       NotescribeNote* out);
size_t notescribe_result_chord_count(const NotescribeResult* result);
NotescribeError notescribe_result_chord(const NotescribeResult* result, size_t index,
                                        NotescribeChord* out);
size_t notescribe_result_sheet_note_count(const NotescribeResult* result);
NotescribeError notescribe_result_sheet_note(const NotescribeResult* result, size_t index,
                                             NotescribeSheetNote* out);
NotescribeError notescribe_result_sheet_info(const NotescribeResult* result,
                                             NotescribeSheetInfo* out);
size_t notescribe_result_pitch_sample_count(const NotescribeResult* result);
NotescribeError notescribe_result_pitch_sample(const NotescribeResult* result, size_t index,
                                               NotescribePitchSample* out);
NotescribeError notescribe_result_key(const NotescribeResult* result, NotescribeKey* out);
float notescribe_result_tempo(const NotescribeResult* result);

// Serialization (free the string with notescribe_free_string)
NotescribeError notescribe_result_to_json(const NotescribeResult* result, char** out_json);

// Memory management
void notescribe_free_result(NotescribeResult* result);
void notescribe_free_string(char* str);

// Error handling
const char* notescribe_error_message(NotescribeError error);

// Version
const char* notescribe_version(void);

#ifdef __cplusplus
}
#endif
