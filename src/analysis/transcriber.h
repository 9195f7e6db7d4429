#pragma once

/// @file transcriber.h
/// @brief Audio-to-notation transcription facade.

#include <functional>
#include <string>
#include <vector>

#include "analysis/chord_analyzer.h"
#include "analysis/key_analyzer.h"
#include "analysis/note_consolidator.h"
#include "analysis/note_mapper.h"
#include "analysis/sheet_music.h"
#include "analysis/tempo_estimator.h"
#include "core/sample_buffer.h"
#include "util/types.h"

namespace notescribe {

/// @brief Progress callback type for transcription progress reporting.
/// @param progress Progress value (0.0 to 1.0)
/// @param stage Current pipeline stage name
using ProgressCallback = std::function<void(float progress, const char* stage)>;

/// @brief Default transcription settings.
namespace transcriber_constants {
/// @brief Sample rate assumed for raw PCM input that carries none.
constexpr int kFallbackSampleRate = 44100;
}  // namespace transcriber_constants

/// @brief Configuration for the transcription pipeline.
struct TranscriberConfig {
  int fallback_sample_rate = transcriber_constants::kFallbackSampleRate;  ///< Raw PCM rate
  int segment_length = pitch_constants::kSegmentLength;  ///< Analysis window in samples
  float min_frequency = pitch_constants::kMinFrequency;  ///< Lowest detectable pitch in Hz
  float max_frequency = pitch_constants::kMaxFrequency;  ///< Highest detectable pitch in Hz
  float gap_tolerance = kDefaultGapTolerance;            ///< Note merge gap in seconds
  float chord_window = chord_constants::kTimeWindowSec;  ///< Chord bucket width in seconds
  int min_chord_tones = chord_constants::kMinMatchingTones;    ///< Required template tones
  float min_chord_match_ratio = chord_constants::kMinMatchRatio;  ///< Required template fraction
  TimeSignature time_signature;                          ///< Notated time signature
  Clef clef = Clef::Treble;                              ///< Notated clef
  float tempo_min = tempo_constants::kMinTempo;          ///< Lower tempo bound in BPM
  float tempo_max = tempo_constants::kMaxTempo;          ///< Upper tempo bound in BPM
  float default_tempo = tempo_constants::kDefaultTempo;  ///< Tempo without an estimate
};

/// @brief Display projection of a consolidated note.
struct SimpleNote {
  PitchClass pitch;  ///< Pitch class
  int octave;        ///< Octave
  float start;       ///< Start time in seconds
  float duration;    ///< Duration in seconds

  /// @brief Returns the display name with a Unicode sharp (e.g., "C♯").
  std::string display_name() const;
};

/// @brief Complete transcription result.
struct TranscriptionResult {
  std::vector<SimpleNote> simple_notes;        ///< One entry per consolidated note
  std::vector<Chord> complex_chords;           ///< Identified chords
  SheetMusic sheet_music;                      ///< Quantized sheet music
  std::vector<PitchSample> raw_pitch_data;     ///< Unconsolidated per-segment samples
  Key detected_key{PitchClass::C, Mode::Major, 0.0f};  ///< Estimated key
  float detected_tempo = tempo_constants::kDefaultTempo;  ///< Estimated tempo in BPM
};

/// @brief Runs the transcription pipeline over one sample buffer.
/// @details Downmix, segment, track pitch, map notes, consolidate, identify chords,
/// quantize and estimate key and tempo. Silent or empty buffers give an empty result.
class Transcriber {
 public:
  /// @brief Constructs a transcriber.
  /// @param config Pipeline configuration
  explicit Transcriber(const TranscriberConfig& config = TranscriberConfig());

  /// @brief Sets progress callback for transcription progress reporting.
  /// @param callback Callback function receiving (progress, stage) parameters
  void set_progress_callback(ProgressCallback callback);

  /// @brief Transcribes a buffer.
  /// @param buffer Decoded audio
  /// @return Transcription result
  /// @throws NotescribeException(InvalidInput) for a malformed buffer
  /// @throws NotescribeException(InvalidParameter) for an invalid configuration
  TranscriptionResult transcribe(const SampleBuffer& buffer) const;

  /// @brief Returns the configuration.
  const TranscriberConfig& config() const { return config_; }

 private:
  /// @brief Reports progress to callback if set.
  void report_progress(float progress, const char* stage) const;

  TranscriberConfig config_;
  ProgressCallback progress_callback_;
};

/// @brief Checks a transcriber configuration.
/// @throws NotescribeException(InvalidParameter) describing the first invalid field
void validate_config(const TranscriberConfig& config);

/// @brief Quick transcription function.
/// @param buffer Decoded audio
/// @param config Pipeline configuration
/// @return Transcription result
TranscriptionResult transcribe(const SampleBuffer& buffer,
                               const TranscriberConfig& config = TranscriberConfig());

}  // namespace notescribe
