#include "analysis/transcriber.h"

#include <utility>

#include "core/downmix.h"
#include "feature/pitch.h"
#include "util/exception.h"

namespace notescribe {

std::string SimpleNote::display_name() const {
  std::string name(pitch_class_name(pitch));
  if (name.size() == 2 && name[1] == '#') {
    name = name.substr(0, 1) + "♯";
  }
  return name;
}

void validate_config(const TranscriberConfig& config) {
  NOTESCRIBE_CHECK_MSG(config.fallback_sample_rate > 0, ErrorCode::InvalidParameter,
                       "fallback_sample_rate must be positive");
  NOTESCRIBE_CHECK_MSG(config.segment_length >= 2, ErrorCode::InvalidParameter,
                       "segment_length must be at least 2");
  NOTESCRIBE_CHECK_MSG(config.min_frequency > 0.0f && config.max_frequency > config.min_frequency,
                       ErrorCode::InvalidParameter,
                       "Frequency range must satisfy 0 < min_frequency < max_frequency");
  NOTESCRIBE_CHECK_MSG(config.gap_tolerance >= 0.0f, ErrorCode::InvalidParameter,
                       "gap_tolerance must not be negative");
  NOTESCRIBE_CHECK_MSG(config.chord_window > 0.0f, ErrorCode::InvalidParameter,
                       "chord_window must be positive");
  NOTESCRIBE_CHECK_MSG(config.min_chord_tones >= 1, ErrorCode::InvalidParameter,
                       "min_chord_tones must be at least 1");
  NOTESCRIBE_CHECK_MSG(config.min_chord_match_ratio > 0.0f && config.min_chord_match_ratio <= 1.0f,
                       ErrorCode::InvalidParameter, "min_chord_match_ratio must be in (0, 1]");
  NOTESCRIBE_CHECK_MSG(config.time_signature.numerator > 0 && config.time_signature.denominator > 0,
                       ErrorCode::InvalidParameter, "Time signature must be positive");
  NOTESCRIBE_CHECK_MSG(config.tempo_min > 0.0f && config.tempo_max >= 2.0f * config.tempo_min,
                       ErrorCode::InvalidParameter,
                       "tempo range must satisfy 0 < tempo_min and 2 * tempo_min <= tempo_max");
  NOTESCRIBE_CHECK_MSG(config.default_tempo > 0.0f, ErrorCode::InvalidParameter,
                       "default_tempo must be positive");
}

Transcriber::Transcriber(const TranscriberConfig& config)
    : config_(config), progress_callback_(nullptr) {
  validate_config(config_);
}

void Transcriber::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void Transcriber::report_progress(float progress, const char* stage) const {
  if (progress_callback_) {
    progress_callback_(progress, stage);
  }
}

TranscriptionResult Transcriber::transcribe(const SampleBuffer& buffer) const {
  buffer.validate();

  TranscriptionResult result;
  result.detected_tempo = config_.default_tempo;
  result.sheet_music.time_signature = config_.time_signature;
  result.sheet_music.clef = config_.clef;
  result.sheet_music.tempo_bpm = config_.default_tempo;

  report_progress(0.0f, "downmix");
  std::vector<float> mono = downmix(buffer);

  report_progress(0.1f, "pitch");
  PitchConfig pitch_config;
  pitch_config.segment_length = config_.segment_length;
  pitch_config.fmin = config_.min_frequency;
  pitch_config.fmax = config_.max_frequency;
  PitchTrack track = track_pitch(mono, buffer.sample_rate(), pitch_config);

  report_progress(0.6f, "notes");
  result.raw_pitch_data = pitch_samples_from_track(track);
  std::vector<ConsolidatedNote> notes =
      consolidate_notes(result.raw_pitch_data, config_.gap_tolerance);

  result.simple_notes.reserve(notes.size());
  for (const auto& note : notes) {
    result.simple_notes.push_back(
        SimpleNote{note.note.pitch_class, note.note.octave, note.start, note.duration()});
  }

  report_progress(0.7f, "chords");
  ChordConfig chord_config;
  chord_config.time_window = config_.chord_window;
  chord_config.min_matching_tones = config_.min_chord_tones;
  chord_config.min_match_ratio = config_.min_chord_match_ratio;
  result.complex_chords = identify_chords(notes, chord_config);

  report_progress(0.8f, "key");
  result.detected_key = detect_key(notes);

  report_progress(0.85f, "tempo");
  TempoConfig tempo_config;
  tempo_config.tempo_min = config_.tempo_min;
  tempo_config.tempo_max = config_.tempo_max;
  tempo_config.default_tempo = config_.default_tempo;
  result.detected_tempo = estimate_tempo(notes, tempo_config);

  report_progress(0.9f, "sheet");
  SheetMusicConfig sheet_config;
  sheet_config.time_signature = config_.time_signature;
  sheet_config.clef = config_.clef;
  sheet_config.tempo_bpm = result.detected_tempo;
  result.sheet_music = generate_sheet_music(notes, sheet_config);

  report_progress(1.0f, "complete");
  return result;
}

TranscriptionResult transcribe(const SampleBuffer& buffer, const TranscriberConfig& config) {
  Transcriber transcriber(config);
  return transcriber.transcribe(buffer);
}

}  // namespace notescribe
