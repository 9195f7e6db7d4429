/// @file notescribe_c.cpp
/// @brief Implementation of C API.

#include "notescribe_c.h"

#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <vector>

#include "analysis/transcriber.h"
#include "analysis/transcription_json.h"
#include "notescribe.h"
#include "util/exception.h"

using namespace notescribe;

// Internal wrapper structure
struct NotescribeResult {
  TranscriptionResult result;
  std::vector<std::vector<NotescribePitchClass>> chord_notes;
};

namespace {

/// @brief Maximum buffer size per channel (~500M samples)
constexpr size_t kMaxBufferSize = 500000000;

NotescribeError to_c_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return NOTESCRIBE_OK;
    case ErrorCode::FileNotFound:
      return NOTESCRIBE_ERROR_FILE_NOT_FOUND;
    case ErrorCode::InvalidFormat:
      return NOTESCRIBE_ERROR_INVALID_FORMAT;
    case ErrorCode::DecodeFailed:
      return NOTESCRIBE_ERROR_DECODE_FAILED;
    case ErrorCode::InvalidParameter:
      return NOTESCRIBE_ERROR_INVALID_PARAMETER;
    case ErrorCode::InvalidInput:
      return NOTESCRIBE_ERROR_INVALID_INPUT;
    case ErrorCode::OutOfMemory:
      return NOTESCRIBE_ERROR_OUT_OF_MEMORY;
  }
  return NOTESCRIBE_ERROR_UNKNOWN;
}

TranscriberConfig to_transcriber_config(const NotescribeConfig& c) {
  TranscriberConfig config;
  config.segment_length = c.segment_length;
  config.min_frequency = c.min_frequency;
  config.max_frequency = c.max_frequency;
  config.gap_tolerance = c.gap_tolerance;
  config.chord_window = c.chord_window;
  config.min_chord_tones = c.min_chord_tones;
  config.min_chord_match_ratio = c.min_chord_match_ratio;
  return config;
}

NotescribePitchClass to_c(PitchClass pc) { return static_cast<NotescribePitchClass>(pc); }

}  // namespace

NotescribeConfig notescribe_default_config(void) {
  TranscriberConfig defaults;
  NotescribeConfig config;
  config.segment_length = defaults.segment_length;
  config.min_frequency = defaults.min_frequency;
  config.max_frequency = defaults.max_frequency;
  config.gap_tolerance = defaults.gap_tolerance;
  config.chord_window = defaults.chord_window;
  config.min_chord_tones = defaults.min_chord_tones;
  config.min_chord_match_ratio = defaults.min_chord_match_ratio;
  return config;
}

NotescribeError notescribe_transcribe(const float* const* channels, size_t n_channels,
                                      size_t length, int sample_rate,
                                      const NotescribeConfig* config, NotescribeResult** out) {
  if (out == nullptr) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  *out = nullptr;
  if (n_channels > 0 && channels == nullptr) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  if (length > kMaxBufferSize) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  for (size_t ch = 0; ch < n_channels; ++ch) {
    if (channels[ch] == nullptr && length > 0) {
      return NOTESCRIBE_ERROR_INVALID_PARAMETER;
    }
  }

  try {
    std::vector<std::vector<float>> planar(n_channels);
    for (size_t ch = 0; ch < n_channels; ++ch) {
      if (length > 0) {
        planar[ch].assign(channels[ch], channels[ch] + length);
      }
    }
    SampleBuffer buffer = SampleBuffer::from_channels(std::move(planar), sample_rate);

    NotescribeConfig c = config != nullptr ? *config : notescribe_default_config();
    TranscriptionResult result = transcribe(buffer, to_transcriber_config(c));

    std::unique_ptr<NotescribeResult> wrapper(new NotescribeResult{std::move(result), {}});
    wrapper->chord_notes.reserve(wrapper->result.complex_chords.size());
    for (const auto& chord : wrapper->result.complex_chords) {
      std::vector<NotescribePitchClass> notes;
      notes.reserve(chord.notes.size());
      for (PitchClass pc : chord.notes) notes.push_back(to_c(pc));
      wrapper->chord_notes.push_back(std::move(notes));
    }
    *out = wrapper.release();
    return NOTESCRIBE_OK;
  } catch (const NotescribeException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTESCRIBE_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTESCRIBE_ERROR_UNKNOWN;
  }
}

size_t notescribe_result_note_count(const NotescribeResult* result) {
  return result != nullptr ? result->result.simple_notes.size() : 0;
}

NotescribeError notescribe_result_note(const NotescribeResult* result, size_t index,
                                       NotescribeNote* out) {
  if (result == nullptr || out == nullptr || index >= result->result.simple_notes.size()) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const SimpleNote& note = result->result.simple_notes[index];
  out->pitch = to_c(note.pitch);
  out->octave = note.octave;
  out->start = note.start;
  out->duration = note.duration;
  return NOTESCRIBE_OK;
}

size_t notescribe_result_chord_count(const NotescribeResult* result) {
  return result != nullptr ? result->result.complex_chords.size() : 0;
}

NotescribeError notescribe_result_chord(const NotescribeResult* result, size_t index,
                                        NotescribeChord* out) {
  if (result == nullptr || out == nullptr || index >= result->result.complex_chords.size()) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const Chord& chord = result->result.complex_chords[index];
  const auto& notes = result->chord_notes[index];
  out->root = to_c(chord.root);
  out->type = static_cast<NotescribeChordType>(chord.type);
  out->notes = notes.empty() ? nullptr : notes.data();
  out->note_count = notes.size();
  out->start = chord.start;
  out->end = chord.end;
  return NOTESCRIBE_OK;
}

size_t notescribe_result_sheet_note_count(const NotescribeResult* result) {
  return result != nullptr ? result->result.sheet_music.notes.size() : 0;
}

NotescribeError notescribe_result_sheet_note(const NotescribeResult* result, size_t index,
                                             NotescribeSheetNote* out) {
  if (result == nullptr || out == nullptr || index >= result->result.sheet_music.notes.size()) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const SheetMusicNote& note = result->result.sheet_music.notes[index];
  out->pitch = to_c(note.pitch);
  out->octave = note.octave;
  out->duration = static_cast<NotescribeDuration>(note.duration);
  out->start = note.start;
  return NOTESCRIBE_OK;
}

NotescribeError notescribe_result_sheet_info(const NotescribeResult* result,
                                             NotescribeSheetInfo* out) {
  if (result == nullptr || out == nullptr) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const SheetMusic& sheet = result->result.sheet_music;
  out->numerator = sheet.time_signature.numerator;
  out->denominator = sheet.time_signature.denominator;
  out->clef = static_cast<NotescribeClef>(sheet.clef);
  out->tempo = sheet.tempo_bpm;
  return NOTESCRIBE_OK;
}

size_t notescribe_result_pitch_sample_count(const NotescribeResult* result) {
  return result != nullptr ? result->result.raw_pitch_data.size() : 0;
}

NotescribeError notescribe_result_pitch_sample(const NotescribeResult* result, size_t index,
                                               NotescribePitchSample* out) {
  if (result == nullptr || out == nullptr || index >= result->result.raw_pitch_data.size()) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const PitchSample& sample = result->result.raw_pitch_data[index];
  out->frequency = sample.frequency;
  out->pitch = to_c(sample.note.pitch_class);
  out->octave = sample.note.octave;
  out->cents = sample.note.cents;
  out->start = sample.start;
  out->end = sample.end;
  return NOTESCRIBE_OK;
}

NotescribeError notescribe_result_key(const NotescribeResult* result, NotescribeKey* out) {
  if (result == nullptr || out == nullptr) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }
  const Key& key = result->result.detected_key;
  out->root = to_c(key.root);
  out->mode = static_cast<NotescribeMode>(key.mode);
  out->confidence = key.confidence;
  return NOTESCRIBE_OK;
}

float notescribe_result_tempo(const NotescribeResult* result) {
  return result != nullptr ? result->result.detected_tempo : 0.0f;
}

NotescribeError notescribe_result_to_json(const NotescribeResult* result, char** out_json) {
  if (result == nullptr || out_json == nullptr) {
    return NOTESCRIBE_ERROR_INVALID_PARAMETER;
  }

  try {
    std::string json = to_json(result->result);
    char* buffer = new char[json.size() + 1];
    std::memcpy(buffer, json.c_str(), json.size() + 1);
    *out_json = buffer;
    return NOTESCRIBE_OK;
  } catch (const std::bad_alloc&) {
    return NOTESCRIBE_ERROR_OUT_OF_MEMORY;
  }
}

void notescribe_free_result(NotescribeResult* result) { delete result; }

void notescribe_free_string(char* str) { delete[] str; }

const char* notescribe_error_message(NotescribeError error) {
  switch (error) {
    case NOTESCRIBE_OK:
      return "OK";
    case NOTESCRIBE_ERROR_FILE_NOT_FOUND:
      return "File not found";
    case NOTESCRIBE_ERROR_INVALID_FORMAT:
      return "Invalid format";
    case NOTESCRIBE_ERROR_DECODE_FAILED:
      return "Decode failed";
    case NOTESCRIBE_ERROR_INVALID_PARAMETER:
      return "Invalid parameter";
    case NOTESCRIBE_ERROR_OUT_OF_MEMORY:
      return "Out of memory";
    case NOTESCRIBE_ERROR_INVALID_INPUT:
      return "Invalid input";
    case NOTESCRIBE_ERROR_UNKNOWN:
      return "Unknown error";
  }
  return "Unknown error";
}

const char* notescribe_version(void) { return NOTESCRIBE_VERSION_STRING; }
