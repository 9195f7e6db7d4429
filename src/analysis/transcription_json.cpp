#include "analysis/transcription_json.h"

#include "analysis/chord_templates.h"

namespace notescribe {

void write_json(JsonWriter& json, const PitchSample& sample) {
  json.begin_object();
  json.kv("frequency", sample.frequency);
  json.key("note").begin_object();
  json.kv("name", sample.note.name());
  json.kv("octave", sample.note.octave);
  json.kv("frequency", sample.note.frequency);
  json.kv("cents", sample.note.cents);
  json.end_object();
  json.kv("startTime", sample.start);
  json.kv("endTime", sample.end);
  json.end_object();
}

void write_json(JsonWriter& json, const SimpleNote& note) {
  json.begin_object();
  json.kv("note", note.display_name());
  json.kv("octave", note.octave);
  json.kv("duration", note.duration);
  json.kv("startTime", note.start);
  json.end_object();
}

void write_json(JsonWriter& json, const Chord& chord) {
  json.begin_object();
  json.kv("root", pitch_class_name(chord.root));
  json.kv("type", chord_type_name(chord.type));
  json.key("notes").begin_array();
  for (PitchClass pc : chord.notes) {
    json.value(pitch_class_name(pc));
  }
  json.end_array();
  json.kv("startTime", chord.start);
  json.kv("endTime", chord.end);
  json.kv("duration", chord.duration());
  json.end_object();
}

void write_json(JsonWriter& json, const SheetMusic& sheet) {
  json.begin_object();
  json.key("notes").begin_array();
  for (const auto& note : sheet.notes) {
    json.begin_object();
    json.kv("pitch", pitch_class_name(note.pitch));
    json.kv("octave", note.octave);
    json.kv("duration", note_duration_name(note.duration));
    json.kv("startTime", note.start);
    json.end_object();
  }
  json.end_array();
  json.key("timeSignature").begin_object();
  json.kv("numerator", sheet.time_signature.numerator);
  json.kv("denominator", sheet.time_signature.denominator);
  json.end_object();
  json.kv("clef", clef_name(sheet.clef));
  json.kv("tempo", sheet.tempo_bpm);
  json.end_object();
}

std::string to_json(const TranscriptionResult& result) {
  JsonWriter json;
  json.begin_object();

  json.key("simpleNotes").begin_array();
  for (const auto& note : result.simple_notes) write_json(json, note);
  json.end_array();

  json.key("complexChords").begin_array();
  for (const auto& chord : result.complex_chords) write_json(json, chord);
  json.end_array();

  json.key("sheetMusic");
  write_json(json, result.sheet_music);

  json.key("rawPitchData").begin_array();
  for (const auto& sample : result.raw_pitch_data) write_json(json, sample);
  json.end_array();

  json.kv("detectedKey", result.detected_key.to_short_string());
  json.kv("detectedTempo", result.detected_tempo);

  json.end_object();
  return json.str();
}

}  // namespace notescribe
