#pragma once

/// @file transcription_json.h
/// @brief JSON interchange document for transcription results.

#include <string>

#include "analysis/transcriber.h"
#include "util/json_writer.h"

namespace notescribe {

/// @brief Writes a pitch sample as {frequency, note{...}, startTime, endTime}.
void write_json(JsonWriter& json, const PitchSample& sample);

/// @brief Writes a simple note as {note, octave, duration, startTime}.
void write_json(JsonWriter& json, const SimpleNote& note);

/// @brief Writes a chord as {root, type, notes, startTime, endTime, duration}.
void write_json(JsonWriter& json, const Chord& chord);

/// @brief Writes sheet music as {notes, timeSignature, clef, tempo}.
void write_json(JsonWriter& json, const SheetMusic& sheet);

/// @brief Serializes a transcription result.
/// @details Top-level keys: simpleNotes, complexChords, sheetMusic, rawPitchData,
/// detectedKey (short key name, e.g. "Am") and detectedTempo.
/// @param result Transcription result
/// @return JSON document
std::string to_json(const TranscriptionResult& result);

}  // namespace notescribe
