#include "analysis/sheet_music.h"

#include "util/exception.h"

namespace notescribe {

NoteDuration quantize_duration(float duration_ms) {
  if (duration_ms >= sheet_constants::kWholeMs) return NoteDuration::Whole;
  if (duration_ms >= sheet_constants::kHalfMs) return NoteDuration::Half;
  if (duration_ms >= sheet_constants::kQuarterMs) return NoteDuration::Quarter;
  if (duration_ms >= sheet_constants::kEighthMs) return NoteDuration::Eighth;
  return NoteDuration::Sixteenth;
}

SheetMusic generate_sheet_music(const std::vector<ConsolidatedNote>& notes,
                                const SheetMusicConfig& config) {
  NOTESCRIBE_CHECK_MSG(config.time_signature.numerator > 0 && config.time_signature.denominator > 0,
                       ErrorCode::InvalidParameter, "Time signature must be positive");

  SheetMusic sheet;
  sheet.time_signature = config.time_signature;
  sheet.clef = config.clef;
  sheet.tempo_bpm = config.tempo_bpm;
  sheet.notes.reserve(notes.size());

  for (const auto& note : notes) {
    SheetMusicNote entry;
    entry.pitch = note.note.pitch_class;
    entry.octave = note.note.octave;
    entry.duration = quantize_duration(note.duration() * 1000.0f);
    entry.start = note.start;
    sheet.notes.push_back(entry);
  }

  return sheet;
}

}  // namespace notescribe
