#include "analysis/chord_analyzer.h"

#include <algorithm>
#include <cmath>
#include <map>

#include "util/exception.h"

namespace notescribe {

ChordMatch match_chord(const std::vector<PitchClass>& pitch_classes, const ChordConfig& config) {
  ChordMatch result{false, PitchClass::C, ChordType::Major};
  if (pitch_classes.size() < 2) {
    return result;
  }

  for (PitchClass root : pitch_classes) {
    std::vector<int> intervals = intervals_from_root(pitch_classes, root);

    IntervalMatch best{0, 0};
    for (const ChordTemplate& tmpl : kChordTemplates) {
      IntervalMatch match = match_intervals(intervals, tmpl);
      if (match.matched < config.min_matching_tones || match.ratio() < config.min_match_ratio) {
        continue;
      }
      // Strict comparisons keep the earlier table entry on ties.
      bool better = !result.found || match.matched > best.matched ||
                    (match.matched == best.matched && match.ratio() > best.ratio());
      if (better) {
        result.found = true;
        result.root = root;
        result.type = tmpl.type;
        best = match;
      }
    }

    if (result.found) {
      return result;
    }
  }

  return result;
}

ChordAnalyzer::ChordAnalyzer(const std::vector<ConsolidatedNote>& notes, const ChordConfig& config)
    : config_(config) {
  NOTESCRIBE_CHECK_MSG(config.time_window > 0.0f, ErrorCode::InvalidParameter,
                       "Chord time window must be positive");
  NOTESCRIBE_CHECK_MSG(config.min_matching_tones > 0, ErrorCode::InvalidParameter,
                       "min_matching_tones must be positive");
  NOTESCRIBE_CHECK_MSG(config.min_match_ratio > 0.0f && config.min_match_ratio <= 1.0f,
                       ErrorCode::InvalidParameter, "min_match_ratio must be in (0, 1]");

  analyze(notes);
}

void ChordAnalyzer::analyze(const std::vector<ConsolidatedNote>& notes) {
  chords_.clear();

  // Ordered map: buckets are visited by ascending time.
  std::map<long long, std::vector<const ConsolidatedNote*>> buckets;
  for (const auto& note : notes) {
    auto key = static_cast<long long>(std::floor(note.start / config_.time_window));
    buckets[key].push_back(&note);
  }

  for (const auto& entry : buckets) {
    const std::vector<const ConsolidatedNote*>& bucket = entry.second;
    if (static_cast<int>(bucket.size()) < chord_constants::kMinNotesPerBucket) {
      continue;
    }

    std::vector<PitchClass> pitch_classes;
    float start = bucket.front()->start;
    float end = bucket.front()->end;
    for (const ConsolidatedNote* note : bucket) {
      PitchClass pc = note->note.pitch_class;
      if (std::find(pitch_classes.begin(), pitch_classes.end(), pc) == pitch_classes.end()) {
        pitch_classes.push_back(pc);
      }
      start = std::min(start, note->start);
      end = std::max(end, note->end);
    }

    ChordMatch match = match_chord(pitch_classes, config_);
    if (!match.found) {
      continue;
    }

    Chord chord;
    chord.root = match.root;
    chord.type = match.type;
    chord.notes = std::move(pitch_classes);
    chord.start = start;
    chord.end = end;
    chords_.push_back(std::move(chord));
  }
}

std::vector<Chord> identify_chords(const std::vector<ConsolidatedNote>& notes,
                                   const ChordConfig& config) {
  ChordAnalyzer analyzer(notes, config);
  return analyzer.chords();
}

}  // namespace notescribe
