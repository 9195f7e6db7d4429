#include "analysis/chord_templates.h"

#include <algorithm>

namespace notescribe {

int pitch_class_interval(PitchClass root, PitchClass target) {
  int interval = (static_cast<int>(target) - static_cast<int>(root)) % 12;
  if (interval < 0) interval += 12;
  return interval;
}

std::vector<int> intervals_from_root(const std::vector<PitchClass>& pitch_classes,
                                     PitchClass root) {
  std::vector<int> intervals;
  intervals.reserve(pitch_classes.size());
  for (PitchClass pc : pitch_classes) {
    intervals.push_back(pitch_class_interval(root, pc));
  }
  std::sort(intervals.begin(), intervals.end());
  intervals.erase(std::unique(intervals.begin(), intervals.end()), intervals.end());
  return intervals;
}

IntervalMatch match_intervals(const std::vector<int>& intervals, const ChordTemplate& tmpl) {
  IntervalMatch match{0, tmpl.n_intervals};
  for (int i = 0; i < tmpl.n_intervals; ++i) {
    if (std::binary_search(intervals.begin(), intervals.end(), tmpl.intervals[i])) {
      ++match.matched;
    }
  }
  return match;
}

std::string chord_type_name(ChordType type) {
  switch (type) {
    case ChordType::Major:
      return "Major";
    case ChordType::Minor:
      return "Minor";
    case ChordType::Diminished:
      return "Diminished";
    case ChordType::Augmented:
      return "Augmented";
    case ChordType::Major7:
      return "Major 7";
    case ChordType::Dominant7:
      return "Dominant 7";
    case ChordType::Minor7:
      return "Minor 7";
    case ChordType::Sus4:
      return "Sus4";
    case ChordType::Sus2:
      return "Sus2";
  }
  return "";
}

}  // namespace notescribe
