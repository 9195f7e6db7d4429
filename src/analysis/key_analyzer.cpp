#include "analysis/key_analyzer.h"

#include <algorithm>
#include <numeric>

namespace notescribe {

namespace {

/// @brief Correlation gap at which the winner counts as fully distinct.
constexpr float kDistinctGap = 0.2f;

}  // namespace

std::string Key::to_string() const {
  return std::string(pitch_class_name(root)) + (mode == Mode::Major ? " major" : " minor");
}

std::string Key::to_short_string() const {
  return std::string(pitch_class_name(root)) + (mode == Mode::Minor ? "m" : "");
}

PitchClassWeights pitch_class_histogram(const std::vector<ConsolidatedNote>& notes) {
  PitchClassWeights histogram = {};
  for (const auto& note : notes) {
    histogram[static_cast<int>(note.note.pitch_class)] += std::max(0.0f, note.duration());
  }
  return histogram;
}

Key estimate_key(const PitchClassWeights& histogram) {
  Key best{PitchClass::C, Mode::Major, 0.0f};

  float total = std::accumulate(histogram.begin(), histogram.end(), 0.0f);
  if (total <= 1e-10f) {
    return best;
  }

  float best_corr = -2.0f;
  float second_corr = -2.0f;
  for (int root = 0; root < 12; ++root) {
    for (Mode mode : {Mode::Major, Mode::Minor}) {
      PitchClass tonic = static_cast<PitchClass>(root);
      float corr = key_correlation(histogram, tonic, mode);
      if (corr > best_corr) {
        second_corr = best_corr;
        best_corr = corr;
        best.root = tonic;
        best.mode = mode;
      } else if (corr > second_corr) {
        second_corr = corr;
      }
    }
  }

  float strength = (best_corr + 1.0f) / 2.0f;
  float distinctiveness = std::min((best_corr - second_corr) / kDistinctGap, 1.0f);
  best.confidence = std::min(strength * 0.5f + distinctiveness * 0.5f, 1.0f);
  return best;
}

Key detect_key(const std::vector<ConsolidatedNote>& notes) {
  return estimate_key(pitch_class_histogram(notes));
}

}  // namespace notescribe
