#include "analysis/key_profiles.h"

#include "util/math_utils.h"

namespace notescribe {

namespace {

// Krumhansl & Kessler (1982) probe-tone ratings, tonic first.
constexpr PitchClassWeights kMajorRatings = {6.35f, 2.23f, 3.48f, 2.33f, 4.38f, 4.09f,
                                             2.52f, 5.19f, 2.39f, 3.66f, 2.29f, 2.88f};
constexpr PitchClassWeights kMinorRatings = {6.33f, 2.68f, 3.52f, 5.38f, 2.60f, 3.53f,
                                             2.54f, 4.75f, 3.98f, 2.69f, 3.34f, 3.17f};

}  // namespace

PitchClassWeights key_profile(PitchClass tonic, Mode mode) {
  const PitchClassWeights& ratings = mode == Mode::Major ? kMajorRatings : kMinorRatings;
  const int shift = static_cast<int>(tonic);

  PitchClassWeights profile;
  for (int pc = 0; pc < 12; ++pc) {
    profile[pc] = ratings[(pc - shift + 12) % 12];
  }
  return profile;
}

float key_correlation(const PitchClassWeights& histogram, PitchClass tonic, Mode mode) {
  PitchClassWeights profile = key_profile(tonic, mode);
  return pearson_correlation(histogram.data(), profile.data(), profile.size());
}

}  // namespace notescribe
