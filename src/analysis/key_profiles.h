#pragma once

/// @file key_profiles.h
/// @brief Krumhansl-Kessler tonal hierarchy profiles used for key estimation.

#include <array>

#include "util/types.h"

namespace notescribe {

/// @brief Weight per pitch class, indexed from C (C=0, C#=1, ..., B=11).
using PitchClassWeights = std::array<float, 12>;

/// @brief Returns the probe-tone profile of a key.
/// @details The base ratings are tonic-relative; the result is rotated so that
/// index 0 is C and the peak sits at the tonic.
/// @param tonic Key tonic
/// @param mode Major or minor
/// @return Profile indexed by absolute pitch class
PitchClassWeights key_profile(PitchClass tonic, Mode mode);

/// @brief Pearson correlation of a pitch-class histogram with a key profile.
/// @param histogram Pitch-class weights (any scale)
/// @param tonic Key tonic
/// @param mode Major or minor
/// @return Correlation in [-1, 1]; 0 for a flat histogram
float key_correlation(const PitchClassWeights& histogram, PitchClass tonic, Mode mode);

}  // namespace notescribe
