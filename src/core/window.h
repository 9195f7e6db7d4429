#pragma once

/// @file window.h
/// @brief Hann window for pitch analysis frames.

#include <vector>

namespace notescribe {

/// @brief Creates a symmetric Hann (raised cosine) window.
/// @param length Window length in samples
/// @return w[i] = 0.5 * (1 - cos(2*pi*i / (length - 1)))
/// @throws NotescribeException(InvalidParameter) if length <= 0
std::vector<float> hann_window(int length);

/// @brief Returns a cached Hann window (thread-local cache).
/// @param length Window length in samples
/// @return Const reference to cached window coefficients
/// @details Every segment of one analysis uses the same window length, so the
///          coefficients are computed once per thread and length.
const std::vector<float>& hann_window_cached(int length);

/// @brief Multiplies a frame by a Hann window, sample-wise.
/// @param frame Input samples [length]
/// @param length Number of samples
/// @return Windowed samples [length]
std::vector<float> apply_hann_window(const float* frame, int length);

}  // namespace notescribe
