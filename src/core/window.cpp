/// @file window.cpp
/// @brief Implementation of the Hann window.

#include "core/window.h"

#include <Eigen/Core>
#include <cmath>
#include <unordered_map>

#include "util/exception.h"

namespace notescribe {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

/// @brief Thread-local cache keyed by window length.
thread_local std::unordered_map<int, std::vector<float>> g_window_cache;
}  // namespace

std::vector<float> hann_window(int length) {
  NOTESCRIBE_CHECK(length > 0, ErrorCode::InvalidParameter);
  std::vector<float> window(length);
  if (length == 1) {
    window[0] = 1.0f;
    return window;
  }
  for (int i = 0; i < length; ++i) {
    window[i] = static_cast<float>(0.5 * (1.0 - std::cos(kTwoPi * i / (length - 1))));
  }
  return window;
}

const std::vector<float>& hann_window_cached(int length) {
  auto it = g_window_cache.find(length);
  if (it != g_window_cache.end()) {
    return it->second;
  }

  auto result = g_window_cache.emplace(length, hann_window(length));
  return result.first->second;
}

std::vector<float> apply_hann_window(const float* frame, int length) {
  NOTESCRIBE_CHECK(frame != nullptr, ErrorCode::InvalidParameter);
  const std::vector<float>& window = hann_window_cached(length);

  std::vector<float> windowed(length);
  Eigen::Map<const Eigen::ArrayXf> frame_map(frame, length);
  Eigen::Map<const Eigen::ArrayXf> window_map(window.data(), length);
  Eigen::Map<Eigen::ArrayXf> out_map(windowed.data(), length);
  out_map = frame_map * window_map;
  return windowed;
}

}  // namespace notescribe
