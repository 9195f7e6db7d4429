/// @file convert.cpp
/// @brief Implementation of time conversion functions.

#include "core/convert.h"

namespace notescribe {

float samples_to_time(size_t samples, int sr) {
  return static_cast<float>(static_cast<double>(samples) / sr);
}

float segment_start_time(int index, int segment_length, int sr) {
  double segment_duration = static_cast<double>(segment_length) / sr;
  return static_cast<float>(index * segment_duration * 0.5);
}

float segment_end_time(int index, int segment_length, int sr) {
  double segment_duration = static_cast<double>(segment_length) / sr;
  return static_cast<float>(index * segment_duration * 0.5 + segment_duration);
}

}  // namespace notescribe
