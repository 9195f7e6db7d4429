#pragma once

/// @file convert.h
/// @brief Sample and segment time conversions.

#include <cstddef>

namespace notescribe {

/// @brief Reference pitch A4 in Hz.
constexpr float kA4Frequency = 440.0f;

/// @brief Converts sample count to time in seconds.
/// @param samples Number of samples
/// @param sr Sample rate
/// @return Time in seconds
float samples_to_time(size_t samples, int sr);

/// @brief Start time of an analysis segment.
/// @param index Segment index
/// @param segment_length Segment length in samples
/// @param sr Sample rate
/// @return index * (segment_length / sr) * 0.5
float segment_start_time(int index, int segment_length, int sr);

/// @brief End time of an analysis segment (start + segment_length / sr).
float segment_end_time(int index, int segment_length, int sr);

}  // namespace notescribe
