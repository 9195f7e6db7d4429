#pragma once

/// @file downmix.h
/// @brief Channel downmixing.

#include <vector>

#include "core/sample_buffer.h"

namespace notescribe {

/// @brief Reduces a multi-channel buffer to mono by averaging channels per sample.
/// @param buffer Input buffer (channel lengths are assumed equal, see SampleBuffer::validate)
/// @return Mono samples, same length as the buffer. A single channel is returned as a copy.
std::vector<float> downmix(const SampleBuffer& buffer);

}  // namespace notescribe
