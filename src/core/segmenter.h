#pragma once

/// @file segmenter.h
/// @brief Fixed-length analysis windows with 50% overlap.

#include <cstddef>

namespace notescribe {

/// @brief View of one analysis window.
struct Segment {
  int index;          ///< Segment index (0-based)
  size_t offset;      ///< Offset of the first sample in the signal
  const float* data;  ///< Pointer to the first sample (owned by the signal)
  int length;         ///< Number of samples
};

/// @brief Splits a mono signal into windows starting at 0, hop, 2*hop, ...
/// @details hop is segment_length / 2. Windows that would run past the end of the
/// signal are dropped, never padded. Single pass: once next() returns false the
/// segmenter stays exhausted.
class Segmenter {
 public:
  /// @brief Constructs a segmenter over an existing signal.
  /// @param signal Mono samples (must outlive the segmenter)
  /// @param size Number of samples
  /// @param segment_length Window length in samples (>= 2)
  /// @throws NotescribeException(InvalidParameter) if segment_length < 2
  Segmenter(const float* signal, size_t size, int segment_length);

  /// @brief Produces the next segment.
  /// @param out Receives the segment view
  /// @return false when no full segment remains
  bool next(Segment& out);

  /// @brief Returns total number of full segments in the signal.
  int count() const;

  /// @brief Returns hop size in samples.
  int hop() const { return hop_; }

  /// @brief Returns window length in samples.
  int segment_length() const { return segment_length_; }

 private:
  const float* signal_;
  size_t size_;
  int segment_length_;
  int hop_;
  int next_index_;
};

/// @brief Returns the number of full segments for a signal length.
/// @param size Signal length in samples
/// @param segment_length Window length in samples
/// @return Number of segments (0 if the signal is shorter than one window)
int segment_count(size_t size, int segment_length);

}  // namespace notescribe
