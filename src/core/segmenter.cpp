#include "core/segmenter.h"

#include "util/exception.h"

namespace notescribe {

int segment_count(size_t size, int segment_length) {
  NOTESCRIBE_CHECK(segment_length >= 2, ErrorCode::InvalidParameter);
  size_t length = static_cast<size_t>(segment_length);
  if (size < length) {
    return 0;
  }
  size_t hop = length / 2;
  return static_cast<int>((size - length) / hop + 1);
}

Segmenter::Segmenter(const float* signal, size_t size, int segment_length)
    : signal_(signal), size_(size), segment_length_(segment_length), hop_(0), next_index_(0) {
  NOTESCRIBE_CHECK(segment_length >= 2, ErrorCode::InvalidParameter);
  NOTESCRIBE_CHECK(signal != nullptr || size == 0, ErrorCode::InvalidParameter);
  hop_ = segment_length / 2;
}

bool Segmenter::next(Segment& out) {
  size_t offset = static_cast<size_t>(next_index_) * static_cast<size_t>(hop_);
  if (offset + static_cast<size_t>(segment_length_) > size_) {
    return false;
  }

  out.index = next_index_;
  out.offset = offset;
  out.data = signal_ + offset;
  out.length = segment_length_;
  ++next_index_;
  return true;
}

int Segmenter::count() const { return segment_count(size_, segment_length_); }

}  // namespace notescribe
