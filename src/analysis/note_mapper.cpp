#include "analysis/note_mapper.h"

#include <cmath>

#include "core/convert.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace notescribe {

std::string Note::to_string() const { return std::string(name()) + std::to_string(octave); }

int semitones_from_a4(float frequency) {
  return round_half_up(12.0 * std::log2(static_cast<double>(frequency) / kA4Frequency));
}

Note frequency_to_note(float frequency) {
  NOTESCRIBE_CHECK_MSG(frequency > 0.0f && std::isfinite(frequency), ErrorCode::InvalidParameter,
                       "Frequency must be positive");

  int semitones = semitones_from_a4(frequency);
  double nearest = kA4Frequency * std::pow(2.0, semitones / 12.0);
  int cents = round_half_up(1200.0 * std::log2(static_cast<double>(frequency) / nearest));

  // Re-base from A to C: A4 is 9 semitones above C4.
  int from_c4 = semitones + 9;
  int index = ((from_c4 % 12) + 12) % 12;
  int octave = 4 + static_cast<int>(std::floor(from_c4 / 12.0));

  Note note;
  note.pitch_class = static_cast<PitchClass>(index);
  note.octave = octave;
  note.frequency = frequency;
  note.cents = clamp(cents, -50, 50);
  return note;
}

std::vector<PitchSample> pitch_samples_from_track(const PitchTrack& track) {
  std::vector<PitchSample> samples;
  samples.reserve(track.voiced_count());

  for (int i = 0; i < track.n_segments(); ++i) {
    float freq = track.f0[i];
    if (freq <= 0.0f) {
      continue;
    }
    PitchSample sample;
    sample.frequency = freq;
    sample.note = frequency_to_note(freq);
    sample.start = track.start_time(i);
    sample.end = track.end_time(i);
    samples.push_back(sample);
  }
  return samples;
}

}  // namespace notescribe
