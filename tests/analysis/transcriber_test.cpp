/// @file transcriber_test.cpp
/// @brief Tests for the transcription pipeline.

#include "analysis/transcriber.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace notescribe;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int kSr = 44100;

/// @brief Appends a sine tone to a sample vector.
void append_sine(std::vector<float>& samples, double freq, double seconds, int sr = kSr) {
  size_t n = static_cast<size_t>(seconds * sr);
  for (size_t i = 0; i < n; ++i) {
    samples.push_back(static_cast<float>(0.5 * std::sin(2.0 * M_PI * freq * i / sr)));
  }
}

SampleBuffer sine_buffer(double freq, double seconds) {
  std::vector<float> samples;
  append_sine(samples, freq, seconds);
  return SampleBuffer::from_mono(std::move(samples), kSr);
}

ErrorCode transcribe_error(const SampleBuffer& buffer) {
  try {
    transcribe(buffer);
  } catch (const NotescribeException& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

}  // namespace

TEST_CASE("SimpleNote display name", "[transcriber]") {
  SimpleNote note{PitchClass::Cs, 4, 0.0f, 1.0f};
  REQUIRE(note.display_name() == "C\xE2\x99\xAF");

  SimpleNote natural{PitchClass::A, 4, 0.0f, 1.0f};
  REQUIRE(natural.display_name() == "A");
}

TEST_CASE("transcribe sustained tone", "[transcriber]") {
  TranscriptionResult result = transcribe(sine_buffer(440.0, 1.0));

  REQUIRE(result.raw_pitch_data.size() == 20);
  for (const auto& sample : result.raw_pitch_data) {
    REQUIRE(sample.note.pitch_class == PitchClass::A);
    REQUIRE(sample.note.octave == 4);
  }

  // Overlapping segments merge into a single note.
  REQUIRE(result.simple_notes.size() == 1);
  const SimpleNote& note = result.simple_notes[0];
  REQUIRE(note.pitch == PitchClass::A);
  REQUIRE(note.octave == 4);
  REQUIRE_THAT(note.start, WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(note.duration, WithinAbs(43008.0f / 44100.0f, 1e-5f));

  REQUIRE(result.complex_chords.empty());

  REQUIRE(result.sheet_music.notes.size() == 1);
  REQUIRE(result.sheet_music.notes[0].duration == NoteDuration::Half);
  REQUIRE(result.sheet_music.clef == Clef::Treble);

  // A single note gives no tempo estimate.
  REQUIRE(result.detected_tempo == 120.0f);
  REQUIRE_THAT(result.sheet_music.tempo_bpm, WithinAbs(120.0f, 1e-6f));
  REQUIRE(result.detected_key.confidence > 0.0f);
}

TEST_CASE("transcribe note sequence", "[transcriber]") {
  std::vector<float> samples;
  append_sine(samples, 440.0, 0.5);
  append_sine(samples, 523.25, 0.5);
  auto buffer = SampleBuffer::from_mono(std::move(samples), kSr);

  TranscriptionResult result = transcribe(buffer);
  REQUIRE(result.simple_notes.size() >= 2);
  REQUIRE(result.simple_notes.front().pitch == PitchClass::A);
  REQUIRE(result.simple_notes.back().pitch == PitchClass::C);
  REQUIRE(result.simple_notes.back().octave == 5);

  for (size_t i = 1; i < result.simple_notes.size(); ++i) {
    REQUIRE(result.simple_notes[i].start >= result.simple_notes[i - 1].start);
  }
}

TEST_CASE("transcribe stereo input", "[transcriber]") {
  std::vector<float> left;
  append_sine(left, 440.0, 0.5);
  std::vector<float> right = left;
  auto buffer = SampleBuffer::from_channels({std::move(left), std::move(right)}, kSr);

  TranscriptionResult result = transcribe(buffer);
  REQUIRE(result.simple_notes.size() == 1);
  REQUIRE(result.simple_notes[0].pitch == PitchClass::A);
}

TEST_CASE("transcribe silence and empty input", "[transcriber]") {
  SECTION("silence") {
    auto buffer = SampleBuffer::from_mono(std::vector<float>(kSr, 0.0f), kSr);
    TranscriptionResult result = transcribe(buffer);
    REQUIRE(result.simple_notes.empty());
    REQUIRE(result.complex_chords.empty());
    REQUIRE(result.sheet_music.notes.empty());
    REQUIRE(result.raw_pitch_data.empty());
    REQUIRE(result.detected_key.confidence == 0.0f);
    REQUIRE(result.detected_tempo == 120.0f);
  }

  SECTION("shorter than one segment") {
    TranscriptionResult result = transcribe(sine_buffer(440.0, 0.05));
    REQUIRE(result.raw_pitch_data.empty());
    REQUIRE(result.simple_notes.empty());
  }

  SECTION("zero-length buffer") {
    auto buffer = SampleBuffer::from_mono({}, kSr);
    REQUIRE(transcribe(buffer).simple_notes.empty());
  }
}

TEST_CASE("transcribe malformed input", "[transcriber]") {
  SECTION("mismatched channel lengths") {
    auto buffer = SampleBuffer::from_channels(
        {std::vector<float>(8192, 0.0f), std::vector<float>(4096, 0.0f)}, kSr);
    REQUIRE(transcribe_error(buffer) == ErrorCode::InvalidInput);
  }

  SECTION("non-finite samples") {
    std::vector<float> samples(8192, 0.0f);
    samples[100] = std::nanf("");
    auto buffer = SampleBuffer::from_mono(std::move(samples), kSr);
    REQUIRE(transcribe_error(buffer) == ErrorCode::InvalidInput);
  }

  SECTION("no channels") {
    REQUIRE(transcribe_error(SampleBuffer()) == ErrorCode::InvalidInput);
  }
}

TEST_CASE("Transcriber configuration", "[transcriber]") {
  SECTION("defaults are valid") {
    REQUIRE_NOTHROW(validate_config(TranscriberConfig()));
  }

  SECTION("invalid values") {
    TranscriberConfig config;
    config.segment_length = 1;
    REQUIRE_THROWS_AS(Transcriber(config), NotescribeException);

    config = TranscriberConfig();
    config.min_frequency = 1200.0f;
    REQUIRE_THROWS_AS(Transcriber(config), NotescribeException);

    config = TranscriberConfig();
    config.gap_tolerance = -1.0f;
    REQUIRE_THROWS_AS(validate_config(config), NotescribeException);

    config = TranscriberConfig();
    config.min_chord_match_ratio = 0.0f;
    REQUIRE_THROWS_AS(validate_config(config), NotescribeException);

    config = TranscriberConfig();
    config.tempo_max = 90.0f;
    REQUIRE_THROWS_AS(validate_config(config), NotescribeException);

    config = TranscriberConfig();
    config.fallback_sample_rate = 0;
    REQUIRE_THROWS_AS(validate_config(config), NotescribeException);
  }

  SECTION("one default tempo everywhere") {
    const float tempo = tempo_constants::kDefaultTempo;
    REQUIRE(TranscriberConfig().default_tempo == tempo);
    REQUIRE(TempoConfig().default_tempo == tempo);
    REQUIRE(SheetMusicConfig().tempo_bpm == tempo);
    REQUIRE(SheetMusic().tempo_bpm == tempo);
    REQUIRE(TranscriptionResult().detected_tempo == tempo);
  }

  SECTION("notation settings reach the sheet") {
    TranscriberConfig config;
    config.clef = Clef::Bass;
    config.time_signature = {6, 8};
    config.default_tempo = 100.0f;

    TranscriptionResult result = transcribe(sine_buffer(196.0, 0.5), config);
    REQUIRE(result.sheet_music.clef == Clef::Bass);
    REQUIRE(result.sheet_music.time_signature.numerator == 6);
    REQUIRE(result.sheet_music.time_signature.denominator == 8);
    REQUIRE(result.detected_tempo == 100.0f);
  }

  SECTION("narrow band drops out-of-range pitches") {
    TranscriberConfig config;
    config.min_frequency = 500.0f;
    config.max_frequency = 1000.0f;
    TranscriptionResult result = transcribe(sine_buffer(196.0, 0.5), config);
    for (const auto& sample : result.raw_pitch_data) {
      REQUIRE(sample.frequency >= 500.0f);
    }
  }
}

TEST_CASE("Transcriber progress callback", "[transcriber]") {
  Transcriber transcriber;
  std::vector<float> progress;
  std::vector<std::string> stages;
  transcriber.set_progress_callback([&](float p, const char* stage) {
    progress.push_back(p);
    stages.emplace_back(stage);
  });

  transcriber.transcribe(sine_buffer(440.0, 0.5));

  REQUIRE(progress.size() == stages.size());
  REQUIRE_FALSE(progress.empty());
  REQUIRE(progress.front() == 0.0f);
  REQUIRE(progress.back() == 1.0f);
  REQUIRE(stages.back() == "complete");
  for (size_t i = 1; i < progress.size(); ++i) {
    REQUIRE(progress[i] >= progress[i - 1]);
  }
}
