/// @file pitch_test.cpp
/// @brief Tests for windowed autocorrelation pitch estimation.

#include "feature/pitch.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace notescribe;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int kSr = 44100;
constexpr int kLength = 4096;

/// @brief Generates a pure sine wave.
std::vector<float> generate_sine(double freq, size_t n_samples, int sr = kSr,
                                 double amplitude = 0.5, double phase = 0.0) {
  std::vector<float> samples(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    samples[i] = static_cast<float>(amplitude * std::sin(2.0 * M_PI * freq * i / sr + phase));
  }
  return samples;
}

/// @brief Distance between the estimated and true period in lags.
double lag_error(float estimated, double freq, int sr = kSr) {
  return std::abs(sr / static_cast<double>(estimated) - sr / freq);
}

}  // namespace

TEST_CASE("lag_range", "[pitch]") {
  SECTION("default band") {
    LagRange range = lag_range(44100, 80.0f, 1000.0f, 4096);
    REQUIRE(range.min_lag == 44);   // floor(44.1)
    REQUIRE(range.max_lag == 552);  // ceil(551.25)
    REQUIRE_FALSE(range.empty());
  }

  SECTION("max lag clamped to frame length") {
    LagRange range = lag_range(44100, 80.0f, 1000.0f, 256);
    REQUIRE(range.max_lag == 256);
  }

  SECTION("min lag is at least one") {
    LagRange range = lag_range(1000, 80.0f, 2000.0f, 64);
    REQUIRE(range.min_lag == 1);
  }

  SECTION("band above frame resolution is empty") {
    LagRange range = lag_range(44100, 80.0f, 1000.0f, 32);
    REQUIRE(range.empty());
  }
}

TEST_CASE("autocorrelation", "[pitch]") {
  std::vector<float> x = {1.0f, 0.0f, 1.0f, 0.0f, 1.0f, 0.0f};
  auto corr = autocorrelation(x.data(), static_cast<int>(x.size()), 1, 5);

  REQUIRE(corr.size() == 4);
  REQUIRE_THAT(corr[0], WithinAbs(0.0f, 1e-6f));  // lag 1
  REQUIRE_THAT(corr[1], WithinAbs(2.0f, 1e-6f));  // lag 2
  REQUIRE_THAT(corr[2], WithinAbs(0.0f, 1e-6f));  // lag 3
  REQUIRE_THAT(corr[3], WithinAbs(1.0f, 1e-6f));  // lag 4

  SECTION("empty range") {
    REQUIRE(autocorrelation(x.data(), 6, 3, 3).empty());
  }

  SECTION("range past the frame is rejected") {
    REQUIRE_THROWS_AS(autocorrelation(x.data(), 6, 1, 7), NotescribeException);
  }
}

TEST_CASE("find_peak_lag", "[pitch]") {
  SECTION("picks the maximum") {
    REQUIRE(find_peak_lag({0.1f, 0.9f, 0.3f}, 10) == 11);
  }

  SECTION("ties resolve to the lowest lag") {
    REQUIRE(find_peak_lag({0.5f, 2.0f, 2.0f, 1.0f}, 10) == 11);
  }

  SECTION("no positive value means no peak") {
    REQUIRE(find_peak_lag({0.0f, 0.0f, 0.0f}, 44) == 0);
    REQUIRE(find_peak_lag({-1.0f, -0.5f}, 44) == 0);
    REQUIRE(find_peak_lag({}, 44) == 0);
  }
}

TEST_CASE("estimate_pitch recovers sine frequency", "[pitch]") {
  const double freqs[] = {196.0, 261.63, 329.63, 440.0, 523.25, 659.26, 880.0, 987.77};

  for (double freq : freqs) {
    auto frame = generate_sine(freq, kLength);
    float estimated = estimate_pitch(frame.data(), kLength, kSr);

    INFO("frequency " << freq << " estimated " << estimated);
    REQUIRE(estimated > 0.0f);
    REQUIRE(lag_error(estimated, freq) <= 1.0);
  }
}

TEST_CASE("estimate_pitch known lags", "[pitch]") {
  auto a4 = generate_sine(440.0, kLength);
  REQUIRE_THAT(estimate_pitch(a4.data(), kLength, kSr), WithinAbs(441.0f, 1e-3f));  // lag 100

  auto g3 = generate_sine(196.0, kLength);
  REQUIRE_THAT(estimate_pitch(g3.data(), kLength, kSr), WithinAbs(196.0f, 1e-3f));  // lag 225
}

TEST_CASE("estimate_pitch is phase independent", "[pitch]") {
  auto a = generate_sine(440.0, kLength, kSr, 0.5, 0.0);
  auto b = generate_sine(440.0, kLength, kSr, 0.5, 1.0);
  REQUIRE(estimate_pitch(a.data(), kLength, kSr) == estimate_pitch(b.data(), kLength, kSr));
}

TEST_CASE("estimate_pitch near the lower band edge", "[pitch]") {
  // Window taper pulls long-period peaks a few lags short; the note stays correct.
  auto e2 = generate_sine(82.41, kLength);
  float estimated = estimate_pitch(e2.data(), kLength, kSr);
  REQUIRE(estimated > 82.41f);
  REQUIRE(estimated < 84.0f);
}

TEST_CASE("estimate_pitch silence", "[pitch]") {
  std::vector<float> silence(kLength, 0.0f);
  REQUIRE(estimate_pitch(silence.data(), kLength, kSr) == 0.0f);
}

TEST_CASE("estimate_pitch below the band", "[pitch]") {
  // 50 Hz has no period inside the lag range; the shortest lag wins and is out of band.
  auto low = generate_sine(50.0, kLength);
  REQUIRE(estimate_pitch(low.data(), kLength, kSr) == 0.0f);
}

TEST_CASE("estimate_pitch invalid arguments", "[pitch]") {
  std::vector<float> frame(kLength, 0.0f);
  REQUIRE_THROWS_AS(estimate_pitch(nullptr, kLength, kSr), NotescribeException);
  REQUIRE_THROWS_AS(estimate_pitch(frame.data(), kLength, 0), NotescribeException);
  REQUIRE_THROWS_AS(estimate_pitch(frame.data(), kLength, kSr, 500.0f, 400.0f),
                    NotescribeException);
}

TEST_CASE("track_pitch", "[pitch]") {
  SECTION("one second of A4") {
    auto samples = generate_sine(440.0, kSr);
    PitchTrack track = track_pitch(samples, kSr);

    REQUIRE(track.n_segments() == 20);
    REQUIRE(track.voiced_count() == 20);
    for (float f : track.f0) {
      REQUIRE_THAT(f, WithinAbs(441.0f, 1e-3f));
    }
    REQUIRE_THAT(track.start_time(1), WithinAbs(0.0464399f, 1e-6f));
    REQUIRE_THAT(track.end_time(1), WithinAbs(0.1393197f, 1e-6f));
  }

  SECTION("silence is unvoiced") {
    std::vector<float> silence(kSr, 0.0f);
    PitchTrack track = track_pitch(silence, kSr);
    REQUIRE(track.n_segments() == 20);
    REQUIRE(track.voiced_count() == 0);
  }

  SECTION("signal shorter than a segment") {
    auto samples = generate_sine(440.0, kLength - 1);
    PitchTrack track = track_pitch(samples, kSr);
    REQUIRE(track.n_segments() == 0);
  }

  SECTION("invalid configuration") {
    std::vector<float> samples(kLength, 0.0f);
    PitchConfig config;
    config.segment_length = 1;
    REQUIRE_THROWS_AS(track_pitch(samples, kSr, config), NotescribeException);

    config = PitchConfig();
    config.fmin = 0.0f;
    REQUIRE_THROWS_AS(track_pitch(samples, kSr, config), NotescribeException);

    config = PitchConfig();
    config.fmin = 900.0f;
    config.fmax = 800.0f;
    REQUIRE_THROWS_AS(track_pitch(samples, kSr, config), NotescribeException);
  }
}
