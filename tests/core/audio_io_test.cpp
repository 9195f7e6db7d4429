/// @file audio_io_test.cpp
/// @brief Tests for audio I/O functions.

#include "core/audio_io.h"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace notescribe;
using Catch::Matchers::WithinAbs;

namespace {

struct WavHeader {
  char riff[4] = {'R', 'I', 'F', 'F'};
  uint32_t file_size;
  char wave[4] = {'W', 'A', 'V', 'E'};
  char fmt[4] = {'f', 'm', 't', ' '};
  uint32_t fmt_size = 16;
  uint16_t audio_format;
  uint16_t num_channels;
  uint32_t sample_rate;
  uint32_t byte_rate;
  uint16_t block_align;
  uint16_t bits_per_sample;
  char data[4] = {'d', 'a', 't', 'a'};
  uint32_t data_size;
};

/// @brief Creates an interleaved float32 WAV file in memory.
std::vector<uint8_t> create_wav_buffer(const float* samples, size_t frame_count, int channels,
                                       int sample_rate) {
  WavHeader header;
  header.audio_format = 3;  // IEEE float
  header.num_channels = static_cast<uint16_t>(channels);
  header.sample_rate = static_cast<uint32_t>(sample_rate);
  header.block_align = static_cast<uint16_t>(channels * 4);
  header.bits_per_sample = 32;
  header.byte_rate = header.sample_rate * header.block_align;
  header.data_size = static_cast<uint32_t>(frame_count * header.block_align);
  header.file_size = 36 + header.data_size;

  std::vector<uint8_t> buffer(sizeof(WavHeader) + header.data_size);
  std::memcpy(buffer.data(), &header, sizeof(WavHeader));
  std::memcpy(buffer.data() + sizeof(WavHeader), samples, header.data_size);
  return buffer;
}

/// @brief Creates a mono 16-bit PCM WAV file in memory.
std::vector<uint8_t> create_wav_buffer_pcm16(const float* samples, size_t sample_count,
                                             int sample_rate) {
  WavHeader header;
  header.audio_format = 1;  // PCM
  header.num_channels = 1;
  header.sample_rate = static_cast<uint32_t>(sample_rate);
  header.block_align = 2;
  header.bits_per_sample = 16;
  header.byte_rate = header.sample_rate * 2;
  header.data_size = static_cast<uint32_t>(sample_count * 2);
  header.file_size = 36 + header.data_size;

  std::vector<int16_t> pcm_samples(sample_count);
  for (size_t i = 0; i < sample_count; ++i) {
    float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
    pcm_samples[i] = static_cast<int16_t>(clamped * 32767.0f);
  }

  std::vector<uint8_t> buffer(sizeof(WavHeader) + header.data_size);
  std::memcpy(buffer.data(), &header, sizeof(WavHeader));
  std::memcpy(buffer.data() + sizeof(WavHeader), pcm_samples.data(), sample_count * 2);
  return buffer;
}

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

std::vector<float> generate_sine(int samples, float freq, int sr, float amplitude = 0.5f) {
  std::vector<float> result(samples);
  for (int i = 0; i < samples; ++i) {
    result[i] = amplitude * std::sin(kTwoPi * freq * i / sr);
  }
  return result;
}

ErrorCode load_error(const std::string& path) {
  try {
    load_audio(path);
  } catch (const NotescribeException& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

const std::string kTempWav = "/tmp/notescribe_audio_io_test.wav";
const std::string kTempRaw = "/tmp/notescribe_audio_io_test.f32";

}  // namespace

TEST_CASE("detect_format WAV", "[audio_io]") {
  std::vector<uint8_t> wav_header = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
  REQUIRE(detect_format(wav_header.data(), wav_header.size()) == AudioFormat::WAV);
}

TEST_CASE("detect_format MP3", "[audio_io]") {
  SECTION("ID3 tag") {
    std::vector<uint8_t> mp3_header = {'I', 'D', '3', 0x04, 0x00, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(mp3_header.data(), mp3_header.size()) == AudioFormat::MP3);
  }

  SECTION("frame sync") {
    std::vector<uint8_t> mp3_header = {0xFF, 0xFB, 0x90, 0x00, 0, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(mp3_header.data(), mp3_header.size()) == AudioFormat::MP3);
  }
}

TEST_CASE("detect_format unknown", "[audio_io]") {
  std::vector<uint8_t> unknown = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05,
                                  0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B};
  REQUIRE(detect_format(unknown.data(), unknown.size()) == AudioFormat::Unknown);

  std::vector<uint8_t> small = {0x00, 0x01, 0x02};
  REQUIRE(detect_format(small.data(), small.size()) == AudioFormat::Unknown);
}

TEST_CASE("load_buffer_wav float32", "[audio_io]") {
  constexpr int sr = 22050;
  constexpr int samples = 1000;
  std::vector<float> expected = generate_sine(samples, 440.0f, sr);
  std::vector<uint8_t> wav_data = create_wav_buffer(expected.data(), expected.size(), 1, sr);

  SampleBuffer loaded = load_buffer_wav(wav_data.data(), wav_data.size());

  REQUIRE(loaded.sample_rate() == sr);
  REQUIRE(loaded.channels() == 1);
  REQUIRE(loaded.size() == samples);
  for (size_t i = 0; i < samples; ++i) {
    REQUIRE(loaded.channel(0)[i] == expected[i]);
  }
}

TEST_CASE("load_buffer_wav keeps channels separate", "[audio_io]") {
  constexpr int sr = 44100;
  constexpr size_t frames = 256;
  std::vector<float> interleaved(frames * 2);
  for (size_t i = 0; i < frames; ++i) {
    interleaved[2 * i] = 0.25f;
    interleaved[2 * i + 1] = -0.5f;
  }
  std::vector<uint8_t> wav_data = create_wav_buffer(interleaved.data(), frames, 2, sr);

  SampleBuffer loaded = load_buffer_wav(wav_data.data(), wav_data.size());
  REQUIRE(loaded.channels() == 2);
  REQUIRE(loaded.size() == frames);
  REQUIRE(loaded.channel(0)[10] == 0.25f);
  REQUIRE(loaded.channel(1)[10] == -0.5f);
}

TEST_CASE("load_buffer_wav pcm16", "[audio_io]") {
  constexpr int sr = 44100;
  constexpr int samples = 2000;
  std::vector<float> expected = generate_sine(samples, 1000.0f, sr);
  std::vector<uint8_t> wav_data = create_wav_buffer_pcm16(expected.data(), expected.size(), sr);

  SampleBuffer loaded = load_buffer_wav(wav_data.data(), wav_data.size());

  REQUIRE(loaded.sample_rate() == sr);
  REQUIRE(loaded.size() == samples);
  for (size_t i = 0; i < samples; ++i) {
    REQUIRE_THAT(loaded.channel(0)[i], WithinAbs(expected[i], 2.0f / 32767.0f));
  }
}

TEST_CASE("load_buffer", "[audio_io]") {
  SECTION("auto-detects WAV") {
    constexpr int sr = 22050;
    std::vector<float> expected = generate_sine(500, 880.0f, sr);
    std::vector<uint8_t> wav_data = create_wav_buffer(expected.data(), expected.size(), 1, sr);

    SampleBuffer loaded = load_buffer(wav_data.data(), wav_data.size());
    REQUIRE(loaded.sample_rate() == sr);
    REQUIRE(loaded.size() == 500);
  }

  SECTION("rejects unknown data") {
    std::vector<uint8_t> unknown(64, 0x11);
    try {
      load_buffer(unknown.data(), unknown.size());
      FAIL("expected an exception");
    } catch (const NotescribeException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
    }
  }

  SECTION("rejects a truncated WAV") {
    std::vector<uint8_t> header = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    REQUIRE_THROWS_AS(load_buffer(header.data(), header.size()), NotescribeException);
  }
}

TEST_CASE("save_wav and load_audio", "[audio_io]") {
  constexpr int sr = 44100;
  std::vector<float> left = generate_sine(4410, 440.0f, sr);
  std::vector<float> right = generate_sine(4410, 220.0f, sr);
  SampleBuffer buffer = SampleBuffer::from_channels({left, right}, sr);

  SECTION("16-bit PCM") {
    save_wav(kTempWav, buffer);
    SampleBuffer loaded = load_audio(kTempWav);

    REQUIRE(loaded.sample_rate() == sr);
    REQUIRE(loaded.channels() == 2);
    REQUIRE(loaded.size() == left.size());
    for (size_t i = 0; i < left.size(); i += 97) {
      REQUIRE_THAT(loaded.channel(0)[i], WithinAbs(left[i], 2.0f / 32767.0f));
      REQUIRE_THAT(loaded.channel(1)[i], WithinAbs(right[i], 2.0f / 32767.0f));
    }
  }

  SECTION("32-bit float") {
    save_wav(kTempWav, buffer, 32);
    SampleBuffer loaded = load_audio(kTempWav);
    REQUIRE(loaded.channels() == 2);
    for (size_t i = 0; i < left.size(); i += 97) {
      REQUIRE(loaded.channel(0)[i] == left[i]);
      REQUIRE(loaded.channel(1)[i] == right[i]);
    }
  }

  SECTION("file size limit") {
    save_wav(kTempWav, buffer);
    AudioLoadOptions options;
    options.max_file_size = 16;
    REQUIRE_THROWS_AS(load_audio(kTempWav, options), NotescribeException);
  }

  SECTION("unsupported bit depth") {
    REQUIRE_THROWS_AS(save_wav(kTempWav, buffer, 24), NotescribeException);
  }

  SECTION("empty buffer") {
    REQUIRE_THROWS_AS(save_wav(kTempWav, SampleBuffer()), NotescribeException);
  }

  std::remove(kTempWav.c_str());
}

TEST_CASE("load_audio missing file", "[audio_io]") {
  REQUIRE(load_error("/tmp/notescribe_does_not_exist.wav") == ErrorCode::FileNotFound);
}

TEST_CASE("load_raw_f32", "[audio_io]") {
  std::vector<float> interleaved = {0.1f, -0.1f, 0.2f, -0.2f, 0.3f, -0.3f};

  SECTION("stereo frames") {
    {
      std::ofstream out(kTempRaw, std::ios::binary);
      out.write(reinterpret_cast<const char*>(interleaved.data()),
                static_cast<std::streamsize>(interleaved.size() * sizeof(float)));
    }
    SampleBuffer loaded = load_raw_f32(kTempRaw, 2, 48000);
    REQUIRE(loaded.channels() == 2);
    REQUIRE(loaded.size() == 3);
    REQUIRE(loaded.sample_rate() == 48000);
    REQUIRE(loaded.channel(0)[2] == 0.3f);
    REQUIRE(loaded.channel(1)[2] == -0.3f);
  }

  SECTION("partial frame") {
    {
      std::ofstream out(kTempRaw, std::ios::binary);
      out.write(reinterpret_cast<const char*>(interleaved.data()),
                static_cast<std::streamsize>(5 * sizeof(float)));
    }
    try {
      load_raw_f32(kTempRaw, 2, 44100);
      FAIL("expected an exception");
    } catch (const NotescribeException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
    }
  }

  SECTION("invalid parameters") {
    REQUIRE_THROWS_AS(load_raw_f32(kTempRaw, 0, 44100), NotescribeException);
    REQUIRE_THROWS_AS(load_raw_f32(kTempRaw, 1, 0), NotescribeException);
  }

  std::remove(kTempRaw.c_str());
}

TEST_CASE("AudioLoadOptions defaults", "[audio_io]") {
  AudioLoadOptions opts;
  REQUIRE(opts.max_file_size == 500 * 1024 * 1024);
  REQUIRE(kDefaultLoadOptions.max_file_size == 500 * 1024 * 1024);
}
