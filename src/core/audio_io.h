#pragma once

/// @file audio_io.h
/// @brief Audio file decoding into sample buffers using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/sample_buffer.h"

namespace notescribe {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  /// @details Default is 500MB. Set to 0 to disable size checking.
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Default audio load options.
inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes WAV data from memory, keeping every channel.
/// @param data Pointer to WAV data
/// @param size Size of data in bytes
/// @return Planar buffer normalized to [-1, 1]
/// @throws NotescribeException(DecodeFailed) on decode error
SampleBuffer load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Decodes MP3 data from memory, keeping every channel.
/// @param data Pointer to MP3 data
/// @param size Size of data in bytes
/// @return Planar buffer normalized to [-1, 1]
/// @throws NotescribeException(DecodeFailed) on decode error
SampleBuffer load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Decodes audio from memory (auto-detect format).
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Planar buffer normalized to [-1, 1]
/// @throws NotescribeException(InvalidFormat) on unknown format, DecodeFailed on decode error
SampleBuffer load_buffer(const uint8_t* data, size_t size);

/// @brief Loads an audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options (max file size, etc.)
/// @return Planar buffer normalized to [-1, 1]
/// @throws NotescribeException on file not found, unknown format, file too large, or decode error
SampleBuffer load_audio(const std::string& path,
                        const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Loads headerless interleaved 32-bit float PCM (native byte order).
/// @param path Path to raw file
/// @param channels Number of interleaved channels (> 0)
/// @param sample_rate Sample rate to attach (> 0)
/// @return Planar buffer
/// @throws NotescribeException(InvalidFormat) if the size is not a whole number of frames
SampleBuffer load_raw_f32(const std::string& path, int channels, int sample_rate);

/// @brief Saves a buffer to a WAV file.
/// @param path Output file path
/// @param buffer Audio to write (all channels, interleaved on disk)
/// @param bits_per_sample 16 for integer PCM or 32 for IEEE float
/// @throws NotescribeException(InvalidParameter) on bad arguments, DecodeFailed on write error
void save_wav(const std::string& path, const SampleBuffer& buffer, int bits_per_sample = 16);

}  // namespace notescribe
