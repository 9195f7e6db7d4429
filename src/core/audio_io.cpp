#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

#include "util/exception.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace notescribe {

namespace {

/// @brief RAII guard for MP3 decode buffer.
/// @details Ensures mp3dec_file_info_t.buffer is freed even on exception.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief Splits interleaved frames into one vector per channel.
template <typename T>
std::vector<std::vector<float>> deinterleave(const T* data, size_t frames, int channels,
                                             float scale) {
  std::vector<std::vector<float>> planar(static_cast<size_t>(channels),
                                         std::vector<float>(frames));
  for (size_t i = 0; i < frames; ++i) {
    for (int ch = 0; ch < channels; ++ch) {
      planar[ch][i] = static_cast<float>(data[i * channels + ch]) * scale;
    }
  }
  return planar;
}

/// @brief Returns the size of a file in bytes.
size_t file_size(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  NOTESCRIBE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
  return static_cast<size_t>(file.tellg());
}

/// @brief Reads entire file into memory.
std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  NOTESCRIBE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  NOTESCRIBE_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  return buffer;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (data == nullptr || size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: frame sync or ID3 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

SampleBuffer load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  NOTESCRIBE_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  int channels = static_cast<int>(wav.channels);
  int sample_rate = static_cast<int>(wav.sampleRate);
  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * channels);

  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());
  drwav_uninit(&wav);

  NOTESCRIBE_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");
  NOTESCRIBE_CHECK_MSG(channels > 0, ErrorCode::DecodeFailed, "WAV data has no channels");

  return SampleBuffer::from_channels(
      deinterleave(interleaved.data(), static_cast<size_t>(frames_read), channels, 1.0f),
      sample_rate);
}

SampleBuffer load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  NOTESCRIBE_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  NOTESCRIBE_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                       "No audio samples in MP3 data");

  int channels = info.channels;
  size_t frames = static_cast<size_t>(info.samples) / static_cast<size_t>(channels);
  return SampleBuffer::from_channels(
      deinterleave(info.buffer, frames, channels, 1.0f / 32768.0f), info.hz);
}

SampleBuffer load_buffer(const uint8_t* data, size_t size) {
  AudioFormat format = detect_format(data, size);

  switch (format) {
    case AudioFormat::WAV:
      return load_buffer_wav(data, size);
    case AudioFormat::MP3:
      return load_buffer_mp3(data, size);
    default:
      throw NotescribeException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }
}

SampleBuffer load_audio(const std::string& path, const AudioLoadOptions& options) {
  if (options.max_file_size > 0) {
    size_t size = file_size(path);
    NOTESCRIBE_CHECK_MSG(size <= options.max_file_size, ErrorCode::InvalidParameter,
                         "File too large: " + std::to_string(size) + " bytes (max: " +
                             std::to_string(options.max_file_size) + " bytes)");
  }

  std::vector<uint8_t> data = read_file(path);
  return load_buffer(data.data(), data.size());
}

SampleBuffer load_raw_f32(const std::string& path, int channels, int sample_rate) {
  NOTESCRIBE_CHECK_MSG(channels > 0, ErrorCode::InvalidParameter, "channels must be positive");
  NOTESCRIBE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                       "sample_rate must be positive");

  std::vector<uint8_t> data = read_file(path);
  size_t frame_bytes = sizeof(float) * static_cast<size_t>(channels);
  NOTESCRIBE_CHECK_MSG(data.size() % frame_bytes == 0, ErrorCode::InvalidFormat,
                       "Raw file size is not a multiple of the frame size: " + path);

  size_t frames = data.size() / frame_bytes;
  std::vector<float> interleaved(frames * static_cast<size_t>(channels));
  if (!data.empty()) {
    std::memcpy(interleaved.data(), data.data(), data.size());
  }
  return SampleBuffer::from_interleaved(interleaved.data(), frames, channels, sample_rate);
}

void save_wav(const std::string& path, const SampleBuffer& buffer, int bits_per_sample) {
  NOTESCRIBE_CHECK_MSG(buffer.channels() > 0, ErrorCode::InvalidParameter, "No channels to save");
  NOTESCRIBE_CHECK_MSG(!buffer.empty(), ErrorCode::InvalidParameter, "No samples to save");
  NOTESCRIBE_CHECK_MSG(buffer.sample_rate() > 0, ErrorCode::InvalidParameter,
                       "Invalid sample rate");
  NOTESCRIBE_CHECK_MSG(bits_per_sample == 16 || bits_per_sample == 32,
                       ErrorCode::InvalidParameter, "bits_per_sample must be 16 or 32");

  int channels = buffer.channels();
  size_t frames = buffer.size();
  for (int ch = 1; ch < channels; ++ch) {
    NOTESCRIBE_CHECK_MSG(buffer.channel(ch).size() == frames, ErrorCode::InvalidParameter,
                         "Channel lengths differ");
  }

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = bits_per_sample == 16 ? DR_WAVE_FORMAT_PCM : DR_WAVE_FORMAT_IEEE_FLOAT;
  format.channels = static_cast<drwav_uint32>(channels);
  format.sampleRate = static_cast<drwav_uint32>(buffer.sample_rate());
  format.bitsPerSample = static_cast<drwav_uint32>(bits_per_sample);

  drwav wav;
  drwav_bool32 ok = drwav_init_file_write(&wav, path.c_str(), &format, nullptr);
  NOTESCRIBE_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  drwav_uint64 written = 0;
  if (bits_per_sample == 16) {
    std::vector<int16_t> interleaved(frames * channels);
    for (size_t i = 0; i < frames; ++i) {
      for (int ch = 0; ch < channels; ++ch) {
        float clamped = std::max(-1.0f, std::min(1.0f, buffer.channel(ch)[i]));
        interleaved[i * channels + ch] = static_cast<int16_t>(clamped * 32767.0f);
      }
    }
    written = drwav_write_pcm_frames(&wav, frames, interleaved.data());
  } else {
    std::vector<float> interleaved(frames * channels);
    for (size_t i = 0; i < frames; ++i) {
      for (int ch = 0; ch < channels; ++ch) {
        interleaved[i * channels + ch] = buffer.channel(ch)[i];
      }
    }
    written = drwav_write_pcm_frames(&wav, frames, interleaved.data());
  }
  drwav_uninit(&wav);
  NOTESCRIBE_CHECK_MSG(written == frames, ErrorCode::DecodeFailed, "Failed to write all samples");
}

}  // namespace notescribe
