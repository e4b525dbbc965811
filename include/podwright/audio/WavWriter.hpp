// Repository: Podwright
// Component: WAV Writer
// Purpose: Muxes interleaved s16 PCM into a RIFF/WAV file through libavformat.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_AUDIO_WAV_WRITER_HPP_
#define PODWRIGHT_AUDIO_WAV_WRITER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace podwright::audio {

struct WavWriteResult {
  bool ok;
  std::string detail;
  int64_t bytes_written;

  static WavWriteResult Success(int64_t bytes) { return {true, "", bytes}; }
  static WavWriteResult Failure(const std::string& detail) {
    return {false, detail, 0};
  }
};

class WavWriter {
 public:
  // Writes `path`, replacing any existing file. The container is always
  // "wav" regardless of the path's extension.
  static WavWriteResult Write(const std::string& path,
                              const std::vector<int16_t>& samples,
                              int32_t sample_rate, int32_t channel_count);

  // Write() to `path` + ".partial", then rename onto `path`, so `path` exists
  // only once the file is complete.
  static WavWriteResult WriteAtomic(const std::string& path,
                                    const std::vector<int16_t>& samples,
                                    int32_t sample_rate, int32_t channel_count);
};

}  // namespace podwright::audio

#endif  // PODWRIGHT_AUDIO_WAV_WRITER_HPP_
