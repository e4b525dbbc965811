// Repository: Podwright
// Component: PCM Decoder
// Purpose: Decodes synthesized audio (WAV or any container FFmpeg reads) into
//          interleaved signed 16-bit PCM at the source rate and channel layout.
//          Sample format is converted; rate and channels are never changed.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_AUDIO_PCM_DECODER_HPP_
#define PODWRIGHT_AUDIO_PCM_DECODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace podwright::audio {

struct DecodedPcm {
  bool ok = false;
  std::string detail;
  int32_t sample_rate = 0;
  int32_t channel_count = 0;
  std::vector<int16_t> samples;  // Interleaved

  static DecodedPcm Failure(const std::string& detail) {
    DecodedPcm r;
    r.detail = detail;
    return r;
  }
};

class PcmDecoder {
 public:
  // Decodes from an in-memory container (custom AVIO read/seek over `bytes`).
  static DecodedPcm DecodeBytes(const std::vector<uint8_t>& bytes);

  // Decodes a file on disk.
  static DecodedPcm DecodeFile(const std::string& path);
};

}  // namespace podwright::audio

#endif  // PODWRIGHT_AUDIO_PCM_DECODER_HPP_
