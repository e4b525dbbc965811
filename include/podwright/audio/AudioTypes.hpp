// Repository: Podwright
// Component: Audio Types
// Purpose: PCM segment and master-recording data structures shared by the
//          synthesizer, the stitching engine and the orchestrator.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_AUDIO_AUDIO_TYPES_HPP_
#define PODWRIGHT_AUDIO_AUDIO_TYPES_HPP_

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <zlib.h>

#include "podwright/voice/VoiceTypes.hpp"

namespace podwright::audio {

// =============================================================================
// AudioSegment
// One synthesized clip for one script line. Samples are signed 16-bit,
// interleaved when channel_count > 1. Immutable once synthesis completes.
// =============================================================================

struct AudioSegment {
  int32_t index = 0;
  voice::Speaker speaker = voice::Speaker::kUnknown;
  int32_t sample_rate = 0;
  int32_t channel_count = 0;
  std::vector<int16_t> samples;

  // Samples per channel.
  int64_t frame_count() const {
    return channel_count > 0
               ? static_cast<int64_t>(samples.size()) / channel_count
               : 0;
  }

  int64_t duration_ms() const {
    return sample_rate > 0 ? frame_count() * 1000 / sample_rate : 0;
  }

  double duration_seconds() const {
    return sample_rate > 0
               ? static_cast<double>(frame_count()) / sample_rate
               : 0.0;
  }
};

// =============================================================================
// SegmentBoundary
// Where one segment landed inside the master buffer. Offsets count samples
// (interleaved values), not frames.
// =============================================================================

struct SegmentBoundary {
  int32_t segment_index = 0;
  voice::Speaker speaker = voice::Speaker::kUnknown;
  int64_t start_sample = 0;
  int64_t sample_count = 0;
  int64_t start_ms = 0;
  int64_t duration_ms = 0;
};

// =============================================================================
// MasterRecording
// Created once by the stitching engine; never mutated afterwards except for
// output_path, which the orchestrator sets after the file is on disk.
// =============================================================================

struct MasterRecording {
  int32_t sample_rate = 0;
  int32_t channel_count = 0;
  std::vector<int16_t> samples;
  std::vector<SegmentBoundary> boundaries;

  int64_t gap_samples_inserted = 0;
  uint32_t fingerprint = 0;  // CRC32 of the sample buffer
  std::string output_path;

  int64_t total_duration_ms() const {
    if (sample_rate <= 0 || channel_count <= 0) return 0;
    return static_cast<int64_t>(samples.size()) / channel_count * 1000 /
           sample_rate;
  }
};

// CRC32 over the raw little-endian sample bytes. Identical buffers always
// produce identical fingerprints; used to prove stitching determinism and to
// verify persisted segment files on resume.
inline uint32_t FingerprintSamples(const std::vector<int16_t>& samples) {
  uLong crc = crc32(0L, Z_NULL, 0);
  if (samples.empty()) return static_cast<uint32_t>(crc);
  const auto* bytes = reinterpret_cast<const Bytef*>(samples.data());
  size_t remaining = samples.size() * sizeof(int16_t);
  // crc32 takes uInt lengths; feed large buffers in chunks.
  while (remaining > 0) {
    uInt chunk = static_cast<uInt>(std::min<size_t>(remaining, 1u << 30));
    crc = crc32(crc, bytes, chunk);
    bytes += chunk;
    remaining -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

}  // namespace podwright::audio

#endif  // PODWRIGHT_AUDIO_AUDIO_TYPES_HPP_
