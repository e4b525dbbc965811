// Repository: Podwright
// Component: Stitching Engine
// Purpose: Merges the ordered per-line segments into one master recording,
//          inserting a fixed silence gap wherever the speaker changes.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_AUDIO_STITCHING_ENGINE_HPP_
#define PODWRIGHT_AUDIO_STITCHING_ENGINE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "podwright/audio/AudioTypes.hpp"

namespace podwright::audio {

struct StitchConfig {
  int32_t inter_turn_gap_ms = 500;
};

enum class StitchError {
  kNone = 0,
  kEmptyInput,       // No segments
  kIndexMismatch,    // segments[i].index != i
  kFormatMismatch,   // sample_rate / channel_count differ between segments
  kInvalidFormat,    // sample_rate or channel_count <= 0
  kPartialFrame,     // samples.size() not a multiple of channel_count
};

const char* StitchErrorToString(StitchError error);

struct StitchResult {
  bool ok;
  StitchError error;
  std::string detail;
  MasterRecording master;

  static StitchResult Success(MasterRecording m) {
    return {true, StitchError::kNone, "", std::move(m)};
  }
  static StitchResult Failure(StitchError e, const std::string& detail) {
    return {false, e, detail, MasterRecording{}};
  }
};

// Stateless apart from its config. Deterministic: identical input yields a
// byte-identical sample buffer.
class StitchingEngine {
 public:
  explicit StitchingEngine(StitchConfig config = StitchConfig{});

  StitchResult Stitch(const std::vector<AudioSegment>& segments) const;

  // round(gap_ms * sample_rate / 1000) frames, times channel_count.
  int64_t GapSamples(int32_t sample_rate, int32_t channel_count) const;

  const StitchConfig& config() const { return config_; }

 private:
  StitchResult CheckPreconditions(const std::vector<AudioSegment>& segments) const;

  StitchConfig config_;
};

}  // namespace podwright::audio

#endif  // PODWRIGHT_AUDIO_STITCHING_ENGINE_HPP_
