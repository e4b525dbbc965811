// Repository: Podwright
// Component: Voice Types
// Purpose: Speaker roles and the voice configuration bound to each role.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_VOICE_VOICE_TYPES_HPP_
#define PODWRIGHT_VOICE_VOICE_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace podwright::voice {

// =============================================================================
// Speaker
// Two recognized roles. kUnknown is what the script parser produces for any
// other label; validation rejects it.
// =============================================================================

enum class Speaker : int32_t {
  kUnknown = -1,
  kHost = 0,
  kExpert = 1,
};

// "Host" / "Expert" / "Unknown"
const char* SpeakerName(Speaker speaker);

// "host" / "expert"; used in segment file names.
const char* SpeakerFileTag(Speaker speaker);

// Case-insensitive, surrounding whitespace ignored. Anything else -> kUnknown.
Speaker ParseSpeaker(const std::string& label);

// =============================================================================
// Synthesis parameters
// Forwarded verbatim to the voice model.
// =============================================================================

struct SynthesisParams {
  float exaggeration = 0.5f;  // Emotional expressiveness (0.25 - 2.0)
  float cfg_weight = 0.5f;    // Guidance / pacing (0.0 - 1.0)
  float temperature = 0.8f;   // Generation randomness
};

// =============================================================================
// Voice profile
// =============================================================================

struct VoiceProfile {
  Speaker speaker = Speaker::kUnknown;

  // Reference clip for zero-shot cloning. Empty path means the voice model
  // falls back to its default voice.
  std::string reference_sample_path;

  // Contents of the reference clip. The registry fills this whenever it binds
  // a clip, so remote voice services receive the audio itself; the path is
  // only meaningful on this host.
  std::vector<uint8_t> reference_audio;

  SynthesisParams synthesis_params;

  bool HasReference() const {
    return !reference_sample_path.empty() || !reference_audio.empty();
  }
};

}  // namespace podwright::voice

#endif  // PODWRIGHT_VOICE_VOICE_TYPES_HPP_
