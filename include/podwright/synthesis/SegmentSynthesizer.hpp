// Repository: Podwright
// Component: Segment Synthesizer
// Purpose: Produces one validated AudioSegment for one script line by calling
//          the voice model and decoding its reply to PCM.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_SYNTHESIS_SEGMENT_SYNTHESIZER_HPP_
#define PODWRIGHT_SYNTHESIS_SEGMENT_SYNTHESIZER_HPP_

#include <memory>
#include <string>

#include "podwright/audio/AudioTypes.hpp"
#include "podwright/collaborators/Collaborators.hpp"
#include "podwright/pipeline/PipelineTypes.hpp"
#include "podwright/voice/VoiceTypes.hpp"

namespace podwright::synthesis {

enum class SynthesisError {
  kNone = 0,
  kEmptyText,          // Line has no text to speak
  kSpeakerMismatch,    // Profile bound to a different role than the line
  kCollaborator,       // Voice model call failed
  kTimeout,            // Voice model call exceeded its deadline
  kDecodeFailed,       // Reply bytes are not decodable audio
  kEmptyAudio,         // Decoded to zero frames
  kInvalidFormat,      // Non-positive rate/channels or partial frame
};

const char* SynthesisErrorToString(SynthesisError error);

struct SynthesisResult {
  bool ok;
  SynthesisError error;
  std::string detail;
  audio::AudioSegment segment;

  static SynthesisResult Success(audio::AudioSegment s) {
    return {true, SynthesisError::kNone, "", std::move(s)};
  }
  static SynthesisResult Failure(SynthesisError e, const std::string& detail) {
    return {false, e, detail, audio::AudioSegment{}};
  }
};

// Thread-safe if the voice collaborator is: holds no mutable state.
class SegmentSynthesizer {
 public:
  explicit SegmentSynthesizer(std::shared_ptr<collaborators::IVoiceSynthesis> voice);

  SynthesisResult Synthesize(const pipeline::ScriptLine& line,
                             const voice::VoiceProfile& profile) const;

 private:
  std::shared_ptr<collaborators::IVoiceSynthesis> voice_;
};

}  // namespace podwright::synthesis

#endif  // PODWRIGHT_SYNTHESIS_SEGMENT_SYNTHESIZER_HPP_
