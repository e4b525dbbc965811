// Repository: Podwright
// Component: Segment Synthesizer
// Copyright (c) 2025 Podwright

#include "podwright/synthesis/SegmentSynthesizer.hpp"

#include <sstream>

#include "podwright/audio/PcmDecoder.hpp"
#include "podwright/util/Logger.hpp"

namespace podwright::synthesis {

using podwright::util::Logger;

const char* SynthesisErrorToString(SynthesisError error) {
  switch (error) {
    case SynthesisError::kNone: return "NONE";
    case SynthesisError::kEmptyText: return "EMPTY_TEXT";
    case SynthesisError::kSpeakerMismatch: return "SPEAKER_MISMATCH";
    case SynthesisError::kCollaborator: return "COLLABORATOR";
    case SynthesisError::kTimeout: return "TIMEOUT";
    case SynthesisError::kDecodeFailed: return "DECODE_FAILED";
    case SynthesisError::kEmptyAudio: return "EMPTY_AUDIO";
    case SynthesisError::kInvalidFormat: return "INVALID_FORMAT";
  }
  return "UNKNOWN";
}

SegmentSynthesizer::SegmentSynthesizer(
    std::shared_ptr<collaborators::IVoiceSynthesis> voice)
    : voice_(std::move(voice)) {}

SynthesisResult SegmentSynthesizer::Synthesize(
    const pipeline::ScriptLine& line, const voice::VoiceProfile& profile) const {
  if (line.text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return SynthesisResult::Failure(SynthesisError::kEmptyText,
                                    "line " + std::to_string(line.index));
  }
  if (profile.speaker != line.speaker) {
    std::ostringstream oss;
    oss << "line " << line.index << " speaker=" << voice::SpeakerName(line.speaker)
        << " profile=" << voice::SpeakerName(profile.speaker);
    return SynthesisResult::Failure(SynthesisError::kSpeakerMismatch, oss.str());
  }

  collaborators::SynthesisReply reply = voice_->Synthesize(line.text, profile);
  if (!reply.ok) {
    return SynthesisResult::Failure(
        reply.timed_out ? SynthesisError::kTimeout : SynthesisError::kCollaborator,
        reply.error);
  }

  audio::DecodedPcm pcm = audio::PcmDecoder::DecodeBytes(reply.audio);
  if (!pcm.ok) {
    return SynthesisResult::Failure(SynthesisError::kDecodeFailed, pcm.detail);
  }
  if (pcm.sample_rate <= 0 || pcm.channel_count <= 0) {
    std::ostringstream oss;
    oss << "sample_rate=" << pcm.sample_rate
        << " channel_count=" << pcm.channel_count;
    return SynthesisResult::Failure(SynthesisError::kInvalidFormat, oss.str());
  }
  if (pcm.samples.size() % static_cast<size_t>(pcm.channel_count) != 0) {
    return SynthesisResult::Failure(SynthesisError::kInvalidFormat,
                                    "partial frame");
  }
  if (pcm.samples.empty()) {
    return SynthesisResult::Failure(SynthesisError::kEmptyAudio,
                                    "line " + std::to_string(line.index));
  }

  audio::AudioSegment segment;
  segment.index = line.index;
  segment.speaker = line.speaker;
  segment.sample_rate = pcm.sample_rate;
  segment.channel_count = pcm.channel_count;
  segment.samples = std::move(pcm.samples);

  std::ostringstream oss;
  oss << "[SegmentSynthesizer] SEGMENT_READY index=" << segment.index
      << " speaker=" << voice::SpeakerName(segment.speaker)
      << " rate=" << segment.sample_rate << " channels=" << segment.channel_count
      << " duration_ms=" << segment.duration_ms();
  Logger::Debug(oss.str());

  return SynthesisResult::Success(std::move(segment));
}

}  // namespace podwright::synthesis
