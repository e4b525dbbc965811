// Repository: Podwright
// Component: Collaborator Interfaces
// Purpose: Boundary of the external services the pipeline consumes:
//          language-model content stages, web search, voice synthesis and
//          reference-voice generation.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_COLLABORATORS_COLLABORATORS_HPP_
#define PODWRIGHT_COLLABORATORS_COLLABORATORS_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "podwright/pipeline/PipelineTypes.hpp"
#include "podwright/voice/VoiceTypes.hpp"

namespace podwright::collaborators {

// Stage names sent to IContentStage.
inline constexpr const char* kResearchStageName = "research";
inline constexpr const char* kSummarizeStageName = "summarize";
inline constexpr const char* kScriptStageName = "script";

// =============================================================================
// Content stage (language-model backed)
// =============================================================================

struct StageRequest {
  std::string stage_name;
  std::string run_id;
  int32_t attempt = 1;
  std::string input_text;
  std::vector<pipeline::SourceRecord> sources;
};

struct StageReply {
  bool ok = false;
  std::string text;

  // Structured results, when the backend returns them instead of text.
  std::vector<pipeline::SourceRecord> sources;
  std::vector<pipeline::ScriptLine> lines;

  std::string error;
  bool timed_out = false;

  static StageReply Success(std::string text) {
    StageReply r;
    r.ok = true;
    r.text = std::move(text);
    return r;
  }

  static StageReply Failure(std::string error, bool timed_out = false) {
    StageReply r;
    r.error = std::move(error);
    r.timed_out = timed_out;
    return r;
  }
};

// Must be idempotent enough to retry; output may vary across attempts.
class IContentStage {
 public:
  virtual ~IContentStage() = default;
  virtual StageReply RunStage(const StageRequest& request) = 0;
};

// =============================================================================
// Search provider (used by the research stage only)
// =============================================================================

struct SearchReply {
  bool ok = false;
  std::vector<pipeline::SourceRecord> results;  // retrieved_at left 0
  std::string error;
};

class ISearchProvider {
 public:
  virtual ~ISearchProvider() = default;
  virtual SearchReply Search(const std::string& query, int32_t max_results) = 0;
};

// =============================================================================
// Voice synthesis
// =============================================================================

struct SynthesisReply {
  bool ok = false;
  std::vector<uint8_t> audio;  // Container bytes, PCM-decodable (WAV etc.)
  std::string error;
  bool timed_out = false;
};

// Called concurrently from dispatcher workers; implementations must be
// thread-safe.
class IVoiceSynthesis {
 public:
  virtual ~IVoiceSynthesis() = default;
  virtual SynthesisReply Synthesize(const std::string& text,
                                    const voice::VoiceProfile& profile) = 0;
};

// =============================================================================
// Reference voice generation (registry fallback when a clip is missing)
// =============================================================================

struct ReferenceReply {
  bool ok = false;
  std::vector<uint8_t> audio;
  std::string error;
};

class IReferenceVoiceGenerator {
 public:
  virtual ~IReferenceVoiceGenerator() = default;
  virtual ReferenceReply GenerateReference(voice::Speaker speaker,
                                           const std::string& voice_id,
                                           const std::string& prompt_text) = 0;
};

// Everything the orchestrator talks to. reference_generator may be null.
struct Collaborators {
  std::shared_ptr<IContentStage> content;
  std::shared_ptr<ISearchProvider> search;
  std::shared_ptr<IVoiceSynthesis> voice;
  std::shared_ptr<IReferenceVoiceGenerator> reference_generator;
};

}  // namespace podwright::collaborators

#endif  // PODWRIGHT_COLLABORATORS_COLLABORATORS_HPP_
