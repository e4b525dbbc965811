// Repository: Podwright
// Component: Pipeline Contract Types
// Purpose: Typed envelopes for the artifacts flowing between stages, the
//          stage state machine enumeration, and the pipeline error model.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_PIPELINE_TYPES_HPP_
#define PODWRIGHT_PIPELINE_PIPELINE_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "podwright/audio/AudioTypes.hpp"
#include "podwright/voice/VoiceTypes.hpp"

namespace podwright::pipeline {

// =============================================================================
// Stage
// Researching -> Summarizing -> Scripting -> Producing -> Stitching -> Complete
// Any working stage may move to Failed. Complete and Failed are terminal.
// =============================================================================

enum class Stage : int32_t {
  kResearching = 0,
  kSummarizing = 1,
  kScripting = 2,
  kProducing = 3,
  kStitching = 4,
  kComplete = 5,
  kFailed = 6,
};

// Working stages in execution order.
inline constexpr Stage kWorkingStages[] = {
    Stage::kResearching, Stage::kSummarizing, Stage::kScripting,
    Stage::kProducing, Stage::kStitching,
};

const char* StageName(Stage stage);

// Inverse of StageName. Returns nullopt for unrecognized names.
std::optional<Stage> ParseStage(const std::string& name);

inline bool IsTerminal(Stage stage) {
  return stage == Stage::kComplete || stage == Stage::kFailed;
}

// Next working stage, or kComplete after kStitching.
Stage NextStage(Stage stage);

// =============================================================================
// Error Codes
// =============================================================================

enum class PipelineErrorKind {
  kNone = 0,

  // Artifact failed its stage's data-model invariants.
  kValidation,

  // External call failed, timed out, or returned malformed data.
  kCollaborator,

  // Segments with inconsistent sample_rate/channel_count reached stitching.
  // Configuration bug: fatal, never retried.
  kFormatMismatch,

  // Stage or line retry ceiling exceeded.
  kRetryExhausted,

  // Persisted run snapshot failed validation on resume.
  kResumeStateCorrupt,

  // Cancel() observed at a stage boundary.
  kCancelled,

  // Segment/master file could not be written.
  kIo,
};

const char* PipelineErrorKindToString(PipelineErrorKind kind);

// Retryable kinds are converted into a retry decision at the stage boundary.
inline bool IsRetryable(PipelineErrorKind kind) {
  return kind == PipelineErrorKind::kValidation ||
         kind == PipelineErrorKind::kCollaborator ||
         kind == PipelineErrorKind::kIo;
}

struct PipelineError {
  PipelineErrorKind kind = PipelineErrorKind::kNone;
  Stage stage = Stage::kResearching;
  int32_t attempts = 0;
  std::string detail;

  // For kRetryExhausted: the last underlying error.
  PipelineErrorKind cause = PipelineErrorKind::kNone;

  // "Scripting: RETRY_EXHAUSTED after 3 attempts (VALIDATION: ...)"
  std::string Describe() const;
};

// =============================================================================
// Stage artifacts
// =============================================================================

struct SourceRecord {
  std::string title;
  std::string snippet;
  std::string url;
  int64_t retrieved_at_ms = 0;
};

// Researching output. At least one source record is required.
struct ResearchNotes {
  std::vector<SourceRecord> sources;
  std::string notes;  // Structured notes text from the research collaborator
};

// Summarizing output. Opaque to the pipeline.
struct Summary {
  std::string text;
};

struct ScriptLine {
  int32_t index = 0;
  voice::Speaker speaker = voice::Speaker::kUnknown;
  std::string text;
};

// Scripting output. Indices are 0..N-1 matching position.
struct Script {
  std::vector<ScriptLine> lines;
};

// Producing output: one segment per script line, index order, plus where each
// segment was written.
struct SegmentManifest {
  std::vector<audio::AudioSegment> segments;
  std::vector<std::string> segment_paths;
};

using StageArtifact = std::variant<ResearchNotes, Summary, Script,
                                   SegmentManifest, audio::MasterRecording>;

// =============================================================================
// PipelineRun
// The single mutable context object of one run. Only the orchestrator writes
// current_stage and stage_outputs.
// =============================================================================

struct PipelineRun {
  std::string run_id;
  std::string topic;
  Stage current_stage = Stage::kResearching;

  std::map<Stage, StageArtifact> stage_outputs;
  std::map<Stage, int32_t> attempt_counts;

  // Producing: attempts spent per script line index.
  std::map<int32_t, int32_t> line_attempt_counts;

  std::optional<std::string> failure_reason;
  std::optional<Stage> failed_stage;

  template <typename T>
  const T* OutputAs(Stage stage) const {
    auto it = stage_outputs.find(stage);
    if (it == stage_outputs.end()) return nullptr;
    return std::get_if<T>(&it->second);
  }

  int32_t AttemptsFor(Stage stage) const {
    auto it = attempt_counts.find(stage);
    return it == attempt_counts.end() ? 0 : it->second;
  }
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_PIPELINE_TYPES_HPP_
