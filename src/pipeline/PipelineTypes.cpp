// Repository: Podwright
// Component: Pipeline Contract Types
// Purpose: Name tables and error formatting for the stage state machine.
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/PipelineTypes.hpp"

#include <sstream>

namespace podwright::pipeline {

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::kResearching: return "Researching";
    case Stage::kSummarizing: return "Summarizing";
    case Stage::kScripting:   return "Scripting";
    case Stage::kProducing:   return "Producing";
    case Stage::kStitching:   return "Stitching";
    case Stage::kComplete:    return "Complete";
    case Stage::kFailed:      return "Failed";
  }
  return "Unknown";
}

std::optional<Stage> ParseStage(const std::string& name) {
  static const Stage kAll[] = {
      Stage::kResearching, Stage::kSummarizing, Stage::kScripting,
      Stage::kProducing,   Stage::kStitching,   Stage::kComplete,
      Stage::kFailed,
  };
  for (Stage s : kAll) {
    if (name == StageName(s)) return s;
  }
  return std::nullopt;
}

Stage NextStage(Stage stage) {
  switch (stage) {
    case Stage::kResearching: return Stage::kSummarizing;
    case Stage::kSummarizing: return Stage::kScripting;
    case Stage::kScripting:   return Stage::kProducing;
    case Stage::kProducing:   return Stage::kStitching;
    case Stage::kStitching:   return Stage::kComplete;
    case Stage::kComplete:    return Stage::kComplete;
    case Stage::kFailed:      return Stage::kFailed;
  }
  return Stage::kFailed;
}

const char* PipelineErrorKindToString(PipelineErrorKind kind) {
  switch (kind) {
    case PipelineErrorKind::kNone:               return "NONE";
    case PipelineErrorKind::kValidation:         return "VALIDATION";
    case PipelineErrorKind::kCollaborator:       return "COLLABORATOR";
    case PipelineErrorKind::kFormatMismatch:     return "FORMAT_MISMATCH";
    case PipelineErrorKind::kRetryExhausted:     return "RETRY_EXHAUSTED";
    case PipelineErrorKind::kResumeStateCorrupt: return "RESUME_STATE_CORRUPT";
    case PipelineErrorKind::kCancelled:          return "CANCELLED";
    case PipelineErrorKind::kIo:                 return "IO";
  }
  return "UNKNOWN";
}

std::string PipelineError::Describe() const {
  std::ostringstream oss;
  oss << StageName(stage) << ": " << PipelineErrorKindToString(kind);
  if (attempts > 0) {
    oss << " after " << attempts << (attempts == 1 ? " attempt" : " attempts");
  }
  if (cause != PipelineErrorKind::kNone) {
    oss << " (" << PipelineErrorKindToString(cause);
    if (!detail.empty()) oss << ": " << detail;
    oss << ")";
  } else if (!detail.empty()) {
    oss << " (" << detail << ")";
  }
  return oss.str();
}

}  // namespace podwright::pipeline
