// Repository: Podwright
// Component: Stage Validator Implementation
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/StageValidator.hpp"

#include <sstream>

namespace podwright::pipeline {

namespace {

bool IsBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

StageValidator::StageValidator(const voice::VoiceProfileRegistry& registry)
    : registry_(registry) {}

StageValidator::ValidationResult StageValidator::ValidateTopic(
    const std::string& topic) const {
  if (IsBlank(topic)) {
    return ValidationResult::Failure("topic is empty");
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateResearch(
    const ResearchNotes& notes) const {
  if (notes.sources.empty()) {
    return ValidationResult::Failure("research returned no source records");
  }
  for (size_t i = 0; i < notes.sources.size(); ++i) {
    if (IsBlank(notes.sources[i].url)) {
      std::ostringstream detail;
      detail << "source " << i << " has no url";
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateSummary(
    const Summary& summary) const {
  if (IsBlank(summary.text)) {
    return ValidationResult::Failure("summary is empty");
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateScript(
    const Script& script) const {
  if (script.lines.empty()) {
    return ValidationResult::Failure("script has no lines");
  }

  for (size_t i = 0; i < script.lines.size(); ++i) {
    const auto& line = script.lines[i];
    if (line.index != static_cast<int32_t>(i)) {
      std::ostringstream detail;
      if (i == 0) {
        detail << "indices do not start at 0 (first index: " << line.index << ")";
      } else {
        detail << "gap at index " << i << " (found " << line.index << ")";
      }
      return ValidationResult::Failure(detail.str());
    }
    if (IsBlank(line.text)) {
      std::ostringstream detail;
      detail << "line " << i << " has empty text";
      return ValidationResult::Failure(detail.str());
    }
    if (!registry_.Contains(line.speaker)) {
      std::ostringstream detail;
      detail << "line " << i << " speaker " << voice::SpeakerName(line.speaker)
             << " has no voice profile";
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateManifest(
    const SegmentManifest& manifest, const Script& script) const {
  if (manifest.segments.size() != script.lines.size()) {
    std::ostringstream detail;
    detail << manifest.segments.size() << " segments for "
           << script.lines.size() << " script lines";
    return ValidationResult::Failure(detail.str());
  }
  if (!manifest.segment_paths.empty() &&
      manifest.segment_paths.size() != manifest.segments.size()) {
    return ValidationResult::Failure("segment path count does not match segments");
  }

  for (size_t i = 0; i < manifest.segments.size(); ++i) {
    const auto& seg = manifest.segments[i];
    std::ostringstream detail;
    if (seg.index != static_cast<int32_t>(i)) {
      detail << "segment at position " << i << " has index " << seg.index;
      return ValidationResult::Failure(detail.str());
    }
    if (seg.speaker != script.lines[i].speaker) {
      detail << "segment " << i << " speaker " << voice::SpeakerName(seg.speaker)
             << " != script speaker " << voice::SpeakerName(script.lines[i].speaker);
      return ValidationResult::Failure(detail.str());
    }
    if (seg.sample_rate <= 0 || seg.channel_count <= 0) {
      detail << "segment " << i << " has invalid format " << seg.sample_rate
             << "Hz/" << seg.channel_count << "ch";
      return ValidationResult::Failure(detail.str());
    }
    if (seg.samples.empty() ||
        seg.samples.size() % static_cast<size_t>(seg.channel_count) != 0) {
      detail << "segment " << i << " has " << seg.samples.size()
             << " samples for " << seg.channel_count << " channels";
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateMaster(
    const audio::MasterRecording& master,
    const SegmentManifest& manifest) const {
  if (master.samples.empty()) {
    return ValidationResult::Failure("master recording is empty");
  }
  if (master.boundaries.size() != manifest.segments.size()) {
    std::ostringstream detail;
    detail << master.boundaries.size() << " boundaries for "
           << manifest.segments.size() << " segments";
    return ValidationResult::Failure(detail.str());
  }
  if (master.fingerprint != audio::FingerprintSamples(master.samples)) {
    return ValidationResult::Failure("master fingerprint does not match samples");
  }
  return ValidationResult::Success();
}

StageValidator::ValidationResult StageValidator::ValidateStageOutput(
    Stage stage, const StageArtifact& artifact, const PipelineRun& run) const {
  switch (stage) {
    case Stage::kResearching:
      if (auto* notes = std::get_if<ResearchNotes>(&artifact)) {
        return ValidateResearch(*notes);
      }
      break;
    case Stage::kSummarizing:
      if (auto* summary = std::get_if<Summary>(&artifact)) {
        return ValidateSummary(*summary);
      }
      break;
    case Stage::kScripting:
      if (auto* script = std::get_if<Script>(&artifact)) {
        return ValidateScript(*script);
      }
      break;
    case Stage::kProducing:
      if (auto* manifest = std::get_if<SegmentManifest>(&artifact)) {
        const Script* script = run.OutputAs<Script>(Stage::kScripting);
        if (script == nullptr) {
          return ValidationResult::Failure("no script to check segments against");
        }
        return ValidateManifest(*manifest, *script);
      }
      break;
    case Stage::kStitching:
      if (auto* master = std::get_if<audio::MasterRecording>(&artifact)) {
        const SegmentManifest* manifest =
            run.OutputAs<SegmentManifest>(Stage::kProducing);
        if (manifest == nullptr) {
          return ValidationResult::Failure("no manifest to check master against");
        }
        return ValidateMaster(*master, *manifest);
      }
      break;
    case Stage::kComplete:
    case Stage::kFailed:
      return ValidationResult::Failure(std::string("terminal stage ") +
                                       StageName(stage) + " has no artifact");
  }
  return ValidationResult::Failure(std::string("artifact type does not match stage ") +
                                   StageName(stage));
}

}  // namespace podwright::pipeline
