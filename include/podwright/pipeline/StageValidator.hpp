// Repository: Podwright
// Component: Stage Validator
// Purpose: Checks each stage artifact against its data-model invariants
//          before the orchestrator forwards it. Fail-fast: the first violated
//          invariant is reported.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_STAGE_VALIDATOR_HPP_
#define PODWRIGHT_PIPELINE_STAGE_VALIDATOR_HPP_

#include <string>

#include "podwright/pipeline/PipelineTypes.hpp"
#include "podwright/voice/VoiceProfileRegistry.hpp"

namespace podwright::pipeline {

class StageValidator {
 public:
  struct ValidationResult {
    bool valid;
    std::string detail;

    static ValidationResult Success() { return {true, ""}; }
    static ValidationResult Failure(const std::string& detail) {
      return {false, detail};
    }
  };

  explicit StageValidator(const voice::VoiceProfileRegistry& registry);

  // Non-empty after trimming whitespace.
  ValidationResult ValidateTopic(const std::string& topic) const;

  // At least one record; every record has a url.
  ValidationResult ValidateResearch(const ResearchNotes& notes) const;

  ValidationResult ValidateSummary(const Summary& summary) const;

  // Non-empty; index == position for every line; text non-empty; speaker
  // resolvable in the registry.
  ValidationResult ValidateScript(const Script& script) const;

  // One segment per script line, index order, matching speakers, non-empty
  // whole-frame audio. Format uniformity is left to the stitching engine.
  ValidationResult ValidateManifest(const SegmentManifest& manifest,
                                    const Script& script) const;

  ValidationResult ValidateMaster(const audio::MasterRecording& master,
                                  const SegmentManifest& manifest) const;

  // Dispatches to the validator for `stage`, reading predecessor artifacts
  // from `run` where the check needs them.
  ValidationResult ValidateStageOutput(Stage stage, const StageArtifact& artifact,
                                       const PipelineRun& run) const;

 private:
  const voice::VoiceProfileRegistry& registry_;
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_STAGE_VALIDATOR_HPP_
