// Repository: Podwright
// Component: Stage Validator Contract Tests
// Copyright (c) 2025 Podwright

#include <gtest/gtest.h>

#include <string>

#include "podwright/audio/StitchingEngine.hpp"
#include "podwright/pipeline/StageValidator.hpp"
#include "FakeCollaborators.h"
#include "WavFixtures.h"

namespace podwright::pipeline {
namespace {

using podwright::tests::fixtures::MakeRegistry;
using podwright::tests::fixtures::MakeSegment;
using voice::Speaker;

Script ThreeLines() {
  Script script;
  script.lines = {
      {0, Speaker::kHost, "Welcome"},
      {1, Speaker::kExpert, "Thanks"},
      {2, Speaker::kHost, "Let's start"},
  };
  return script;
}

SegmentManifest ManifestFor(const Script& script) {
  SegmentManifest manifest;
  for (const auto& line : script.lines) {
    manifest.segments.push_back(MakeSegment(line.index, line.speaker, 160));
  }
  return manifest;
}

class StageValidatorContractTest : public ::testing::Test {
 protected:
  voice::VoiceProfileRegistry registry_ = MakeRegistry();
  StageValidator validator_{registry_};
};

// =============================================================================
// Topic / research / summary
// =============================================================================

TEST_F(StageValidatorContractTest, BlankTopicRejected) {
  EXPECT_TRUE(validator_.ValidateTopic("AI in healthcare").valid);
  EXPECT_FALSE(validator_.ValidateTopic("").valid);
  EXPECT_FALSE(validator_.ValidateTopic(" \t\n").valid);
}

TEST_F(StageValidatorContractTest, ResearchNeedsAtLeastOneSourceWithUrl) {
  ResearchNotes notes;
  EXPECT_FALSE(validator_.ValidateResearch(notes).valid);

  notes.sources.push_back({"Title", "Snippet", "https://example.com/a", 1});
  EXPECT_TRUE(validator_.ValidateResearch(notes).valid);

  notes.sources.push_back({"No url", "Snippet", "  ", 1});
  auto result = validator_.ValidateResearch(notes);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.detail.find("source 1"), std::string::npos) << result.detail;
}

TEST_F(StageValidatorContractTest, BlankSummaryRejected) {
  EXPECT_FALSE(validator_.ValidateSummary(Summary{"\n\n"}).valid);
  EXPECT_TRUE(validator_.ValidateSummary(Summary{"Key points"}).valid);
}

// =============================================================================
// Script
// =============================================================================

TEST_F(StageValidatorContractTest, WellFormedScriptAccepted) {
  auto result = validator_.ValidateScript(ThreeLines());
  EXPECT_TRUE(result.valid) << result.detail;
}

TEST_F(StageValidatorContractTest, EmptyScriptRejected) {
  EXPECT_FALSE(validator_.ValidateScript(Script{}).valid);
}

TEST_F(StageValidatorContractTest, IndexGapRejected) {
  Script script = ThreeLines();
  script.lines[2].index = 3;

  auto result = validator_.ValidateScript(script);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.detail, "gap at index 2 (found 3)");
}

TEST_F(StageValidatorContractTest, IndicesMustStartAtZero) {
  Script script = ThreeLines();
  for (auto& line : script.lines) line.index += 1;

  auto result = validator_.ValidateScript(script);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.detail, "indices do not start at 0 (first index: 1)");
}

TEST_F(StageValidatorContractTest, EmptyLineTextRejected) {
  Script script = ThreeLines();
  script.lines[1].text = "   ";

  auto result = validator_.ValidateScript(script);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.detail.find("line 1"), std::string::npos) << result.detail;
}

TEST_F(StageValidatorContractTest, SpeakerWithoutProfileRejected) {
  Script script = ThreeLines();
  script.lines[0].speaker = Speaker::kUnknown;
  auto result = validator_.ValidateScript(script);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.detail.find("no voice profile"), std::string::npos)
      << result.detail;
}

// =============================================================================
// Manifest / master
// =============================================================================

TEST_F(StageValidatorContractTest, ManifestMatchingScriptAccepted) {
  Script script = ThreeLines();
  auto result = validator_.ValidateManifest(ManifestFor(script), script);
  EXPECT_TRUE(result.valid) << result.detail;
}

TEST_F(StageValidatorContractTest, ManifestCountMismatchRejected) {
  Script script = ThreeLines();
  SegmentManifest manifest = ManifestFor(script);
  manifest.segments.pop_back();
  EXPECT_FALSE(validator_.ValidateManifest(manifest, script).valid);
}

TEST_F(StageValidatorContractTest, ManifestSpeakerMismatchRejected) {
  Script script = ThreeLines();
  SegmentManifest manifest = ManifestFor(script);
  manifest.segments[1].speaker = Speaker::kHost;
  EXPECT_FALSE(validator_.ValidateManifest(manifest, script).valid);
}

TEST_F(StageValidatorContractTest, ManifestEmptyAudioRejected) {
  Script script = ThreeLines();
  SegmentManifest manifest = ManifestFor(script);
  manifest.segments[2].samples.clear();
  EXPECT_FALSE(validator_.ValidateManifest(manifest, script).valid);
}

TEST_F(StageValidatorContractTest, MasterFingerprintChecked) {
  Script script = ThreeLines();
  SegmentManifest manifest = ManifestFor(script);
  audio::StitchingEngine engine(audio::StitchConfig{100});
  auto stitched = engine.Stitch(manifest.segments);
  ASSERT_TRUE(stitched.ok) << stitched.detail;

  EXPECT_TRUE(validator_.ValidateMaster(stitched.master, manifest).valid);

  audio::MasterRecording tampered = stitched.master;
  tampered.samples[0] ^= 0x1;
  EXPECT_FALSE(validator_.ValidateMaster(tampered, manifest).valid);
}

TEST_F(StageValidatorContractTest, StageOutputDispatchChecksArtifactType) {
  PipelineRun run;
  run.topic = "Topic";

  auto wrong = validator_.ValidateStageOutput(Stage::kSummarizing,
                                              StageArtifact{ThreeLines()}, run);
  EXPECT_FALSE(wrong.valid);

  auto no_script = validator_.ValidateStageOutput(
      Stage::kProducing, StageArtifact{ManifestFor(ThreeLines())}, run);
  EXPECT_FALSE(no_script.valid);

  run.stage_outputs[Stage::kScripting] = ThreeLines();
  auto ok = validator_.ValidateStageOutput(
      Stage::kProducing, StageArtifact{ManifestFor(ThreeLines())}, run);
  EXPECT_TRUE(ok.valid) << ok.detail;
}

}  // namespace
}  // namespace podwright::pipeline
