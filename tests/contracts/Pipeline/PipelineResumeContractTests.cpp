// Repository: Podwright
// Component: Pipeline Resume Contract Tests
// Purpose: Snapshot-driven resume: reuse of valid artifacts, fresh retry
//          budgets, and discard-and-restart on unusable state.
// Copyright (c) 2025 Podwright

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

#include "podwright/audio/WavWriter.hpp"
#include "podwright/pipeline/PipelineOrchestrator.hpp"
#include "PipelineHarness.h"
#include "WavFixtures.h"

namespace podwright::pipeline {
namespace {

using podwright::tests::fixtures::FileExists;
using podwright::tests::fixtures::kThreeLineMasterSamples;
using podwright::tests::fixtures::MakeTone;

constexpr const char* kTopic = "The future of fusion power";
constexpr const char* kRunId = "podcast_resume_run";

class PipelineResumeContractTest
    : public podwright::tests::fixtures::PipelineHarness {};

TEST_F(PipelineResumeContractTest, SnapshotWrittenAfterEveryCompletedStage) {
  auto orch = MakeOrchestrator();
  const RunSnapshotStore* store = &orch->store();
  Stage stage_seen_by_script = Stage::kFailed;
  bool summary_persisted = false;
  content_->SetOnCall([&](const collaborators::StageRequest& r) {
    if (r.stage_name != collaborators::kScriptStageName) return;
    auto loaded = store->Load(kRunId);
    if (loaded.status != SnapshotLoadStatus::kOk) return;
    stage_seen_by_script = loaded.run.current_stage;
    summary_persisted = loaded.run.OutputAs<Summary>(Stage::kSummarizing) != nullptr;
  });

  ASSERT_TRUE(orch->Run(kTopic, kRunId).ok);
  EXPECT_EQ(stage_seen_by_script, Stage::kScripting);
  EXPECT_TRUE(summary_persisted);

  auto final_state = orch->store().Load(kRunId);
  ASSERT_EQ(final_state.status, SnapshotLoadStatus::kOk) << final_state.detail;
  EXPECT_EQ(final_state.run.current_stage, Stage::kComplete);
  EXPECT_NE(final_state.run.OutputAs<audio::MasterRecording>(Stage::kStitching),
            nullptr);
}

TEST_F(PipelineResumeContractTest, ResumeAfterProducingFailureReusesContentStages) {
  voice_->FailText("Hi there", 3);
  auto orch = MakeOrchestrator();
  RunResult failed = orch->Run(kTopic, kRunId);
  ASSERT_FALSE(failed.ok);
  ASSERT_EQ(failed.error.stage, Stage::kProducing);

  RunResult resumed = orch->Resume(kRunId, kTopic);

  ASSERT_TRUE(resumed.ok) << resumed.error.Describe();
  EXPECT_FALSE(resumed.snapshot_discarded);
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 1);
  EXPECT_EQ(content_->CallCount(collaborators::kSummarizeStageName), 1);
  EXPECT_EQ(content_->CallCount(collaborators::kScriptStageName), 1);
  EXPECT_EQ(static_cast<int64_t>(resumed.master.samples.size()),
            kThreeLineMasterSamples);
  EXPECT_EQ(resumed.run.line_attempt_counts.at(1), 1);
  EXPECT_FALSE(resumed.run.failure_reason.has_value());
  EXPECT_TRUE(FileExists(RunFile(kRunId, kMasterFileName)));

  // Same audio as an uninterrupted run.
  RunResult reference = MakeOrchestrator()->Run(kTopic, "podcast_reference");
  ASSERT_TRUE(reference.ok);
  EXPECT_EQ(resumed.master.fingerprint, reference.master.fingerprint);
}

TEST_F(PipelineResumeContractTest, ResumedStageGetsFreshAttemptBudget) {
  content_->FailNext(collaborators::kScriptStageName, 3);
  auto orch = MakeOrchestrator();
  RunResult failed = orch->Run(kTopic, kRunId);
  ASSERT_FALSE(failed.ok);
  ASSERT_EQ(failed.error.kind, PipelineErrorKind::kRetryExhausted);
  ASSERT_EQ(failed.run.AttemptsFor(Stage::kScripting), 3);

  content_->FailNext(collaborators::kScriptStageName, 2);
  RunResult resumed = orch->Resume(kRunId, kTopic);

  ASSERT_TRUE(resumed.ok) << resumed.error.Describe();
  EXPECT_EQ(resumed.run.AttemptsFor(Stage::kScripting), 2);
  EXPECT_EQ(content_->CallCount(collaborators::kScriptStageName), 6);
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 1);
}

TEST_F(PipelineResumeContractTest, InMemoryResumeRunsOnlyMissingStages) {
  auto orch = MakeOrchestrator();
  RunResult full = orch->Run(kTopic, kRunId);
  ASSERT_TRUE(full.ok);
  const int voice_calls = voice_->TotalCalls();

  PipelineRun partial = full.run;
  partial.stage_outputs.erase(Stage::kStitching);
  partial.current_stage = Stage::kStitching;

  RunResult resumed = orch->Resume(partial);

  ASSERT_TRUE(resumed.ok) << resumed.error.Describe();
  EXPECT_EQ(voice_->TotalCalls(), voice_calls);
  EXPECT_EQ(content_->Requests().size(), 3u);
  EXPECT_EQ(resumed.master.samples, full.master.samples);
}

TEST_F(PipelineResumeContractTest, CompleteRunResumesWithoutWork) {
  auto orch = MakeOrchestrator();
  RunResult full = orch->Run(kTopic, kRunId);
  ASSERT_TRUE(full.ok);

  RunResult resumed = orch->Resume(kRunId, kTopic);

  ASSERT_TRUE(resumed.ok) << resumed.error.Describe();
  EXPECT_EQ(resumed.run.current_stage, Stage::kComplete);
  EXPECT_EQ(resumed.master.samples, full.master.samples);
  EXPECT_EQ(resumed.master.output_path, full.master.output_path);
  EXPECT_EQ(content_->Requests().size(), 3u);
  EXPECT_EQ(voice_->TotalCalls(), 3);
}

// =============================================================================
// Unusable state
// =============================================================================

TEST_F(PipelineResumeContractTest, MissingSnapshotStartsFreshRun) {
  auto orch = MakeOrchestrator();
  RunResult result = orch->Resume("podcast_never_ran", kTopic);

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_FALSE(result.snapshot_discarded);
  EXPECT_EQ(result.run.run_id, "podcast_never_ran");
  EXPECT_EQ(content_->Requests().size(), 3u);
}

TEST_F(PipelineResumeContractTest, CorruptSnapshotDiscardedAndRestarted) {
  auto orch = MakeOrchestrator();
  ASSERT_TRUE(orch->Run(kTopic, kRunId).ok);
  {
    std::ofstream of(orch->store().SnapshotPath(kRunId),
                     std::ios::binary | std::ios::trunc);
    of << "\x0a\x05garbage";
  }

  RunResult result = orch->Resume(kRunId, kTopic);

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(result.run.run_id, kRunId);
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 2);
  EXPECT_EQ(orch->store().Load(kRunId).status, SnapshotLoadStatus::kOk);
}

// The snapshot path is a FIFO so Resume() blocks inside the snapshot load
// until the test has issued Cancel(); the fresh run that follows the corrupt
// state must still see it.
TEST_F(PipelineResumeContractTest, CancelDuringSnapshotLoadEndsResume) {
  auto orch = MakeOrchestrator();
  ASSERT_TRUE(orch->Run(kTopic, kRunId).ok);
  const std::string snapshot = orch->store().SnapshotPath(kRunId);
  ASSERT_EQ(std::remove(snapshot.c_str()), 0);
  ASSERT_EQ(mkfifo(snapshot.c_str(), 0600), 0);
  const size_t queries_before = search_->Queries().size();

  RunResult result;
  std::thread resumer([&] { result = orch->Resume(kRunId, kTopic); });

  // Returns once the loader has opened the FIFO for reading.
  int fd = open(snapshot.c_str(), O_WRONLY);
  ASSERT_GE(fd, 0);
  orch->Cancel();
  const char garbage[] = "\x0a\x05garbage";
  ASSERT_EQ(write(fd, garbage, sizeof(garbage) - 1),
            static_cast<ssize_t>(sizeof(garbage) - 1));
  close(fd);
  resumer.join();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, PipelineErrorKind::kCancelled);
  EXPECT_EQ(result.error.stage, Stage::kResearching);
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(search_->Queries().size(), queries_before);
  EXPECT_FALSE(FileExists(RunFile(kRunId, "final_podcast.wav.partial")));

  // The next call starts uncancelled.
  RunResult again = orch->Resume(kRunId, kTopic);
  ASSERT_TRUE(again.ok) << again.error.Describe();
}

TEST_F(PipelineResumeContractTest, TamperedSegmentFileDiscardsState) {
  auto orch = MakeOrchestrator();
  ASSERT_TRUE(orch->Run(kTopic, kRunId).ok);
  ASSERT_TRUE(audio::WavWriter::Write(RunFile(kRunId, "segment_001_expert.wav"),
                                      MakeTone(320, 1, 7000), 16000, 1)
                  .ok);

  RunResult result = orch->Resume(kRunId, kTopic);

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(voice_->TotalCalls(), 6);
}

TEST_F(PipelineResumeContractTest, TopicMismatchDiscardsState) {
  auto orch = MakeOrchestrator();
  ASSERT_TRUE(orch->Run(kTopic, kRunId).ok);

  RunResult result = orch->Resume(kRunId, "Deep sea mining");

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(result.run.topic, "Deep sea mining");
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 2);
}

TEST_F(PipelineResumeContractTest, InvalidArtifactRestartsFromResearch) {
  auto orch = MakeOrchestrator();
  PipelineRun run;
  run.run_id = kRunId;
  run.topic = kTopic;
  run.stage_outputs[Stage::kResearching] =
      ResearchNotes{{{"t", "s", "https://example.com/a", 1}}, "notes"};
  run.stage_outputs[Stage::kSummarizing] = Summary{"summary"};
  Script broken;
  broken.lines = {{0, voice::Speaker::kHost, "One"},
                  {2, voice::Speaker::kExpert, "Two"}};
  run.stage_outputs[Stage::kScripting] = broken;

  RunResult result = orch->Resume(run);

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 1);
  const auto* script = result.run.OutputAs<Script>(Stage::kScripting);
  ASSERT_NE(script, nullptr);
  EXPECT_EQ(script->lines.size(), 3u);
}

TEST_F(PipelineResumeContractTest, ArtifactAfterGapRestartsFromResearch) {
  auto orch = MakeOrchestrator();
  PipelineRun run;
  run.run_id = kRunId;
  run.topic = kTopic;
  run.stage_outputs[Stage::kResearching] =
      ResearchNotes{{{"t", "s", "https://example.com/a", 1}}, "notes"};
  Script script;
  script.lines = {{0, voice::Speaker::kHost, "One"}};
  run.stage_outputs[Stage::kScripting] = script;

  RunResult result = orch->Resume(run);

  ASSERT_TRUE(result.ok) << result.error.Describe();
  EXPECT_TRUE(result.snapshot_discarded);
  EXPECT_EQ(content_->CallCount(collaborators::kResearchStageName), 1);
}

}  // namespace
}  // namespace podwright::pipeline
