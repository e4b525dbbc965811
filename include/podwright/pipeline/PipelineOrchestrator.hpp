// Repository: Podwright
// Component: Pipeline Orchestrator
// Purpose: Drives one podcast run through Researching -> Summarizing ->
//          Scripting -> Producing -> Stitching. Each stage handler's output is
//          validated before it is stored and forwarded; failures become retry
//          decisions against the configured ceilings. Completed stages are
//          snapshotted so a run can resume at the first missing artifact.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_
#define PODWRIGHT_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_

#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "podwright/audio/StitchingEngine.hpp"
#include "podwright/collaborators/Collaborators.hpp"
#include "podwright/pipeline/PipelineConfig.hpp"
#include "podwright/pipeline/PipelineTypes.hpp"
#include "podwright/pipeline/RunSnapshotStore.hpp"
#include "podwright/pipeline/StageValidator.hpp"
#include "podwright/synthesis/SegmentSynthesizer.hpp"
#include "podwright/synthesis/SynthesisDispatcher.hpp"
#include "podwright/time/ITimeSource.hpp"
#include "podwright/voice/VoiceProfileRegistry.hpp"

namespace podwright::pipeline {

inline constexpr const char* kMasterFileName = "final_podcast.wav";

struct RunResult {
  bool ok = false;
  audio::MasterRecording master;  // Valid when ok
  PipelineError error;            // Valid when !ok
  PipelineRun run;

  // Resume only: a persisted snapshot was unusable and a fresh run started.
  bool snapshot_discarded = false;
};

// PipelineOrchestrator - sequential stage driver.
//
// Run()/Resume() execute on the calling thread and must not overlap on one
// instance. Cancel() may be called from any thread; it is observed at stage
// boundaries, between attempts, and by in-flight line synthesis. Each Run()
// or Resume() call starts uncancelled; a Cancel() issued during the call,
// including while a snapshot is being loaded, ends that call.
class PipelineOrchestrator {
 public:
  // Builds the voice registry from config.voice_reference_dir (generating
  // missing reference clips through collaborators.reference_generator).
  // Throws std::runtime_error when required collaborators are missing, the
  // registry cannot be built, or output_root cannot be created.
  PipelineOrchestrator(PipelineConfig config,
                       collaborators::Collaborators collaborators,
                       std::shared_ptr<ITimeSource> time_source);

  // Same, with a prebuilt registry.
  PipelineOrchestrator(PipelineConfig config,
                       collaborators::Collaborators collaborators,
                       std::shared_ptr<ITimeSource> time_source,
                       voice::VoiceProfileRegistry registry);

  ~PipelineOrchestrator();

  PipelineOrchestrator(const PipelineOrchestrator&) = delete;
  PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

  // Fresh run with a generated id: podcast_YYYYMMDD_HHMMSS (UTC).
  RunResult Run(const std::string& topic);

  // Fresh run under a caller-chosen id.
  RunResult Run(const std::string& topic, const std::string& run_id);

  // Re-validates every artifact in `run` in stage order and continues at the
  // first stage without a valid artifact. An invalid artifact discards the
  // whole state and restarts from Researching under the same run id.
  RunResult Resume(PipelineRun run);

  // Loads the snapshot for `run_id` and resumes it. A missing snapshot starts
  // a fresh run; an unreadable one, or one for another topic, is discarded
  // and a fresh run starts (same run id).
  RunResult Resume(const std::string& run_id, const std::string& topic);

  void Cancel();

  std::string GenerateRunId() const;

  const voice::VoiceProfileRegistry& registry() const { return registry_; }
  const PipelineConfig& config() const { return config_; }
  const RunSnapshotStore& store() const { return *store_; }

 private:
  struct StageOutcome {
    bool ok;
    PipelineErrorKind kind;
    std::string detail;
    StageArtifact artifact;

    static StageOutcome Success(StageArtifact a) {
      return {true, PipelineErrorKind::kNone, "", std::move(a)};
    }
    static StageOutcome Failure(PipelineErrorKind k, const std::string& detail) {
      return {false, k, detail, StageArtifact{}};
    }
  };

  using StageHandler = StageOutcome (PipelineOrchestrator::*)(PipelineRun&, int32_t);

  void Init();

  void BeginCall();
  RunResult RunFresh(const std::string& topic, const std::string& run_id);
  RunResult ResumeRun(PipelineRun run);

  RunResult Execute(PipelineRun run, bool snapshot_discarded);
  StageOutcome RunStageWithRetry(PipelineRun& run, Stage stage,
                                 PipelineError* error);
  RunResult FailRun(PipelineRun run, const PipelineError& error,
                    bool snapshot_discarded);
  RunResult FreshRunAfterCorruptState(const std::string& run_id,
                                      const std::string& topic,
                                      const std::string& reason);
  void Persist(const PipelineRun& run);

  // Interruptible backoff; false if cancelled while waiting.
  bool WaitBackoff();
  bool IsCancelled() const {
    return cancel_requested_.load(std::memory_order_acquire);
  }

  // Stage handlers (dispatch table entries).
  StageOutcome RunResearch(PipelineRun& run, int32_t attempt);
  StageOutcome RunSummarize(PipelineRun& run, int32_t attempt);
  StageOutcome RunScript(PipelineRun& run, int32_t attempt);
  StageOutcome RunProducing(PipelineRun& run, int32_t attempt);
  StageOutcome RunStitching(PipelineRun& run, int32_t attempt);

  std::string CollaboratorDetail(const collaborators::StageReply& reply) const;

  PipelineConfig config_;
  collaborators::Collaborators collaborators_;
  std::shared_ptr<ITimeSource> time_source_;
  voice::VoiceProfileRegistry registry_;

  std::unique_ptr<StageValidator> validator_;
  std::unique_ptr<synthesis::SegmentSynthesizer> synthesizer_;
  std::unique_ptr<synthesis::SynthesisDispatcher> dispatcher_;
  std::unique_ptr<audio::StitchingEngine> stitcher_;
  std::unique_ptr<RunSnapshotStore> store_;

  std::array<StageHandler, 5> handlers_{};

  std::mutex cancel_mutex_;
  std::condition_variable cancel_cv_;
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_
