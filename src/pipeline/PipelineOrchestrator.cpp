// Repository: Podwright
// Component: Pipeline Orchestrator Implementation
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/PipelineOrchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <set>
#include <sstream>
#include <stdexcept>

#include "podwright/audio/WavWriter.hpp"
#include "podwright/pipeline/ScriptParser.hpp"
#include "podwright/util/Logger.hpp"

namespace podwright::pipeline {

using podwright::util::Logger;

namespace {

// Query variants issued per topic, in order.
constexpr const char* kResearchQuerySuffixes[] = {
    "", " latest developments", " expert analysis", " statistics",
};

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

voice::VoiceProfileRegistry BuildRegistryOrThrow(
    const PipelineConfig& config, const collaborators::Collaborators& collab) {
  voice::RegistryConfig registry_config;
  registry_config.reference_dir = config.voice_reference_dir;
  auto result = voice::VoiceProfileRegistry::Build(
      registry_config, collab.reference_generator.get());
  if (!result.ok) {
    throw std::runtime_error("PipelineOrchestrator: voice registry: " +
                             result.detail);
  }
  return std::move(result.registry);
}

std::string SegmentFileName(const audio::AudioSegment& seg) {
  char name[64];
  std::snprintf(name, sizeof(name), "segment_%03d_%s.wav", seg.index,
                voice::SpeakerFileTag(seg.speaker));
  return name;
}

// First occurrence of each url wins; order preserved.
void AppendUnique(const std::vector<SourceRecord>& in,
                  std::set<std::string>* seen_urls,
                  std::vector<SourceRecord>* out) {
  for (const auto& record : in) {
    if (seen_urls->insert(record.url).second) {
      out->push_back(record);
    }
  }
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

PipelineOrchestrator::PipelineOrchestrator(
    PipelineConfig config, collaborators::Collaborators collaborators,
    std::shared_ptr<ITimeSource> time_source)
    : PipelineOrchestrator(config, collaborators, std::move(time_source),
                           BuildRegistryOrThrow(config, collaborators)) {}

PipelineOrchestrator::PipelineOrchestrator(
    PipelineConfig config, collaborators::Collaborators collaborators,
    std::shared_ptr<ITimeSource> time_source,
    voice::VoiceProfileRegistry registry)
    : config_(std::move(config)),
      collaborators_(std::move(collaborators)),
      time_source_(std::move(time_source)),
      registry_(std::move(registry)) {
  Init();
}

PipelineOrchestrator::~PipelineOrchestrator() = default;

void PipelineOrchestrator::Init() {
  if (!collaborators_.content) {
    throw std::runtime_error("PipelineOrchestrator: no content collaborator");
  }
  if (!collaborators_.voice) {
    throw std::runtime_error("PipelineOrchestrator: no voice collaborator");
  }
  if (!time_source_) {
    throw std::runtime_error("PipelineOrchestrator: no time source");
  }
  if (config_.max_stage_attempts < 1) config_.max_stage_attempts = 1;
  if (config_.max_line_attempts < 1) config_.max_line_attempts = 1;

  validator_ = std::make_unique<StageValidator>(registry_);
  synthesizer_ = std::make_unique<synthesis::SegmentSynthesizer>(collaborators_.voice);

  synthesis::DispatcherConfig dispatcher_config;
  dispatcher_config.workers = config_.synthesis_workers;
  dispatcher_config.max_line_attempts = config_.max_line_attempts;
  dispatcher_config.retry_backoff_ms = config_.retry_backoff_ms;
  dispatcher_ = std::make_unique<synthesis::SynthesisDispatcher>(
      *synthesizer_, registry_, dispatcher_config);

  audio::StitchConfig stitch_config;
  stitch_config.inter_turn_gap_ms = config_.inter_turn_gap_ms;
  stitcher_ = std::make_unique<audio::StitchingEngine>(stitch_config);

  // Throws std::runtime_error if output_root cannot be created.
  store_ = std::make_unique<RunSnapshotStore>(config_.output_root);

  handlers_[static_cast<size_t>(Stage::kResearching)] = &PipelineOrchestrator::RunResearch;
  handlers_[static_cast<size_t>(Stage::kSummarizing)] = &PipelineOrchestrator::RunSummarize;
  handlers_[static_cast<size_t>(Stage::kScripting)] = &PipelineOrchestrator::RunScript;
  handlers_[static_cast<size_t>(Stage::kProducing)] = &PipelineOrchestrator::RunProducing;
  handlers_[static_cast<size_t>(Stage::kStitching)] = &PipelineOrchestrator::RunStitching;
}

std::string PipelineOrchestrator::GenerateRunId() const {
  std::time_t secs = static_cast<std::time_t>(time_source_->NowUtcMs() / 1000);
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "podcast_%Y%m%d_%H%M%S", &tm_utc);
  return buf;
}

// =============================================================================
// Public entry points
// =============================================================================

RunResult PipelineOrchestrator::Run(const std::string& topic) {
  return Run(topic, GenerateRunId());
}

RunResult PipelineOrchestrator::Run(const std::string& topic,
                                    const std::string& run_id) {
  BeginCall();
  return RunFresh(topic, run_id);
}

RunResult PipelineOrchestrator::Resume(PipelineRun run) {
  BeginCall();
  return ResumeRun(std::move(run));
}

RunResult PipelineOrchestrator::Resume(const std::string& run_id,
                                       const std::string& topic) {
  BeginCall();
  SnapshotLoadResult loaded = store_->Load(run_id);
  switch (loaded.status) {
    case SnapshotLoadStatus::kNotFound:
      Logger::Info("[PipelineOrchestrator] RESUME_NO_SNAPSHOT run_id=" + run_id +
                   " starting fresh");
      return RunFresh(topic, run_id);
    case SnapshotLoadStatus::kCorrupt:
      return FreshRunAfterCorruptState(run_id, topic, loaded.detail);
    case SnapshotLoadStatus::kOk:
      break;
  }
  if (Trim(loaded.run.topic) != Trim(topic)) {
    return FreshRunAfterCorruptState(
        run_id, topic, "snapshot topic \"" + loaded.run.topic + "\" differs");
  }
  return ResumeRun(std::move(loaded.run));
}

void PipelineOrchestrator::Cancel() {
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    cancel_requested_.store(true, std::memory_order_release);
  }
  cancel_cv_.notify_all();
  dispatcher_->Cancel();
  Logger::Info("[PipelineOrchestrator] CANCEL_REQUESTED");
}

// Clears a cancel left over from the previous call. Only the public entry
// points call this; a Cancel() arriving after it holds for the whole call.
void PipelineOrchestrator::BeginCall() {
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    cancel_requested_.store(false, std::memory_order_release);
  }
  dispatcher_->Reset();
}

RunResult PipelineOrchestrator::RunFresh(const std::string& topic,
                                         const std::string& run_id) {
  PipelineRun run;
  run.run_id = run_id;
  run.topic = Trim(topic);
  run.current_stage = Stage::kResearching;

  auto topic_check = validator_->ValidateTopic(run.topic);
  if (!topic_check.valid) {
    PipelineError error;
    error.kind = PipelineErrorKind::kValidation;
    error.stage = Stage::kResearching;
    error.detail = topic_check.detail;
    return FailRun(std::move(run), error, false);
  }

  {
    std::ostringstream oss;
    oss << "[PipelineOrchestrator] RUN_START run_id=" << run.run_id
        << " topic=\"" << run.topic << "\"";
    Logger::Info(oss.str());
  }
  return Execute(std::move(run), false);
}

RunResult PipelineOrchestrator::ResumeRun(PipelineRun run) {
  run.topic = Trim(run.topic);
  auto topic_check = validator_->ValidateTopic(run.topic);
  if (!topic_check.valid) {
    PipelineError error;
    error.kind = PipelineErrorKind::kResumeStateCorrupt;
    error.stage = Stage::kResearching;
    error.detail = "snapshot has no topic";
    return FailRun(std::move(run), error, true);
  }

  // Walk the stages in order: every artifact up to the restart point must be
  // present and valid, and nothing may exist past a missing one.
  Stage restart = Stage::kComplete;
  for (Stage stage : kWorkingStages) {
    auto it = run.stage_outputs.find(stage);
    if (restart != Stage::kComplete) {
      if (it != run.stage_outputs.end()) {
        return FreshRunAfterCorruptState(
            run.run_id, run.topic,
            std::string(StageName(stage)) + " artifact present after missing " +
                StageName(restart));
      }
      continue;
    }
    if (it == run.stage_outputs.end()) {
      restart = stage;
      continue;
    }
    auto check = validator_->ValidateStageOutput(stage, it->second, run);
    if (!check.valid) {
      return FreshRunAfterCorruptState(
          run.run_id, run.topic,
          std::string(StageName(stage)) + " artifact invalid: " + check.detail);
    }
  }

  run.failure_reason.reset();
  run.failed_stage.reset();

  if (restart == Stage::kComplete) {
    const auto* master = run.OutputAs<audio::MasterRecording>(Stage::kStitching);
    run.current_stage = Stage::kComplete;
    Logger::Info("[PipelineOrchestrator] RESUME_ALREADY_COMPLETE run_id=" +
                 run.run_id);
    RunResult result;
    result.ok = true;
    result.master = *master;
    result.run = std::move(run);
    return result;
  }

  // Stages being re-run start with fresh attempt budgets.
  for (auto it = run.attempt_counts.begin(); it != run.attempt_counts.end();) {
    if (static_cast<int32_t>(it->first) >= static_cast<int32_t>(restart)) {
      it = run.attempt_counts.erase(it);
    } else {
      ++it;
    }
  }
  if (static_cast<int32_t>(restart) <= static_cast<int32_t>(Stage::kProducing)) {
    run.line_attempt_counts.clear();
  }
  run.current_stage = restart;

  std::ostringstream oss;
  oss << "[PipelineOrchestrator] RESUME run_id=" << run.run_id
      << " restart_stage=" << StageName(restart)
      << " reused_artifacts=" << run.stage_outputs.size();
  Logger::Info(oss.str());

  return Execute(std::move(run), false);
}

// =============================================================================
// Stage loop
// =============================================================================

RunResult PipelineOrchestrator::Execute(PipelineRun run, bool snapshot_discarded) {
  while (!IsTerminal(run.current_stage)) {
    const Stage stage = run.current_stage;

    if (IsCancelled()) {
      PipelineError error;
      error.kind = PipelineErrorKind::kCancelled;
      error.stage = stage;
      error.attempts = run.AttemptsFor(stage);
      error.detail = "cancelled before stage start";
      return FailRun(std::move(run), error, snapshot_discarded);
    }

    PipelineError error;
    StageOutcome outcome = RunStageWithRetry(run, stage, &error);
    if (!outcome.ok) {
      return FailRun(std::move(run), error, snapshot_discarded);
    }

    run.stage_outputs[stage] = std::move(outcome.artifact);
    run.current_stage = NextStage(stage);
    Persist(run);
  }

  RunResult result;
  result.ok = true;
  result.master = *run.OutputAs<audio::MasterRecording>(Stage::kStitching);
  result.snapshot_discarded = snapshot_discarded;

  std::ostringstream oss;
  oss << "[PipelineOrchestrator] RUN_COMPLETE run_id=" << run.run_id
      << " path=" << result.master.output_path
      << " duration_ms=" << result.master.total_duration_ms()
      << " segments=" << result.master.boundaries.size();
  Logger::Info(oss.str());

  result.run = std::move(run);
  return result;
}

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunStageWithRetry(
    PipelineRun& run, Stage stage, PipelineError* error) {
  StageHandler handler = handlers_[static_cast<size_t>(stage)];

  while (true) {
    const int32_t attempt = run.AttemptsFor(stage) + 1;
    {
      std::ostringstream oss;
      oss << "[PipelineOrchestrator] STAGE_START run_id=" << run.run_id
          << " stage=" << StageName(stage) << " attempt=" << attempt;
      Logger::Info(oss.str());
    }

    StageOutcome outcome = (this->*handler)(run, attempt);
    if (outcome.ok) {
      auto check = validator_->ValidateStageOutput(stage, outcome.artifact, run);
      if (!check.valid) {
        outcome = StageOutcome::Failure(PipelineErrorKind::kValidation, check.detail);
      }
    }

    if (outcome.ok) {
      Logger::Info(std::string("[PipelineOrchestrator] STAGE_COMPLETE run_id=") +
                   run.run_id + " stage=" + StageName(stage));
      return outcome;
    }

    run.attempt_counts[stage] = attempt;

    std::ostringstream oss;
    oss << "[PipelineOrchestrator] STAGE_FAILED run_id=" << run.run_id
        << " stage=" << StageName(stage) << " attempt=" << attempt << "/"
        << config_.max_stage_attempts
        << " error=" << PipelineErrorKindToString(outcome.kind)
        << " detail=" << outcome.detail;
    Logger::Warn(oss.str());

    error->stage = stage;
    error->attempts = attempt;
    error->detail = outcome.detail;

    if (!IsRetryable(outcome.kind)) {
      // FormatMismatch, Cancelled, and line-level RetryExhausted end the run
      // as they are.
      error->kind = outcome.kind;
      if (outcome.kind == PipelineErrorKind::kRetryExhausted) {
        error->cause = PipelineErrorKind::kCollaborator;
      }
      return outcome;
    }
    if (attempt >= config_.max_stage_attempts) {
      error->kind = PipelineErrorKind::kRetryExhausted;
      error->cause = outcome.kind;
      return outcome;
    }
    if (!WaitBackoff()) {
      error->kind = PipelineErrorKind::kCancelled;
      error->cause = outcome.kind;
      return StageOutcome::Failure(PipelineErrorKind::kCancelled, outcome.detail);
    }
  }
}

RunResult PipelineOrchestrator::FailRun(PipelineRun run, const PipelineError& error,
                                        bool snapshot_discarded) {
  run.current_stage = Stage::kFailed;
  run.failed_stage = error.stage;
  run.failure_reason = error.Describe();

  Logger::Error("[PipelineOrchestrator] RUN_FAILED run_id=" + run.run_id +
                " reason=" + *run.failure_reason);

  if (!run.run_id.empty() && !run.topic.empty()) {
    Persist(run);
  }

  RunResult result;
  result.ok = false;
  result.error = error;
  result.snapshot_discarded = snapshot_discarded;
  result.run = std::move(run);
  return result;
}

RunResult PipelineOrchestrator::FreshRunAfterCorruptState(
    const std::string& run_id, const std::string& topic,
    const std::string& reason) {
  std::ostringstream oss;
  oss << "[PipelineOrchestrator] " << PipelineErrorKindToString(
             PipelineErrorKind::kResumeStateCorrupt)
      << " run_id=" << run_id << " detail=" << reason
      << " discarding snapshot, restarting from Researching";
  Logger::Warn(oss.str());

  store_->Discard(run_id);
  RunResult result = RunFresh(topic, run_id);
  result.snapshot_discarded = true;
  return result;
}

void PipelineOrchestrator::Persist(const PipelineRun& run) {
  if (!config_.persist_snapshots) return;
  SnapshotSaveResult saved = store_->Save(run);
  if (!saved.ok) {
    Logger::Warn("[PipelineOrchestrator] SNAPSHOT_SAVE_FAILED run_id=" +
                 run.run_id + " detail=" + saved.detail);
  }
}

bool PipelineOrchestrator::WaitBackoff() {
  std::unique_lock<std::mutex> lock(cancel_mutex_);
  if (config_.retry_backoff_ms > 0) {
    cancel_cv_.wait_for(lock, std::chrono::milliseconds(config_.retry_backoff_ms),
                        [this] { return IsCancelled(); });
  }
  return !IsCancelled();
}

std::string PipelineOrchestrator::CollaboratorDetail(
    const collaborators::StageReply& reply) const {
  if (reply.timed_out) {
    return "timed out after " + std::to_string(config_.collaborator_timeout_ms) +
           "ms: " + reply.error;
  }
  return reply.error.empty() ? "collaborator reported failure" : reply.error;
}

// =============================================================================
// Stage handlers
// =============================================================================

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunResearch(
    PipelineRun& run, int32_t attempt) {
  std::vector<SourceRecord> sources;
  std::set<std::string> seen_urls;

  if (collaborators_.search) {
    const size_t query_count = std::min<size_t>(
        static_cast<size_t>(std::max(config_.research_query_count, 1)),
        sizeof(kResearchQuerySuffixes) / sizeof(kResearchQuerySuffixes[0]));
    size_t failed_queries = 0;
    std::string last_search_error;

    for (size_t q = 0; q < query_count; ++q) {
      if (IsCancelled()) {
        return StageOutcome::Failure(PipelineErrorKind::kCancelled,
                                     "cancelled during research");
      }
      const std::string query = run.topic + kResearchQuerySuffixes[q];
      auto reply = collaborators_.search->Search(query, config_.search_max_results);
      if (!reply.ok) {
        ++failed_queries;
        last_search_error = reply.error;
        Logger::Warn("[PipelineOrchestrator] SEARCH_FAILED query=\"" + query +
                     "\" error=" + reply.error);
        continue;
      }
      const int64_t now = time_source_->NowUtcMs();
      for (auto& record : reply.results) {
        if (record.retrieved_at_ms == 0) record.retrieved_at_ms = now;
      }
      AppendUnique(reply.results, &seen_urls, &sources);
    }

    if (failed_queries == query_count) {
      return StageOutcome::Failure(PipelineErrorKind::kCollaborator,
                                   "every search query failed: " + last_search_error);
    }
  }

  collaborators::StageRequest request;
  request.stage_name = collaborators::kResearchStageName;
  request.run_id = run.run_id;
  request.attempt = attempt;
  request.input_text = run.topic;
  request.sources = sources;

  auto reply = collaborators_.content->RunStage(request);
  if (!reply.ok) {
    return StageOutcome::Failure(PipelineErrorKind::kCollaborator,
                                 CollaboratorDetail(reply));
  }

  // Sources the research backend found itself are appended after search hits.
  const int64_t now = time_source_->NowUtcMs();
  for (auto& record : reply.sources) {
    if (record.retrieved_at_ms == 0) record.retrieved_at_ms = now;
  }
  AppendUnique(reply.sources, &seen_urls, &sources);

  ResearchNotes notes;
  notes.sources = std::move(sources);
  notes.notes = std::move(reply.text);

  std::ostringstream oss;
  oss << "[PipelineOrchestrator] RESEARCH_READY run_id=" << run.run_id
      << " sources=" << notes.sources.size()
      << " notes_chars=" << notes.notes.size();
  Logger::Debug(oss.str());

  return StageOutcome::Success(std::move(notes));
}

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunSummarize(
    PipelineRun& run, int32_t attempt) {
  const auto* notes = run.OutputAs<ResearchNotes>(Stage::kResearching);
  if (notes == nullptr) {
    return StageOutcome::Failure(PipelineErrorKind::kValidation,
                                 "no research notes to summarize");
  }

  collaborators::StageRequest request;
  request.stage_name = collaborators::kSummarizeStageName;
  request.run_id = run.run_id;
  request.attempt = attempt;
  request.input_text = notes->notes;
  request.sources = notes->sources;

  auto reply = collaborators_.content->RunStage(request);
  if (!reply.ok) {
    return StageOutcome::Failure(PipelineErrorKind::kCollaborator,
                                 CollaboratorDetail(reply));
  }
  return StageOutcome::Success(Summary{Trim(reply.text)});
}

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunScript(
    PipelineRun& run, int32_t attempt) {
  const auto* summary = run.OutputAs<Summary>(Stage::kSummarizing);
  if (summary == nullptr) {
    return StageOutcome::Failure(PipelineErrorKind::kValidation,
                                 "no summary to script");
  }

  collaborators::StageRequest request;
  request.stage_name = collaborators::kScriptStageName;
  request.run_id = run.run_id;
  request.attempt = attempt;
  request.input_text = summary->text;

  auto reply = collaborators_.content->RunStage(request);
  if (!reply.ok) {
    return StageOutcome::Failure(PipelineErrorKind::kCollaborator,
                                 CollaboratorDetail(reply));
  }

  if (!reply.lines.empty()) {
    Script script;
    for (size_t i = 0; i < reply.lines.size(); ++i) {
      ScriptLine line = reply.lines[i];
      line.index = static_cast<int32_t>(i);
      line.text = Trim(line.text);
      script.lines.push_back(std::move(line));
    }
    return StageOutcome::Success(std::move(script));
  }

  ScriptParseResult parsed = ScriptParser::Parse(reply.text);
  if (!parsed.ok) {
    return StageOutcome::Failure(PipelineErrorKind::kCollaborator, parsed.detail);
  }

  std::ostringstream oss;
  oss << "[PipelineOrchestrator] SCRIPT_READY run_id=" << run.run_id
      << " lines=" << parsed.script.lines.size();
  Logger::Debug(oss.str());

  return StageOutcome::Success(std::move(parsed.script));
}

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunProducing(
    PipelineRun& run, int32_t /*attempt*/) {
  const auto* script = run.OutputAs<Script>(Stage::kScripting);
  if (script == nullptr) {
    return StageOutcome::Failure(PipelineErrorKind::kValidation,
                                 "no script to produce");
  }

  synthesis::DispatchResult dispatched = dispatcher_->Dispatch(*script);
  for (const auto& [line, count] : dispatched.line_attempts) {
    run.line_attempt_counts[line] = count;
  }

  if (dispatched.cancelled || (!dispatched.ok && IsCancelled())) {
    return StageOutcome::Failure(PipelineErrorKind::kCancelled,
                                 "cancelled during synthesis");
  }
  if (!dispatched.ok) {
    std::ostringstream detail;
    if (dispatched.failure.has_value()) {
      const auto& f = *dispatched.failure;
      detail << "line " << f.line_index << " failed after " << f.attempts
             << " attempts: " << synthesis::SynthesisErrorToString(f.last_error);
      if (!f.detail.empty()) detail << ": " << f.detail;
    } else {
      detail << "synthesis incomplete";
    }
    return StageOutcome::Failure(PipelineErrorKind::kRetryExhausted, detail.str());
  }

  std::string dir;
  try {
    dir = store_->EnsureRunDir(run.run_id);
  } catch (const std::runtime_error& e) {
    return StageOutcome::Failure(PipelineErrorKind::kIo, e.what());
  }

  SegmentManifest manifest;
  manifest.segment_paths.reserve(dispatched.segments.size());
  for (const auto& seg : dispatched.segments) {
    std::string path = dir + "/" + SegmentFileName(seg);
    auto written = audio::WavWriter::Write(path, seg.samples, seg.sample_rate,
                                           seg.channel_count);
    if (!written.ok) {
      return StageOutcome::Failure(PipelineErrorKind::kIo, written.detail);
    }
    manifest.segment_paths.push_back(std::move(path));
  }
  manifest.segments = std::move(dispatched.segments);

  Logger::Info("[PipelineOrchestrator] SEGMENTS_WRITTEN run_id=" + run.run_id +
               " count=" + std::to_string(manifest.segments.size()) +
               " dir=" + dir);
  return StageOutcome::Success(std::move(manifest));
}

PipelineOrchestrator::StageOutcome PipelineOrchestrator::RunStitching(
    PipelineRun& run, int32_t /*attempt*/) {
  const auto* manifest = run.OutputAs<SegmentManifest>(Stage::kProducing);
  if (manifest == nullptr) {
    return StageOutcome::Failure(PipelineErrorKind::kValidation,
                                 "no segments to stitch");
  }

  audio::StitchResult stitched = stitcher_->Stitch(manifest->segments);
  if (!stitched.ok) {
    PipelineErrorKind kind = stitched.error == audio::StitchError::kFormatMismatch
                                 ? PipelineErrorKind::kFormatMismatch
                                 : PipelineErrorKind::kValidation;
    return StageOutcome::Failure(
        kind, std::string(audio::StitchErrorToString(stitched.error)) + ": " +
                  stitched.detail);
  }

  // The master file is only written for a recording that passes validation.
  auto check = validator_->ValidateMaster(stitched.master, *manifest);
  if (!check.valid) {
    return StageOutcome::Failure(PipelineErrorKind::kValidation, check.detail);
  }

  std::string dir;
  try {
    dir = store_->EnsureRunDir(run.run_id);
  } catch (const std::runtime_error& e) {
    return StageOutcome::Failure(PipelineErrorKind::kIo, e.what());
  }

  const std::string path = dir + "/" + kMasterFileName;
  auto written = audio::WavWriter::WriteAtomic(
      path, stitched.master.samples, stitched.master.sample_rate,
      stitched.master.channel_count);
  if (!written.ok) {
    return StageOutcome::Failure(PipelineErrorKind::kIo, written.detail);
  }
  stitched.master.output_path = path;

  std::ostringstream oss;
  oss << "[PipelineOrchestrator] MASTER_WRITTEN run_id=" << run.run_id
      << " path=" << path << " bytes=" << written.bytes_written
      << " crc32=" << stitched.master.fingerprint;
  Logger::Info(oss.str());

  return StageOutcome::Success(std::move(stitched.master));
}

}  // namespace podwright::pipeline
