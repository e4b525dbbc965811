// Repository: Podwright
// Component: SynthesisDispatcher Implementation
// Copyright (c) 2025 Podwright

#include "podwright/synthesis/SynthesisDispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

#include "podwright/util/Logger.hpp"

namespace podwright::synthesis {

using podwright::util::Logger;

SynthesisDispatcher::SynthesisDispatcher(
    const SegmentSynthesizer& synthesizer,
    const voice::VoiceProfileRegistry& registry, DispatcherConfig config)
    : synthesizer_(synthesizer), registry_(registry), config_(config) {
  if (config_.workers < 1) config_.workers = 1;
  if (config_.max_line_attempts < 1) config_.max_line_attempts = 1;
}

void SynthesisDispatcher::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_.store(true, std::memory_order_release);
  }
  wake_cv_.notify_all();
}

void SynthesisDispatcher::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancel_requested_.store(false, std::memory_order_release);
}

// Caller holds mutex_.
bool SynthesisDispatcher::ShouldStop(const Batch* batch) const {
  return batch->aborted || cancel_requested_.load(std::memory_order_acquire);
}

DispatchResult SynthesisDispatcher::Dispatch(const pipeline::Script& script) {
  Batch batch;
  batch.script = &script;
  batch.slots.resize(script.lines.size());

  const size_t worker_count = std::max<size_t>(
      1, std::min<size_t>(static_cast<size_t>(config_.workers),
                          script.lines.size()));

  {
    std::ostringstream oss;
    oss << "[SynthesisDispatcher] DISPATCH_START lines=" << script.lines.size()
        << " workers=" << worker_count
        << " max_line_attempts=" << config_.max_line_attempts;
    Logger::Info(oss.str());
  }

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(&SynthesisDispatcher::WorkerLoop, this, &batch);
  }
  // Join barrier: the only synchronization point with the workers.
  for (auto& t : workers) {
    t.join();
  }

  DispatchResult result;
  result.line_attempts = batch.attempts;
  result.failure = batch.failure;

  if (batch.failure.has_value()) {
    std::ostringstream oss;
    oss << "[SynthesisDispatcher] DISPATCH_FAILED line=" << batch.failure->line_index
        << " attempts=" << batch.failure->attempts
        << " error=" << SynthesisErrorToString(batch.failure->last_error)
        << " detail=" << batch.failure->detail;
    Logger::Error(oss.str());
    return result;
  }

  bool complete = std::all_of(batch.slots.begin(), batch.slots.end(),
                              [](const auto& s) { return s.has_value(); });
  if (!complete) {
    // Only reachable through cancel.
    result.cancelled = true;
    Logger::Warn("[SynthesisDispatcher] DISPATCH_CANCELLED");
    return result;
  }

  result.segments.reserve(batch.slots.size());
  for (auto& slot : batch.slots) {
    result.segments.push_back(std::move(*slot));
  }
  result.ok = true;
  Logger::Info("[SynthesisDispatcher] DISPATCH_COMPLETE segments=" +
               std::to_string(result.segments.size()));
  return result;
}

// =============================================================================
// WorkerLoop: claims lines until none remain or the batch stops
// =============================================================================

void SynthesisDispatcher::WorkerLoop(Batch* batch) {
  while (true) {
    size_t line_pos;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ShouldStop(batch) || batch->next_line >= batch->slots.size()) {
        return;
      }
      line_pos = batch->next_line++;
    }

    const pipeline::ScriptLine& line = batch->script->lines[line_pos];
    audio::AudioSegment segment;
    if (!SynthesizeLine(batch, line, &segment)) {
      return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    batch->slots[line_pos] = std::move(segment);
  }
}

bool SynthesisDispatcher::SynthesizeLine(Batch* batch,
                                         const pipeline::ScriptLine& line,
                                         audio::AudioSegment* out) {
  const voice::VoiceProfile* profile = registry_.Resolve(line.speaker);
  if (profile == nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!batch->failure.has_value()) {
      batch->failure = LineFailure{line.index, 0, SynthesisError::kSpeakerMismatch,
                                   std::string("no voice profile for ") +
                                       voice::SpeakerName(line.speaker)};
    }
    batch->aborted = true;
    wake_cv_.notify_all();
    return false;
  }

  SynthesisResult last;
  for (int32_t attempt = 1; attempt <= config_.max_line_attempts; ++attempt) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ShouldStop(batch)) return false;
      batch->attempts[line.index] = attempt;
    }

    last = synthesizer_.Synthesize(line, *profile);
    if (last.ok) {
      *out = std::move(last.segment);
      return true;
    }

    std::ostringstream oss;
    oss << "[SynthesisDispatcher] LINE_ATTEMPT_FAILED line=" << line.index
        << " speaker=" << voice::SpeakerName(line.speaker)
        << " attempt=" << attempt << "/" << config_.max_line_attempts
        << " error=" << SynthesisErrorToString(last.error)
        << " detail=" << last.detail;
    Logger::Warn(oss.str());

    if (attempt < config_.max_line_attempts && !WaitBackoff(batch)) {
      return false;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!batch->failure.has_value()) {
    batch->failure = LineFailure{line.index, config_.max_line_attempts,
                                 last.error, last.detail};
  }
  batch->aborted = true;
  wake_cv_.notify_all();
  return false;
}

bool SynthesisDispatcher::WaitBackoff(Batch* batch) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (config_.retry_backoff_ms > 0) {
    wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.retry_backoff_ms),
                      [this, batch] { return ShouldStop(batch); });
  }
  return !ShouldStop(batch);
}

}  // namespace podwright::synthesis
