// Repository: Podwright
// Component: SynthesisDispatcher
// Purpose: Runs per-line synthesis for a whole script on a bounded worker pool.
//          Each line is retried up to its ceiling; results land in index-keyed
//          slots and Dispatch() returns only once every worker has joined.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_SYNTHESIS_SYNTHESIS_DISPATCHER_HPP_
#define PODWRIGHT_SYNTHESIS_SYNTHESIS_DISPATCHER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "podwright/audio/AudioTypes.hpp"
#include "podwright/pipeline/PipelineTypes.hpp"
#include "podwright/synthesis/SegmentSynthesizer.hpp"
#include "podwright/voice/VoiceProfileRegistry.hpp"

namespace podwright::synthesis {

struct DispatcherConfig {
  int32_t workers = 1;
  int32_t max_line_attempts = 3;
  int64_t retry_backoff_ms = 0;
};

// The line that stopped the dispatch.
struct LineFailure {
  int32_t line_index = -1;
  int32_t attempts = 0;
  SynthesisError last_error = SynthesisError::kNone;
  std::string detail;
};

struct DispatchResult {
  bool ok = false;
  bool cancelled = false;

  // Index order; complete only when ok.
  std::vector<audio::AudioSegment> segments;

  // Attempts spent per line index (lines never started are absent).
  std::map<int32_t, int32_t> line_attempts;

  std::optional<LineFailure> failure;
};

// SynthesisDispatcher - per-script worker pool.
//
// Workers pull the next unclaimed line index, synthesize it with retry, and
// publish the segment into slot[index]. A line that exhausts its attempts
// aborts the rest: no new lines are claimed and in-flight workers stop at
// their next attempt boundary. Lines are never dropped silently.
//
// Cancel() may be called from any thread. It is sticky until Reset().
class SynthesisDispatcher {
 public:
  SynthesisDispatcher(const SegmentSynthesizer& synthesizer,
                      const voice::VoiceProfileRegistry& registry,
                      DispatcherConfig config);

  SynthesisDispatcher(const SynthesisDispatcher&) = delete;
  SynthesisDispatcher& operator=(const SynthesisDispatcher&) = delete;

  // Blocks until all lines are done, one line has failed, or cancel.
  DispatchResult Dispatch(const pipeline::Script& script);

  void Cancel();
  void Reset();
  bool IsCancelled() const {
    return cancel_requested_.load(std::memory_order_acquire);
  }

  const DispatcherConfig& config() const { return config_; }

 private:
  // Shared state of one Dispatch() call.
  struct Batch {
    const pipeline::Script* script = nullptr;
    size_t next_line = 0;
    std::vector<std::optional<audio::AudioSegment>> slots;
    std::map<int32_t, int32_t> attempts;
    std::optional<LineFailure> failure;
    bool aborted = false;
  };

  void WorkerLoop(Batch* batch);

  // Returns false on failure/abort; fills `out` on success.
  bool SynthesizeLine(Batch* batch, const pipeline::ScriptLine& line,
                      audio::AudioSegment* out);

  // Interruptible backoff. Returns false if cancelled or aborted while waiting.
  bool WaitBackoff(Batch* batch);

  bool ShouldStop(const Batch* batch) const;

  const SegmentSynthesizer& synthesizer_;
  const voice::VoiceProfileRegistry& registry_;
  DispatcherConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable wake_cv_;
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace podwright::synthesis

#endif  // PODWRIGHT_SYNTHESIS_SYNTHESIS_DISPATCHER_HPP_
