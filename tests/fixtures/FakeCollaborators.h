// In-process collaborators for pipeline, dispatcher and registry tests.
// All fakes are thread-safe and deterministic: the same text always yields
// the same audio.

#ifndef PODWRIGHT_TESTS_FIXTURES_FAKE_COLLABORATORS_H_
#define PODWRIGHT_TESTS_FIXTURES_FAKE_COLLABORATORS_H_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "podwright/collaborators/Collaborators.hpp"
#include "podwright/voice/VoiceProfileRegistry.hpp"
#include "WavFixtures.h"

namespace podwright::tests::fixtures {

using collaborators::ReferenceReply;
using collaborators::SearchReply;
using collaborators::StageReply;
using collaborators::StageRequest;
using collaborators::SynthesisReply;

// Three-line script used across tests: one speaker change (0 -> 1), then a
// same-speaker continuation (1 -> 2).
inline constexpr const char* kThreeLineScriptJson =
    "```json\n"
    "[\n"
    "  {\"speaker\": \"Host\", \"text\": \"Hello\"},\n"
    "  {\"speaker\": \"Expert\", \"text\": \"Hi there\"},\n"
    "  {\"speaker\": \"Expert\", \"text\": \"Indeed\"}\n"
    "]\n"
    "```";

// Registry with both default roles and no reference clips.
inline voice::VoiceProfileRegistry MakeRegistry() {
  std::vector<voice::VoiceProfile> profiles;
  for (const auto& role : voice::DefaultVoiceRoles()) {
    voice::VoiceProfile p;
    p.speaker = role.speaker;
    p.synthesis_params = role.params;
    profiles.push_back(p);
  }
  auto result = voice::VoiceProfileRegistry::FromProfiles(std::move(profiles));
  return std::move(result.registry);
}

// =============================================================================
// FakeContentStage
// research -> notes text (+ configured sources), summarize -> "Summary: ...",
// script -> kThreeLineScriptJson unless overridden.
// =============================================================================

class FakeContentStage : public collaborators::IContentStage {
 public:
  StageReply RunStage(const StageRequest& request) override {
    std::function<void(const StageRequest&)> hook;
    StageReply reply;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      hook = on_call_;

      auto& failures = failures_[request.stage_name];
      if (!failures.empty()) {
        reply = failures.front();
        failures.pop_front();
      } else {
        reply = DefaultReply(request);
      }
    }
    if (hook) hook(request);
    return reply;
  }

  // Next `count` calls for `stage_name` return a failure.
  void FailNext(const std::string& stage_name, int count,
                const std::string& error = "backend unavailable",
                bool timed_out = false) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) {
      failures_[stage_name].push_back(StageReply::Failure(error, timed_out));
    }
  }

  // Next call for `stage_name` succeeds with `text` (queued behind failures).
  void ReplyNext(const std::string& stage_name, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[stage_name].push_back(StageReply::Success(text));
  }

  void SetScriptText(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_text_ = text;
  }

  void SetResearchSources(std::vector<pipeline::SourceRecord> sources) {
    std::lock_guard<std::mutex> lock(mutex_);
    research_sources_ = std::move(sources);
  }

  void SetOnCall(std::function<void(const StageRequest&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_call_ = std::move(hook);
  }

  int CallCount(const std::string& stage_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(
        requests_.begin(), requests_.end(),
        [&](const StageRequest& r) { return r.stage_name == stage_name; }));
  }

  std::vector<StageRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  StageReply DefaultReply(const StageRequest& request) const {
    if (request.stage_name == collaborators::kResearchStageName) {
      StageReply r = StageReply::Success("Key findings about " + request.input_text);
      r.sources = research_sources_;
      return r;
    }
    if (request.stage_name == collaborators::kSummarizeStageName) {
      return StageReply::Success("Summary: " + request.input_text);
    }
    if (request.stage_name == collaborators::kScriptStageName) {
      return StageReply::Success(script_text_);
    }
    return StageReply::Failure("unknown stage " + request.stage_name);
  }

  mutable std::mutex mutex_;
  std::vector<StageRequest> requests_;
  std::map<std::string, std::deque<StageReply>> failures_;
  std::vector<pipeline::SourceRecord> research_sources_;
  std::string script_text_ = kThreeLineScriptJson;
  std::function<void(const StageRequest&)> on_call_;
};

// =============================================================================
// FakeSearchProvider
// Each query returns two records: one shared by every query (same url) and
// one unique to the query.
// =============================================================================

class FakeSearchProvider : public collaborators::ISearchProvider {
 public:
  SearchReply Search(const std::string& query, int32_t max_results) override {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.push_back(query);
    SearchReply reply;
    if (fail_all_) {
      reply.error = "search quota exceeded";
      return reply;
    }
    reply.ok = true;
    reply.results.push_back({"Overview", "Shared overview", "https://example.com/overview", 0});
    reply.results.push_back({query, "Result for " + query,
                             "https://example.com/q" + std::to_string(queries_.size()), 0});
    if (static_cast<int32_t>(reply.results.size()) > max_results) {
      reply.results.resize(static_cast<size_t>(max_results));
    }
    return reply;
  }

  void SetFailAll(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_all_ = fail;
  }

  std::vector<std::string> Queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> queries_;
  bool fail_all_ = false;
};

// =============================================================================
// FakeVoiceSynthesis
// Returns a WAV of (frames_per_char * text length) frames. Format per speaker
// is configurable so mismatches can be provoked.
// =============================================================================

class FakeVoiceSynthesis : public collaborators::IVoiceSynthesis {
 public:
  static constexpr int64_t kFramesPerChar = 40;

  SynthesisReply Synthesize(const std::string& text,
                            const voice::VoiceProfile& profile) override {
    int now_active = ++active_;
    int prev_max = max_active_.load();
    while (now_active > prev_max && !max_active_.compare_exchange_weak(prev_max, now_active)) {
    }

    SynthesisReply reply;
    int32_t rate;
    int32_t channels;
    int64_t delay_ms;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[text];
      profiles_seen_.push_back(profile);
      rate = rate_[profile.speaker] ? rate_[profile.speaker] : 16000;
      channels = channels_[profile.speaker] ? channels_[profile.speaker] : 1;
      delay_ms = delay_ms_;

      auto it = failures_left_.find(text);
      if (it != failures_left_.end() && it->second != 0) {
        if (it->second > 0) --it->second;
        reply.error = "voice model error";
        reply.timed_out = timeout_failures_;
        --active_;
        return reply;
      }
      if (garbage_.count(text)) {
        reply.ok = true;
        reply.audio = {'n', 'o', 't', ' ', 'a', 'u', 'd', 'i', 'o'};
        --active_;
        return reply;
      }
    }

    if (delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    reply.ok = true;
    reply.audio = MakeWavBytes(SamplesFor(text, channels), rate, channels);
    --active_;
    return reply;
  }

  // Samples the fake produces for `text` at `channels`.
  static std::vector<int16_t> SamplesFor(const std::string& text, int32_t channels = 1) {
    int16_t base = static_cast<int16_t>(std::hash<std::string>{}(text) % 2000);
    return MakeTone(static_cast<int64_t>(text.size()) * kFramesPerChar, channels, base);
  }

  // count < 0: fail forever.
  void FailText(const std::string& text, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_left_[text] = count;
  }

  void SetTimeoutFailures(bool timed_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_failures_ = timed_out;
  }

  void ReturnGarbageFor(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    garbage_[text] = true;
  }

  void SetFormat(voice::Speaker speaker, int32_t rate, int32_t channels) {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_[speaker] = rate;
    channels_[speaker] = channels;
  }

  void SetDelayMs(int64_t ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ms_ = ms;
  }

  int CallsFor(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(text);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto& [text, n] : calls_) total += n;
    return total;
  }

  std::vector<voice::VoiceProfile> ProfilesSeen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_seen_;
  }

  int MaxConcurrentCalls() const { return max_active_.load(); }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, int> calls_;
  std::map<std::string, int> failures_left_;
  std::map<std::string, bool> garbage_;
  std::map<voice::Speaker, int32_t> rate_;
  std::map<voice::Speaker, int32_t> channels_;
  std::vector<voice::VoiceProfile> profiles_seen_;
  bool timeout_failures_ = false;
  int64_t delay_ms_ = 0;
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
};

// =============================================================================
// FakeReferenceVoiceGenerator
// =============================================================================

class FakeReferenceVoiceGenerator : public collaborators::IReferenceVoiceGenerator {
 public:
  ReferenceReply GenerateReference(voice::Speaker speaker,
                                   const std::string& voice_id,
                                   const std::string& prompt_text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back({speaker, voice_id, prompt_text});
    ReferenceReply reply;
    if (fail_) {
      reply.error = "tts service offline";
      return reply;
    }
    reply.ok = true;
    reply.audio = MakeWavBytes(MakeTone(1600, 1), 16000, 1);
    return reply;
  }

  struct Request {
    voice::Speaker speaker;
    std::string voice_id;
    std::string prompt_text;
  };

  void SetFail(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::vector<Request> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Request> requests_;
  bool fail_ = false;
};

}  // namespace podwright::tests::fixtures

#endif  // PODWRIGHT_TESTS_FIXTURES_FAKE_COLLABORATORS_H_
