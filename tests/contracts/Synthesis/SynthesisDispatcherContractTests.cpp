// Repository: Podwright
// Component: Synthesis Dispatcher Contract Tests
// Purpose: Index-ordered collection under a worker pool, per-line retry,
//          exhaustion abort and cancellation.
// Copyright (c) 2025 Podwright

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "podwright/synthesis/SynthesisDispatcher.hpp"
#include "FakeCollaborators.h"

namespace podwright::synthesis {
namespace {

using podwright::tests::fixtures::FakeVoiceSynthesis;
using podwright::tests::fixtures::MakeRegistry;
using voice::Speaker;

pipeline::Script MakeScript(int lines) {
  pipeline::Script script;
  for (int i = 0; i < lines; ++i) {
    Speaker s = (i % 2 == 0) ? Speaker::kHost : Speaker::kExpert;
    script.lines.push_back({i, s, "Line number " + std::to_string(i)});
  }
  return script;
}

class SynthesisDispatcherContractTest : public ::testing::Test {
 protected:
  std::unique_ptr<SynthesisDispatcher> Make(DispatcherConfig config) {
    return std::make_unique<SynthesisDispatcher>(synth_, registry_, config);
  }

  std::shared_ptr<FakeVoiceSynthesis> voice_ = std::make_shared<FakeVoiceSynthesis>();
  SegmentSynthesizer synth_{voice_};
  voice::VoiceProfileRegistry registry_ = MakeRegistry();
};

TEST_F(SynthesisDispatcherContractTest, SequentialDispatchKeepsIndexOrder) {
  auto dispatcher = Make(DispatcherConfig{});
  auto script = MakeScript(4);

  DispatchResult result = dispatcher->Dispatch(script);

  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.segments.size(), 4u);
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(result.segments[i].index, i);
    EXPECT_EQ(result.segments[i].speaker, script.lines[i].speaker);
    EXPECT_EQ(result.segments[i].samples,
              FakeVoiceSynthesis::SamplesFor(script.lines[i].text));
    EXPECT_EQ(result.line_attempts.at(i), 1);
  }
  EXPECT_EQ(voice_->MaxConcurrentCalls(), 1);
}

TEST_F(SynthesisDispatcherContractTest, WorkerPoolKeepsIndexOrder) {
  voice_->SetDelayMs(10);
  DispatcherConfig config;
  config.workers = 4;
  auto dispatcher = Make(config);
  auto script = MakeScript(12);

  DispatchResult result = dispatcher->Dispatch(script);

  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.segments.size(), 12u);
  for (int i = 0; i < 12; ++i) {
    EXPECT_EQ(result.segments[i].index, i);
    EXPECT_EQ(result.segments[i].samples,
              FakeVoiceSynthesis::SamplesFor(script.lines[i].text));
  }
  EXPECT_LE(voice_->MaxConcurrentCalls(), 4);
  EXPECT_GT(voice_->MaxConcurrentCalls(), 1);
}

TEST_F(SynthesisDispatcherContractTest, FailedLineRetriedUntilSuccess) {
  auto script = MakeScript(3);
  voice_->FailText(script.lines[1].text, 2);
  auto dispatcher = Make(DispatcherConfig{});

  DispatchResult result = dispatcher->Dispatch(script);

  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.line_attempts.at(1), 3);
  EXPECT_EQ(voice_->CallsFor(script.lines[1].text), 3);
  EXPECT_FALSE(result.failure.has_value());
}

TEST_F(SynthesisDispatcherContractTest, ExhaustedLineAbortsDispatch) {
  auto script = MakeScript(5);
  voice_->FailText(script.lines[2].text, -1);
  DispatcherConfig config;
  config.max_line_attempts = 2;
  auto dispatcher = Make(config);

  DispatchResult result = dispatcher->Dispatch(script);

  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.cancelled);
  EXPECT_TRUE(result.segments.empty());
  ASSERT_TRUE(result.failure.has_value());
  EXPECT_EQ(result.failure->line_index, 2);
  EXPECT_EQ(result.failure->attempts, 2);
  EXPECT_EQ(result.failure->last_error, SynthesisError::kCollaborator);
  EXPECT_EQ(voice_->CallsFor(script.lines[2].text), 2);
  // Sequential: nothing past the failed line is claimed.
  EXPECT_EQ(voice_->CallsFor(script.lines[3].text), 0);
  EXPECT_EQ(result.line_attempts.count(3), 0u);
}

TEST_F(SynthesisDispatcherContractTest, UnresolvableSpeakerFailsLine) {
  auto script = MakeScript(2);
  script.lines[1].speaker = Speaker::kUnknown;
  auto dispatcher = Make(DispatcherConfig{});

  DispatchResult result = dispatcher->Dispatch(script);

  EXPECT_FALSE(result.ok);
  ASSERT_TRUE(result.failure.has_value());
  EXPECT_EQ(result.failure->line_index, 1);
  EXPECT_EQ(result.failure->last_error, SynthesisError::kSpeakerMismatch);
}

TEST_F(SynthesisDispatcherContractTest, CancelStopsDispatch) {
  voice_->SetDelayMs(20);
  DispatcherConfig config;
  config.workers = 2;
  auto dispatcher = Make(config);
  auto script = MakeScript(40);

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    dispatcher->Cancel();
  });
  DispatchResult result = dispatcher->Dispatch(script);
  canceller.join();

  EXPECT_FALSE(result.ok);
  EXPECT_TRUE(result.cancelled);
  EXPECT_TRUE(result.segments.empty());
  EXPECT_LT(voice_->TotalCalls(), 40);
  EXPECT_TRUE(dispatcher->IsCancelled());

  dispatcher->Reset();
  voice_->SetDelayMs(0);
  DispatchResult again = dispatcher->Dispatch(MakeScript(2));
  EXPECT_TRUE(again.ok);
}

TEST_F(SynthesisDispatcherContractTest, CancelInterruptsBackoff) {
  auto script = MakeScript(1);
  voice_->FailText(script.lines[0].text, -1);
  DispatcherConfig config;
  config.retry_backoff_ms = 60000;
  auto dispatcher = Make(config);

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    dispatcher->Cancel();
  });
  auto start = std::chrono::steady_clock::now();
  DispatchResult result = dispatcher->Dispatch(script);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_FALSE(result.ok);
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(voice_->CallsFor(script.lines[0].text), 1);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(SynthesisDispatcherContractTest, EmptyScriptCompletesImmediately) {
  auto dispatcher = Make(DispatcherConfig{});
  DispatchResult result = dispatcher->Dispatch(pipeline::Script{});
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.segments.empty());
}

}  // namespace
}  // namespace podwright::synthesis
