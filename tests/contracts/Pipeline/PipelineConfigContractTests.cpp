// Repository: Podwright
// Component: Pipeline Configuration Contract Tests
// Copyright (c) 2025 Podwright

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "podwright/pipeline/PipelineConfig.hpp"
#include "podwright/util/Logger.hpp"

namespace podwright::pipeline {
namespace {

using podwright::util::Logger;

const char* const kAllVariables[] = {
    "PODWRIGHT_OUTPUT_ROOT",       "PODWRIGHT_VOICE_REFERENCE_DIR",
    "PODWRIGHT_MAX_STAGE_ATTEMPTS", "PODWRIGHT_MAX_LINE_ATTEMPTS",
    "PODWRIGHT_GAP_MS",            "PODWRIGHT_SYNTH_WORKERS",
    "PODWRIGHT_TIMEOUT_MS",        "PODWRIGHT_PERSIST",
};

class PipelineConfigContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* name : kAllVariables) unsetenv(name);
    Logger::SetWarnSink([this](const std::string& line) { warnings_.push_back(line); });
  }

  void TearDown() override {
    for (const char* name : kAllVariables) unsetenv(name);
    Logger::SetWarnSink(nullptr);
  }

  std::vector<std::string> warnings_;
};

TEST_F(PipelineConfigContractTest, DefaultsWithoutEnvironment) {
  PipelineConfig config = PipelineConfig::FromEnvironment();

  EXPECT_EQ(config.max_stage_attempts, 3);
  EXPECT_EQ(config.max_line_attempts, 3);
  EXPECT_EQ(config.inter_turn_gap_ms, 500);
  EXPECT_EQ(config.synthesis_workers, 1);
  EXPECT_EQ(config.collaborator_timeout_ms, 120000);
  EXPECT_EQ(config.output_root, "output");
  EXPECT_EQ(config.voice_reference_dir, "voice_references");
  EXPECT_TRUE(config.persist_snapshots);
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(PipelineConfigContractTest, EnvironmentOverlaysBase) {
  setenv("PODWRIGHT_OUTPUT_ROOT", "/tmp/podwright-out", 1);
  setenv("PODWRIGHT_MAX_STAGE_ATTEMPTS", "5", 1);
  setenv("PODWRIGHT_GAP_MS", "0", 1);
  setenv("PODWRIGHT_SYNTH_WORKERS", "4", 1);
  setenv("PODWRIGHT_TIMEOUT_MS", "2500", 1);
  setenv("PODWRIGHT_PERSIST", "off", 1);

  PipelineConfig base;
  base.max_line_attempts = 7;
  PipelineConfig config = PipelineConfig::FromEnvironment(base);

  EXPECT_EQ(config.output_root, "/tmp/podwright-out");
  EXPECT_EQ(config.max_stage_attempts, 5);
  EXPECT_EQ(config.max_line_attempts, 7);
  EXPECT_EQ(config.inter_turn_gap_ms, 0);
  EXPECT_EQ(config.synthesis_workers, 4);
  EXPECT_EQ(config.collaborator_timeout_ms, 2500);
  EXPECT_FALSE(config.persist_snapshots);
}

TEST_F(PipelineConfigContractTest, InvalidValuesIgnoredWithWarning) {
  setenv("PODWRIGHT_MAX_STAGE_ATTEMPTS", "0", 1);
  setenv("PODWRIGHT_GAP_MS", "half a second", 1);
  setenv("PODWRIGHT_SYNTH_WORKERS", "3x", 1);
  setenv("PODWRIGHT_PERSIST", "maybe", 1);

  PipelineConfig config = PipelineConfig::FromEnvironment();

  EXPECT_EQ(config.max_stage_attempts, 3);
  EXPECT_EQ(config.inter_turn_gap_ms, 500);
  EXPECT_EQ(config.synthesis_workers, 1);
  EXPECT_TRUE(config.persist_snapshots);
  ASSERT_EQ(warnings_.size(), 4u);
  for (const auto& line : warnings_) {
    EXPECT_EQ(line.rfind("[PipelineConfig] IGNORED ", 0), 0u) << line;
  }
}

TEST_F(PipelineConfigContractTest, OutOfRangeIntegersIgnoredWithWarning) {
  setenv("PODWRIGHT_GAP_MS", "4294967496", 1);
  setenv("PODWRIGHT_SYNTH_WORKERS", "2147483648", 1);
  setenv("PODWRIGHT_MAX_LINE_ATTEMPTS", "2147483647", 1);

  PipelineConfig config = PipelineConfig::FromEnvironment();

  EXPECT_EQ(config.inter_turn_gap_ms, 500);
  EXPECT_EQ(config.synthesis_workers, 1);
  EXPECT_EQ(config.max_line_attempts, 2147483647);
  ASSERT_EQ(warnings_.size(), 2u);
  EXPECT_NE(warnings_[0].find("PODWRIGHT_GAP_MS=4294967496"), std::string::npos);
  EXPECT_NE(warnings_[1].find("PODWRIGHT_SYNTH_WORKERS=2147483648"),
            std::string::npos);
}

}  // namespace
}  // namespace podwright::pipeline
