// Repository: Podwright
// Component: Pipeline Configuration
// Purpose: Retry ceilings, concurrency, output layout and collaborator
//          timeouts for one orchestrator. Defaults apply unless overridden by
//          PODWRIGHT_* environment variables via FromEnvironment().
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_PIPELINE_CONFIG_HPP_
#define PODWRIGHT_PIPELINE_PIPELINE_CONFIG_HPP_

#include <cstdint>
#include <string>

namespace podwright::pipeline {

struct PipelineConfig {
  // Attempts per content stage (Researching..Stitching) before the run fails.
  int32_t max_stage_attempts = 3;

  // Attempts per script line during Producing.
  int32_t max_line_attempts = 3;

  // Fixed delay between attempts.
  int64_t retry_backoff_ms = 0;

  // Silence inserted at every speaker change in the master.
  int32_t inter_turn_gap_ms = 500;

  // Producing worker pool size. 1 = sequential.
  int32_t synthesis_workers = 1;

  // Per collaborator call (applied as the gRPC deadline).
  int64_t collaborator_timeout_ms = 120000;

  // Research: queries issued per topic and results kept per query.
  int32_t research_query_count = 4;
  int32_t search_max_results = 5;

  // <output_root>/<run_id>/ holds segments, master and snapshot.
  std::string output_root = "output";

  // Where reference clips for voice cloning are looked up / generated.
  std::string voice_reference_dir = "voice_references";

  // Write run.snapshot after every completed stage.
  bool persist_snapshots = true;

  // Overlays PODWRIGHT_OUTPUT_ROOT, PODWRIGHT_MAX_STAGE_ATTEMPTS,
  // PODWRIGHT_MAX_LINE_ATTEMPTS, PODWRIGHT_GAP_MS, PODWRIGHT_SYNTH_WORKERS,
  // PODWRIGHT_TIMEOUT_MS, PODWRIGHT_VOICE_REFERENCE_DIR and PODWRIGHT_PERSIST
  // onto `base`. Unparseable or out-of-range values are ignored with a
  // warning.
  static PipelineConfig FromEnvironment(PipelineConfig base);

  // FromEnvironment() over the defaults above.
  static PipelineConfig FromEnvironment();
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_PIPELINE_CONFIG_HPP_
