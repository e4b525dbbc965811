// Repository: Podwright
// Component: Run Snapshot Store
// Purpose: Durable PipelineRun snapshots keyed by run id. One protobuf
//          PipelineRunSnapshot per run, sealed with a CRC32 envelope and
//          replaced atomically (tmp + rename) after every completed stage.
//          Segment and master audio stay in their WAV files; the snapshot
//          records their paths and checksums.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_RUN_SNAPSHOT_STORE_HPP_
#define PODWRIGHT_PIPELINE_RUN_SNAPSHOT_STORE_HPP_

#include <cstdint>
#include <string>

#include "podwright/pipeline/PipelineTypes.hpp"

namespace podwright::pipeline {

enum class SnapshotLoadStatus {
  kOk,
  kNotFound,   // No snapshot for this run id
  kCorrupt,    // CRC, parse, schema or referenced audio check failed
};

const char* SnapshotLoadStatusToString(SnapshotLoadStatus status);

struct SnapshotLoadResult {
  SnapshotLoadStatus status = SnapshotLoadStatus::kNotFound;
  std::string detail;
  PipelineRun run;
};

struct SnapshotSaveResult {
  bool ok;
  std::string detail;

  static SnapshotSaveResult Success() { return {true, ""}; }
  static SnapshotSaveResult Failure(const std::string& detail) {
    return {false, detail};
  }
};

class RunSnapshotStore {
 public:
  static constexpr uint32_t kSchemaVersion = 1u;
  static constexpr const char* kSnapshotFileName = "run.snapshot";

  // Creates output_root if needed. Throws std::runtime_error if it cannot.
  explicit RunSnapshotStore(std::string output_root);

  RunSnapshotStore(const RunSnapshotStore&) = delete;
  RunSnapshotStore& operator=(const RunSnapshotStore&) = delete;

  const std::string& output_root() const { return output_root_; }

  // <output_root>/<run_id>
  std::string RunDir(const std::string& run_id) const;
  std::string SnapshotPath(const std::string& run_id) const;

  // Creates RunDir(run_id). Throws std::runtime_error if it cannot.
  std::string EnsureRunDir(const std::string& run_id) const;

  SnapshotSaveResult Save(const PipelineRun& run) const;

  // Rebuilds the PipelineRun, re-reading segment and master audio from
  // disk and verifying each against its recorded CRC32.
  SnapshotLoadResult Load(const std::string& run_id) const;

  // Removes the snapshot file (audio files are left in place).
  void Discard(const std::string& run_id) const;

 private:
  std::string output_root_;
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_RUN_SNAPSHOT_STORE_HPP_
