// Repository: Podwright
// Component: Run Snapshot Store Implementation
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/RunSnapshotStore.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <zlib.h>

#include "pipeline_run.pb.h"
#include "podwright/audio/PcmDecoder.hpp"
#include "podwright/util/Logger.hpp"

namespace podwright::pipeline {

namespace proto = podwright::v1;
using podwright::util::Logger;

namespace {

uint32_t Crc32Of(const std::string& bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(bytes.data()),
              static_cast<uInt>(bytes.size()));
  return static_cast<uint32_t>(crc);
}

// mkdir -p
bool MakeDirs(const std::string& path) {
  if (path.empty()) return false;
  std::string partial;
  std::istringstream in(path);
  std::string part;
  if (path[0] == '/') partial = "/";
  while (std::getline(in, part, '/')) {
    if (part.empty()) continue;
    partial += part;
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
    partial += '/';
  }
  return true;
}

void SourceToProto(const SourceRecord& in, proto::SourceRecord* out) {
  out->set_title(in.title);
  out->set_snippet(in.snippet);
  out->set_url(in.url);
  out->set_retrieved_at_ms(in.retrieved_at_ms);
}

SourceRecord SourceFromProto(const proto::SourceRecord& in) {
  SourceRecord out;
  out.title = in.title();
  out.snippet = in.snippet();
  out.url = in.url();
  out.retrieved_at_ms = in.retrieved_at_ms();
  return out;
}

proto::PipelineRunSnapshot ToProto(const PipelineRun& run) {
  proto::PipelineRunSnapshot snap;
  snap.set_schema_version(RunSnapshotStore::kSchemaVersion);
  snap.set_run_id(run.run_id);
  snap.set_topic(run.topic);
  snap.set_current_stage(StageName(run.current_stage));
  if (run.failure_reason) snap.set_failure_reason(*run.failure_reason);
  if (run.failed_stage) snap.set_failed_stage(StageName(*run.failed_stage));
  for (const auto& [stage, count] : run.attempt_counts) {
    (*snap.mutable_attempt_counts())[StageName(stage)] = count;
  }
  for (const auto& [line, count] : run.line_attempt_counts) {
    (*snap.mutable_line_attempt_counts())[line] = count;
  }

  if (const auto* notes = run.OutputAs<ResearchNotes>(Stage::kResearching)) {
    snap.set_has_research(true);
    auto* r = snap.mutable_research();
    for (const auto& s : notes->sources) SourceToProto(s, r->add_sources());
    r->set_notes(notes->notes);
  }
  if (const auto* summary = run.OutputAs<Summary>(Stage::kSummarizing)) {
    snap.set_has_summary(true);
    snap.set_summary(summary->text);
  }
  if (const auto* script = run.OutputAs<Script>(Stage::kScripting)) {
    snap.set_has_script(true);
    for (const auto& line : script->lines) {
      auto* l = snap.add_script();
      l->set_index(line.index);
      l->set_speaker(voice::SpeakerName(line.speaker));
      l->set_text(line.text);
    }
  }
  if (const auto* manifest = run.OutputAs<SegmentManifest>(Stage::kProducing)) {
    snap.set_has_manifest(true);
    for (size_t i = 0; i < manifest->segments.size(); ++i) {
      const auto& seg = manifest->segments[i];
      auto* s = snap.add_segments();
      s->set_index(seg.index);
      s->set_speaker(voice::SpeakerName(seg.speaker));
      if (i < manifest->segment_paths.size()) s->set_path(manifest->segment_paths[i]);
      s->set_sample_rate(seg.sample_rate);
      s->set_channel_count(seg.channel_count);
      s->set_sample_count(static_cast<int64_t>(seg.samples.size()));
      s->set_crc32(audio::FingerprintSamples(seg.samples));
    }
  }
  if (const auto* master = run.OutputAs<audio::MasterRecording>(Stage::kStitching)) {
    snap.set_has_master(true);
    auto* m = snap.mutable_master();
    m->set_path(master->output_path);
    m->set_sample_rate(master->sample_rate);
    m->set_channel_count(master->channel_count);
    m->set_sample_count(static_cast<int64_t>(master->samples.size()));
    m->set_crc32(master->fingerprint);
    m->set_gap_samples_inserted(master->gap_samples_inserted);
    for (const auto& b : master->boundaries) {
      auto* pb = m->add_boundaries();
      pb->set_segment_index(b.segment_index);
      pb->set_speaker(voice::SpeakerName(b.speaker));
      pb->set_start_sample(b.start_sample);
      pb->set_sample_count(b.sample_count);
      pb->set_start_ms(b.start_ms);
      pb->set_duration_ms(b.duration_ms);
    }
  }
  return snap;
}

// Decodes `path` and checks it against the recorded format and checksum.
bool ReloadAudio(const std::string& path, int32_t sample_rate,
                 int32_t channel_count, int64_t sample_count, uint32_t crc,
                 std::vector<int16_t>* samples, std::string* error) {
  if (path.empty()) {
    *error = "no file recorded";
    return false;
  }
  audio::DecodedPcm pcm = audio::PcmDecoder::DecodeFile(path);
  if (!pcm.ok) {
    *error = path + ": " + pcm.detail;
    return false;
  }
  if (pcm.sample_rate != sample_rate || pcm.channel_count != channel_count ||
      static_cast<int64_t>(pcm.samples.size()) != sample_count) {
    std::ostringstream oss;
    oss << path << ": expected " << sample_rate << "Hz/" << channel_count
        << "ch/" << sample_count << " samples, found " << pcm.sample_rate
        << "Hz/" << pcm.channel_count << "ch/" << pcm.samples.size();
    *error = oss.str();
    return false;
  }
  if (audio::FingerprintSamples(pcm.samples) != crc) {
    *error = path + ": crc32 mismatch";
    return false;
  }
  *samples = std::move(pcm.samples);
  return true;
}

bool FromProto(const proto::PipelineRunSnapshot& snap, PipelineRun* run,
               std::string* error) {
  run->run_id = snap.run_id();
  run->topic = snap.topic();

  auto stage = ParseStage(snap.current_stage());
  if (!stage) {
    *error = "unknown current_stage '" + snap.current_stage() + "'";
    return false;
  }
  run->current_stage = *stage;
  if (!snap.failure_reason().empty()) run->failure_reason = snap.failure_reason();
  if (!snap.failed_stage().empty()) {
    auto failed = ParseStage(snap.failed_stage());
    if (!failed) {
      *error = "unknown failed_stage '" + snap.failed_stage() + "'";
      return false;
    }
    run->failed_stage = *failed;
  }
  for (const auto& [name, count] : snap.attempt_counts()) {
    auto s = ParseStage(name);
    if (!s) {
      *error = "unknown stage in attempt_counts '" + name + "'";
      return false;
    }
    run->attempt_counts[*s] = count;
  }
  for (const auto& [line, count] : snap.line_attempt_counts()) {
    run->line_attempt_counts[line] = count;
  }

  if (snap.has_research()) {
    ResearchNotes notes;
    for (const auto& s : snap.research().sources()) {
      notes.sources.push_back(SourceFromProto(s));
    }
    notes.notes = snap.research().notes();
    run->stage_outputs[Stage::kResearching] = std::move(notes);
  }
  if (snap.has_summary()) {
    run->stage_outputs[Stage::kSummarizing] = Summary{snap.summary()};
  }
  if (snap.has_script()) {
    Script script;
    for (const auto& l : snap.script()) {
      ScriptLine line;
      line.index = l.index();
      line.speaker = voice::ParseSpeaker(l.speaker());
      line.text = l.text();
      script.lines.push_back(std::move(line));
    }
    run->stage_outputs[Stage::kScripting] = std::move(script);
  }
  if (snap.has_manifest()) {
    SegmentManifest manifest;
    for (const auto& s : snap.segments()) {
      audio::AudioSegment seg;
      seg.index = s.index();
      seg.speaker = voice::ParseSpeaker(s.speaker());
      seg.sample_rate = s.sample_rate();
      seg.channel_count = s.channel_count();
      if (!ReloadAudio(s.path(), s.sample_rate(), s.channel_count(),
                       s.sample_count(), s.crc32(), &seg.samples, error)) {
        *error = "segment " + std::to_string(s.index()) + ": " + *error;
        return false;
      }
      manifest.segments.push_back(std::move(seg));
      manifest.segment_paths.push_back(s.path());
    }
    run->stage_outputs[Stage::kProducing] = std::move(manifest);
  }
  if (snap.has_master()) {
    const auto& m = snap.master();
    audio::MasterRecording master;
    master.sample_rate = m.sample_rate();
    master.channel_count = m.channel_count();
    master.gap_samples_inserted = m.gap_samples_inserted();
    master.fingerprint = m.crc32();
    master.output_path = m.path();
    if (!ReloadAudio(m.path(), m.sample_rate(), m.channel_count(),
                     m.sample_count(), m.crc32(), &master.samples, error)) {
      *error = "master: " + *error;
      return false;
    }
    for (const auto& pb : m.boundaries()) {
      audio::SegmentBoundary b;
      b.segment_index = pb.segment_index();
      b.speaker = voice::ParseSpeaker(pb.speaker());
      b.start_sample = pb.start_sample();
      b.sample_count = pb.sample_count();
      b.start_ms = pb.start_ms();
      b.duration_ms = pb.duration_ms();
      master.boundaries.push_back(b);
    }
    run->stage_outputs[Stage::kStitching] = std::move(master);
  }
  return true;
}

}  // namespace

const char* SnapshotLoadStatusToString(SnapshotLoadStatus status) {
  switch (status) {
    case SnapshotLoadStatus::kOk: return "OK";
    case SnapshotLoadStatus::kNotFound: return "NOT_FOUND";
    case SnapshotLoadStatus::kCorrupt: return "CORRUPT";
  }
  return "UNKNOWN";
}

RunSnapshotStore::RunSnapshotStore(std::string output_root)
    : output_root_(std::move(output_root)) {
  if (!MakeDirs(output_root_)) {
    throw std::runtime_error("RunSnapshotStore: cannot create directory " +
                             output_root_);
  }
}

std::string RunSnapshotStore::RunDir(const std::string& run_id) const {
  return output_root_ + "/" + run_id;
}

std::string RunSnapshotStore::SnapshotPath(const std::string& run_id) const {
  return RunDir(run_id) + "/" + kSnapshotFileName;
}

std::string RunSnapshotStore::EnsureRunDir(const std::string& run_id) const {
  std::string dir = RunDir(run_id);
  if (!MakeDirs(dir)) {
    throw std::runtime_error("RunSnapshotStore: cannot create directory " + dir);
  }
  return dir;
}

SnapshotSaveResult RunSnapshotStore::Save(const PipelineRun& run) const {
  std::string payload;
  if (!ToProto(run).SerializeToString(&payload)) {
    return SnapshotSaveResult::Failure("snapshot serialization failed");
  }
  proto::SnapshotEnvelope envelope;
  envelope.set_crc32(Crc32Of(payload));
  envelope.set_payload(std::move(payload));

  std::string bytes;
  if (!envelope.SerializeToString(&bytes)) {
    return SnapshotSaveResult::Failure("envelope serialization failed");
  }

  std::string path;
  try {
    path = EnsureRunDir(run.run_id) + "/" + kSnapshotFileName;
  } catch (const std::runtime_error& e) {
    return SnapshotSaveResult::Failure(e.what());
  }

  std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::binary | std::ios::trunc);
    if (!of) {
      return SnapshotSaveResult::Failure("cannot open " + tmp_path);
    }
    of.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    of.flush();
    if (!of) {
      of.close();
      std::remove(tmp_path.c_str());
      return SnapshotSaveResult::Failure("write failed " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    return SnapshotSaveResult::Failure("rename failed " + path);
  }

  std::ostringstream oss;
  oss << "[RunSnapshotStore] SAVED run_id=" << run.run_id
      << " stage=" << StageName(run.current_stage)
      << " artifacts=" << run.stage_outputs.size() << " bytes=" << bytes.size();
  Logger::Debug(oss.str());
  return SnapshotSaveResult::Success();
}

SnapshotLoadResult RunSnapshotStore::Load(const std::string& run_id) const {
  SnapshotLoadResult result;
  const std::string path = SnapshotPath(run_id);

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    result.status = SnapshotLoadStatus::kNotFound;
    result.detail = path;
    return result;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  const std::string bytes = buf.str();

  result.status = SnapshotLoadStatus::kCorrupt;

  proto::SnapshotEnvelope envelope;
  if (!envelope.ParseFromString(bytes)) {
    result.detail = "envelope parse failed";
    return result;
  }
  if (Crc32Of(envelope.payload()) != envelope.crc32()) {
    result.detail = "crc32 mismatch";
    return result;
  }
  proto::PipelineRunSnapshot snap;
  if (!snap.ParseFromString(envelope.payload())) {
    result.detail = "snapshot parse failed";
    return result;
  }
  if (snap.schema_version() != kSchemaVersion) {
    result.detail = "schema_version " + std::to_string(snap.schema_version());
    return result;
  }
  if (snap.run_id() != run_id) {
    result.detail = "snapshot belongs to run '" + snap.run_id() + "'";
    return result;
  }

  std::string error;
  if (!FromProto(snap, &result.run, &error)) {
    result.run = PipelineRun{};
    result.detail = error;
    return result;
  }

  result.status = SnapshotLoadStatus::kOk;
  return result;
}

void RunSnapshotStore::Discard(const std::string& run_id) const {
  const std::string path = SnapshotPath(run_id);
  if (std::remove(path.c_str()) != 0 && errno != ENOENT) {
    Logger::Warn("[RunSnapshotStore] DISCARD_FAILED path=" + path);
  }
}

}  // namespace podwright::pipeline
