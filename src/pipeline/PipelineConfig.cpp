// Repository: Podwright
// Component: Pipeline Configuration
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/PipelineConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

#include "podwright/util/Logger.hpp"

namespace podwright::pipeline {

using podwright::util::Logger;

namespace {

bool ReadInt64(const char* name, int64_t min_value, int64_t max_value,
               int64_t* out) {
  const char* env = std::getenv(name);
  if (env == nullptr || env[0] == '\0') return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(env, &end, 10);
  if (errno != 0 || end == env || *end != '\0' || v < min_value ||
      v > max_value) {
    Logger::Warn(std::string("[PipelineConfig] IGNORED ") + name + "=" + env);
    return false;
  }
  *out = static_cast<int64_t>(v);
  return true;
}

void OverlayInt32(const char* name, int32_t min_value, int32_t* field) {
  int64_t v;
  if (ReadInt64(name, min_value, std::numeric_limits<int32_t>::max(), &v)) {
    *field = static_cast<int32_t>(v);
  }
}

void OverlayString(const char* name, std::string* field) {
  const char* env = std::getenv(name);
  if (env != nullptr && env[0] != '\0') *field = env;
}

}  // namespace

PipelineConfig PipelineConfig::FromEnvironment() {
  return FromEnvironment(PipelineConfig());
}

PipelineConfig PipelineConfig::FromEnvironment(PipelineConfig base) {
  OverlayString("PODWRIGHT_OUTPUT_ROOT", &base.output_root);
  OverlayString("PODWRIGHT_VOICE_REFERENCE_DIR", &base.voice_reference_dir);
  OverlayInt32("PODWRIGHT_MAX_STAGE_ATTEMPTS", 1, &base.max_stage_attempts);
  OverlayInt32("PODWRIGHT_MAX_LINE_ATTEMPTS", 1, &base.max_line_attempts);
  OverlayInt32("PODWRIGHT_GAP_MS", 0, &base.inter_turn_gap_ms);
  OverlayInt32("PODWRIGHT_SYNTH_WORKERS", 1, &base.synthesis_workers);

  int64_t timeout;
  if (ReadInt64("PODWRIGHT_TIMEOUT_MS", 1,
                std::numeric_limits<int64_t>::max(), &timeout)) {
    base.collaborator_timeout_ms = timeout;
  }

  if (const char* persist = std::getenv("PODWRIGHT_PERSIST")) {
    std::string v(persist);
    if (v == "0" || v == "false" || v == "off") {
      base.persist_snapshots = false;
    } else if (v == "1" || v == "true" || v == "on") {
      base.persist_snapshots = true;
    } else {
      Logger::Warn("[PipelineConfig] IGNORED PODWRIGHT_PERSIST=" + v);
    }
  }
  return base;
}

}  // namespace podwright::pipeline
