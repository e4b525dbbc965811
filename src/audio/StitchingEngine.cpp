// Repository: Podwright
// Component: Stitching Engine
// Copyright (c) 2025 Podwright

#include "podwright/audio/StitchingEngine.hpp"

#include <algorithm>
#include <sstream>

#include "podwright/util/Logger.hpp"

namespace podwright::audio {

using podwright::util::Logger;

const char* StitchErrorToString(StitchError error) {
  switch (error) {
    case StitchError::kNone: return "NONE";
    case StitchError::kEmptyInput: return "EMPTY_INPUT";
    case StitchError::kIndexMismatch: return "INDEX_MISMATCH";
    case StitchError::kFormatMismatch: return "FORMAT_MISMATCH";
    case StitchError::kInvalidFormat: return "INVALID_FORMAT";
    case StitchError::kPartialFrame: return "PARTIAL_FRAME";
  }
  return "UNKNOWN";
}

StitchingEngine::StitchingEngine(StitchConfig config) : config_(config) {}

int64_t StitchingEngine::GapSamples(int32_t sample_rate,
                                    int32_t channel_count) const {
  if (config_.inter_turn_gap_ms <= 0 || sample_rate <= 0 || channel_count <= 0) {
    return 0;
  }
  // Integer round-half-up of gap_ms * rate / 1000.
  int64_t frames =
      (static_cast<int64_t>(config_.inter_turn_gap_ms) * sample_rate + 500) / 1000;
  return frames * channel_count;
}

StitchResult StitchingEngine::CheckPreconditions(
    const std::vector<AudioSegment>& segments) const {
  if (segments.empty()) {
    return StitchResult::Failure(StitchError::kEmptyInput, "no segments");
  }

  const int32_t rate = segments[0].sample_rate;
  const int32_t channels = segments[0].channel_count;

  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& seg = segments[i];
    if (seg.index != static_cast<int32_t>(i)) {
      std::ostringstream oss;
      oss << "segment at position " << i << " has index " << seg.index;
      return StitchResult::Failure(StitchError::kIndexMismatch, oss.str());
    }
    if (seg.sample_rate <= 0 || seg.channel_count <= 0) {
      std::ostringstream oss;
      oss << "segment " << i << " sample_rate=" << seg.sample_rate
          << " channel_count=" << seg.channel_count;
      return StitchResult::Failure(StitchError::kInvalidFormat, oss.str());
    }
    if (seg.sample_rate != rate || seg.channel_count != channels) {
      std::ostringstream oss;
      oss << "segment " << i << " is " << seg.sample_rate << "Hz/"
          << seg.channel_count << "ch, segment 0 is " << rate << "Hz/"
          << channels << "ch";
      return StitchResult::Failure(StitchError::kFormatMismatch, oss.str());
    }
    if (seg.samples.size() % static_cast<size_t>(channels) != 0) {
      std::ostringstream oss;
      oss << "segment " << i << " has " << seg.samples.size()
          << " samples, not a multiple of " << channels << " channels";
      return StitchResult::Failure(StitchError::kPartialFrame, oss.str());
    }
  }
  return StitchResult::Success(MasterRecording{});
}

StitchResult StitchingEngine::Stitch(
    const std::vector<AudioSegment>& segments) const {
  StitchResult check = CheckPreconditions(segments);
  if (!check.ok) {
    return check;
  }

  const int32_t rate = segments[0].sample_rate;
  const int32_t channels = segments[0].channel_count;
  const int64_t gap = GapSamples(rate, channels);

  // Pass 1: total length.
  int64_t total = 0;
  int64_t speaker_changes = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    total += static_cast<int64_t>(segments[i].samples.size());
    if (i > 0 && segments[i].speaker != segments[i - 1].speaker) {
      ++speaker_changes;
    }
  }
  total += gap * speaker_changes;

  MasterRecording master;
  master.sample_rate = rate;
  master.channel_count = channels;
  // Zero-initialized: gap regions need no explicit fill.
  master.samples.assign(static_cast<size_t>(total), 0);
  master.boundaries.reserve(segments.size());

  // Pass 2: copy at offsets.
  int64_t offset = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& seg = segments[i];
    if (i > 0 && seg.speaker != segments[i - 1].speaker) {
      offset += gap;
      master.gap_samples_inserted += gap;
    }

    std::copy(seg.samples.begin(), seg.samples.end(),
              master.samples.begin() + offset);

    SegmentBoundary b;
    b.segment_index = seg.index;
    b.speaker = seg.speaker;
    b.start_sample = offset;
    b.sample_count = static_cast<int64_t>(seg.samples.size());
    b.start_ms = offset / channels * 1000 / rate;
    b.duration_ms = seg.duration_ms();
    master.boundaries.push_back(b);

    offset += static_cast<int64_t>(seg.samples.size());
  }

  master.fingerprint = FingerprintSamples(master.samples);

  std::ostringstream oss;
  oss << "[StitchingEngine] STITCHED segments=" << segments.size()
      << " speaker_changes=" << speaker_changes
      << " gap_samples=" << master.gap_samples_inserted
      << " total_samples=" << total
      << " duration_ms=" << master.total_duration_ms()
      << " crc32=" << master.fingerprint;
  Logger::Debug(oss.str());

  return StitchResult::Success(std::move(master));
}

}  // namespace podwright::audio
