// Repository: Podwright
// Component: WAV Writer
// Copyright (c) 2025 Podwright

#include "podwright/audio/WavWriter.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

#include "podwright/util/Logger.hpp"

namespace podwright::audio {

using podwright::util::Logger;

namespace {

// Frames per muxed packet.
constexpr int64_t kFramesPerPacket = 4096;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

class MuxSession {
 public:
  ~MuxSession() {
    if (packet_) av_packet_free(&packet_);
    if (format_ctx_) {
      if (format_ctx_->pb) avio_closep(&format_ctx_->pb);
      avformat_free_context(format_ctx_);
    }
  }

  WavWriteResult Run(const std::string& path,
                     const std::vector<int16_t>& samples,
                     int32_t sample_rate, int32_t channel_count);

 private:
  AVFormatContext* format_ctx_ = nullptr;
  AVPacket* packet_ = nullptr;
};

WavWriteResult MuxSession::Run(const std::string& path,
                               const std::vector<int16_t>& samples,
                               int32_t sample_rate, int32_t channel_count) {
  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "wav",
                                           path.c_str());
  if (ret < 0 || !format_ctx_) {
    return WavWriteResult::Failure("avformat_alloc_output_context2: " +
                                   AvError(ret));
  }

  AVStream* stream = avformat_new_stream(format_ctx_, nullptr);
  if (!stream) {
    return WavWriteResult::Failure("failed to create audio stream");
  }
  AVCodecParameters* par = stream->codecpar;
  par->codec_type = AVMEDIA_TYPE_AUDIO;
  par->codec_id = AV_CODEC_ID_PCM_S16LE;
  par->format = AV_SAMPLE_FMT_S16;
  par->sample_rate = sample_rate;
  av_channel_layout_default(&par->ch_layout, channel_count);
  par->bits_per_coded_sample = 16;
  par->block_align = channel_count * 2;
  par->bit_rate = static_cast<int64_t>(sample_rate) * channel_count * 16;
  stream->time_base = AVRational{1, sample_rate};

  ret = avio_open(&format_ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
  if (ret < 0) {
    return WavWriteResult::Failure("avio_open " + path + ": " + AvError(ret));
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    return WavWriteResult::Failure("avformat_write_header: " + AvError(ret));
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    return WavWriteResult::Failure("failed to allocate packet");
  }

  const int64_t total_frames = static_cast<int64_t>(samples.size()) / channel_count;
  const AVRational sample_tb = AVRational{1, sample_rate};
  for (int64_t frame = 0; frame < total_frames; frame += kFramesPerPacket) {
    int64_t frames = std::min(kFramesPerPacket, total_frames - frame);
    int bytes = static_cast<int>(frames * channel_count * sizeof(int16_t));
    ret = av_new_packet(packet_, bytes);
    if (ret < 0) {
      return WavWriteResult::Failure("av_new_packet: " + AvError(ret));
    }
    std::memcpy(packet_->data, samples.data() + frame * channel_count,
                static_cast<size_t>(bytes));
    packet_->stream_index = stream->index;
    packet_->pts = av_rescale_q(frame, sample_tb, stream->time_base);
    packet_->dts = packet_->pts;
    packet_->duration = av_rescale_q(frames, sample_tb, stream->time_base);

    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      return WavWriteResult::Failure("av_interleaved_write_frame: " +
                                     AvError(ret));
    }
  }

  ret = av_write_trailer(format_ctx_);
  if (ret < 0) {
    return WavWriteResult::Failure("av_write_trailer: " + AvError(ret));
  }

  int64_t size = avio_size(format_ctx_->pb);
  ret = avio_closep(&format_ctx_->pb);
  if (ret < 0) {
    return WavWriteResult::Failure("avio_close: " + AvError(ret));
  }
  return WavWriteResult::Success(size);
}

}  // namespace

WavWriteResult WavWriter::Write(const std::string& path,
                                const std::vector<int16_t>& samples,
                                int32_t sample_rate, int32_t channel_count) {
  if (sample_rate <= 0 || channel_count <= 0) {
    return WavWriteResult::Failure("invalid format " + std::to_string(sample_rate) +
                                   "Hz/" + std::to_string(channel_count) + "ch");
  }
  if (samples.size() % static_cast<size_t>(channel_count) != 0) {
    return WavWriteResult::Failure("partial frame in sample buffer");
  }

  MuxSession session;
  WavWriteResult result = session.Run(path, samples, sample_rate, channel_count);
  if (!result.ok) {
    Logger::Error("[WavWriter] WRITE_FAILED path=" + path + " detail=" +
                  result.detail);
  }
  return result;
}

WavWriteResult WavWriter::WriteAtomic(const std::string& path,
                                      const std::vector<int16_t>& samples,
                                      int32_t sample_rate, int32_t channel_count) {
  const std::string tmp_path = path + ".partial";
  WavWriteResult result = Write(tmp_path, samples, sample_rate, channel_count);
  if (!result.ok) {
    std::remove(tmp_path.c_str());
    return result;
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    Logger::Error("[WavWriter] RENAME_FAILED path=" + path);
    return WavWriteResult::Failure("rename to " + path + " failed");
  }
  return result;
}

}  // namespace podwright::audio
