// Repository: Podwright
// Component: PCM Decoder
// Copyright (c) 2025 Podwright

#include "podwright/audio/PcmDecoder.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "podwright/util/Logger.hpp"

namespace podwright::audio {

using podwright::util::Logger;

namespace {

constexpr int kAvioBufferSize = 32 * 1024;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

// Read cursor over caller-owned bytes for the custom AVIO context.
struct MemoryReader {
  const uint8_t* data = nullptr;
  int64_t size = 0;
  int64_t pos = 0;
};

int ReadThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* reader = static_cast<MemoryReader*>(opaque);
  int64_t remaining = reader->size - reader->pos;
  if (remaining <= 0) {
    return AVERROR_EOF;
  }
  int n = static_cast<int>(std::min<int64_t>(remaining, buf_size));
  std::memcpy(buf, reader->data + reader->pos, static_cast<size_t>(n));
  reader->pos += n;
  return n;
}

int64_t SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* reader = static_cast<MemoryReader*>(opaque);
  if (whence & AVSEEK_SIZE) {
    return reader->size;
  }
  int64_t target = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: target = offset; break;
    case SEEK_CUR: target = reader->pos + offset; break;
    case SEEK_END: target = reader->size + offset; break;
    default: return AVERROR(EINVAL);
  }
  if (target < 0 || target > reader->size) {
    return AVERROR(EINVAL);
  }
  reader->pos = target;
  return target;
}

// Owns every FFmpeg object of one decode; released in reverse order.
class DecodeSession {
 public:
  ~DecodeSession() {
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);
    if (avio_ctx_) {
      av_freep(&avio_ctx_->buffer);
      avio_context_free(&avio_ctx_);
    }
  }

  // `uri` is null when decoding from `reader`.
  DecodedPcm Run(const char* uri, MemoryReader* reader);

 private:
  bool Open(const char* uri, MemoryReader* reader, std::string* error);
  bool OpenCodec(std::string* error);
  bool InitConverter(std::string* error);
  bool ConvertFrame(const AVFrame* in, std::vector<int16_t>* out,
                    std::string* error);
  bool DrainDecoder(std::vector<int16_t>* out, std::string* error);

  AVIOContext* avio_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVPacket* packet_ = nullptr;
  AVFrame* frame_ = nullptr;
  int stream_index_ = -1;
  int channels_ = 0;
};

bool DecodeSession::Open(const char* uri, MemoryReader* reader,
                         std::string* error) {
  if (reader != nullptr) {
    auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
    if (!buffer) {
      *error = "failed to allocate AVIO buffer";
      return false;
    }
    avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, reader,
                                   &ReadThunk, nullptr, &SeekThunk);
    if (!avio_ctx_) {
      av_free(buffer);
      *error = "failed to allocate AVIO context";
      return false;
    }
    format_ctx_ = avformat_alloc_context();
    if (!format_ctx_) {
      *error = "failed to allocate format context";
      return false;
    }
    format_ctx_->pb = avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;
  }

  int ret = avformat_open_input(&format_ctx_, uri, nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees a user-supplied context on failure.
    format_ctx_ = nullptr;
    *error = "avformat_open_input: " + AvError(ret);
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    *error = "avformat_find_stream_info: " + AvError(ret);
    return false;
  }

  stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1,
                                      nullptr, 0);
  if (stream_index_ < 0) {
    *error = "no audio stream";
    return false;
  }
  return true;
}

bool DecodeSession::OpenCodec(std::string* error) {
  AVCodecParameters* codecpar = format_ctx_->streams[stream_index_]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    *error = "no decoder for codec id " + std::to_string(codecpar->codec_id);
    return false;
  }
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    *error = "failed to allocate codec context";
    return false;
  }
  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    *error = "failed to copy codec parameters";
    return false;
  }
  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    *error = "avcodec_open2: " + AvError(ret);
    return false;
  }
  return true;
}

bool DecodeSession::InitConverter(std::string* error) {
  channels_ = codec_ctx_->ch_layout.nb_channels;
  if (channels_ <= 0 || codec_ctx_->sample_rate <= 0) {
    *error = "invalid stream format";
    return false;
  }

  // Same layout and rate on both sides: only the sample format changes.
  AVChannelLayout layout{};
  if (codec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&layout, channels_);
  } else if (av_channel_layout_copy(&layout, &codec_ctx_->ch_layout) < 0) {
    *error = "failed to copy channel layout";
    return false;
  }

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &layout, AV_SAMPLE_FMT_S16, codec_ctx_->sample_rate,
                                &layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&layout);
  if (ret != 0 || !swr_ctx_) {
    *error = "swr_alloc_set_opts2: " + AvError(ret);
    return false;
  }
  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    *error = "swr_init: " + AvError(ret);
    return false;
  }
  return true;
}

bool DecodeSession::ConvertFrame(const AVFrame* in, std::vector<int16_t>* out,
                                 std::string* error) {
  int in_samples = in ? in->nb_samples : 0;
  int out_capacity = swr_get_out_samples(swr_ctx_, in_samples);
  if (out_capacity <= 0) {
    return true;
  }

  size_t old_size = out->size();
  out->resize(old_size + static_cast<size_t>(out_capacity) * channels_);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out->data() + old_size)};

  int converted = swr_convert(
      swr_ctx_, out_data, out_capacity,
      in ? const_cast<const uint8_t**>(in->extended_data) : nullptr,
      in_samples);
  if (converted < 0) {
    out->resize(old_size);
    *error = "swr_convert: " + AvError(converted);
    return false;
  }
  out->resize(old_size + static_cast<size_t>(converted) * channels_);
  return true;
}

bool DecodeSession::DrainDecoder(std::vector<int16_t>* out, std::string* error) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      *error = "avcodec_receive_frame: " + AvError(ret);
      return false;
    }
    bool ok = ConvertFrame(frame_, out, error);
    av_frame_unref(frame_);
    if (!ok) return false;
  }
}

DecodedPcm DecodeSession::Run(const char* uri, MemoryReader* reader) {
  std::string error;
  if (!Open(uri, reader, &error) || !OpenCodec(&error) ||
      !InitConverter(&error)) {
    return DecodedPcm::Failure(error);
  }

  packet_ = av_packet_alloc();
  frame_ = av_frame_alloc();
  if (!packet_ || !frame_) {
    return DecodedPcm::Failure("failed to allocate packet/frame");
  }

  DecodedPcm result;
  result.sample_rate = codec_ctx_->sample_rate;
  result.channel_count = channels_;

  while (true) {
    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      break;
    }
    if (ret < 0) {
      return DecodedPcm::Failure("av_read_frame: " + AvError(ret));
    }
    if (packet_->stream_index != stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      return DecodedPcm::Failure("avcodec_send_packet: " + AvError(ret));
    }
    if (!DrainDecoder(&result.samples, &error)) {
      return DecodedPcm::Failure(error);
    }
  }

  // Flush decoder, then converter.
  avcodec_send_packet(codec_ctx_, nullptr);
  if (!DrainDecoder(&result.samples, &error) ||
      !ConvertFrame(nullptr, &result.samples, &error)) {
    return DecodedPcm::Failure(error);
  }

  result.ok = true;
  return result;
}

}  // namespace

DecodedPcm PcmDecoder::DecodeBytes(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) {
    return DecodedPcm::Failure("empty audio payload");
  }
  MemoryReader reader;
  reader.data = bytes.data();
  reader.size = static_cast<int64_t>(bytes.size());

  DecodeSession session;
  DecodedPcm result = session.Run(nullptr, &reader);
  if (!result.ok) {
    Logger::Debug("[PcmDecoder] DECODE_FAILED source=memory bytes=" +
                  std::to_string(bytes.size()) + " detail=" + result.detail);
  }
  return result;
}

DecodedPcm PcmDecoder::DecodeFile(const std::string& path) {
  DecodeSession session;
  DecodedPcm result = session.Run(path.c_str(), nullptr);
  if (!result.ok) {
    Logger::Debug("[PcmDecoder] DECODE_FAILED source=" + path +
                  " detail=" + result.detail);
  }
  return result;
}

}  // namespace podwright::audio
