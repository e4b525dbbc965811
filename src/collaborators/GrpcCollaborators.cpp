// Repository: Podwright
// Component: gRPC collaborator adapters
// Copyright (c) 2025 Podwright

#include "podwright/collaborators/GrpcCollaborators.hpp"

#include <chrono>

#include "podwright/util/Logger.hpp"

namespace podwright::collaborators {

namespace proto = podwright::v1;
using podwright::util::Logger;

namespace {

void SetDeadline(grpc::ClientContext* context, int64_t timeout_ms) {
  context->set_deadline(std::chrono::system_clock::now() +
                        std::chrono::milliseconds(timeout_ms));
}

std::string StatusDetail(const grpc::Status& status) {
  return "grpc " + std::to_string(static_cast<int>(status.error_code())) + ": " +
         status.error_message();
}

bool IsTimeout(const grpc::Status& status) {
  return status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED;
}

void ToProto(const pipeline::SourceRecord& in, proto::SourceRecord* out) {
  out->set_title(in.title);
  out->set_snippet(in.snippet);
  out->set_url(in.url);
  out->set_retrieved_at_ms(in.retrieved_at_ms);
}

pipeline::SourceRecord FromProto(const proto::SourceRecord& in) {
  pipeline::SourceRecord out;
  out.title = in.title();
  out.snippet = in.snippet();
  out.url = in.url();
  out.retrieved_at_ms = in.retrieved_at_ms();
  return out;
}

std::vector<uint8_t> BytesFrom(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

// =============================================================================
// GrpcContentStage
// =============================================================================

GrpcContentStage::GrpcContentStage(std::shared_ptr<grpc::Channel> channel,
                                   GrpcCollaboratorConfig config)
    : config_(config), stub_(proto::ContentStageService::NewStub(channel)) {}

StageReply GrpcContentStage::RunStage(const StageRequest& request) {
  proto::StageRequest req;
  req.set_stage_name(request.stage_name);
  req.set_run_id(request.run_id);
  req.set_attempt(request.attempt);
  req.set_input_text(request.input_text);
  for (const auto& s : request.sources) ToProto(s, req.add_sources());

  proto::StageResponse resp;
  grpc::ClientContext context;
  SetDeadline(&context, config_.timeout_ms);
  grpc::Status status = stub_->RunStage(&context, req, &resp);

  if (!status.ok()) {
    Logger::Warn("[GrpcContentStage] RPC_FAILED stage=" + request.stage_name +
                 " " + StatusDetail(status));
    return StageReply::Failure(StatusDetail(status), IsTimeout(status));
  }
  if (!resp.error().empty()) {
    return StageReply::Failure(resp.error());
  }

  StageReply reply = StageReply::Success(resp.text());
  for (const auto& s : resp.sources()) reply.sources.push_back(FromProto(s));
  for (const auto& l : resp.lines()) {
    pipeline::ScriptLine line;
    line.index = static_cast<int32_t>(reply.lines.size());
    line.speaker = voice::ParseSpeaker(l.speaker());
    line.text = l.text();
    reply.lines.push_back(std::move(line));
  }
  return reply;
}

// =============================================================================
// GrpcSearchProvider
// =============================================================================

GrpcSearchProvider::GrpcSearchProvider(std::shared_ptr<grpc::Channel> channel,
                                       GrpcCollaboratorConfig config)
    : config_(config), stub_(proto::SearchService::NewStub(channel)) {}

SearchReply GrpcSearchProvider::Search(const std::string& query,
                                       int32_t max_results) {
  proto::SearchRequest req;
  req.set_query(query);
  req.set_max_results(max_results);

  proto::SearchResponse resp;
  grpc::ClientContext context;
  SetDeadline(&context, config_.timeout_ms);
  grpc::Status status = stub_->Search(&context, req, &resp);

  SearchReply reply;
  if (!status.ok()) {
    reply.error = StatusDetail(status);
    return reply;
  }
  if (!resp.error().empty()) {
    reply.error = resp.error();
    return reply;
  }
  reply.ok = true;
  for (const auto& r : resp.results()) reply.results.push_back(FromProto(r));
  return reply;
}

// =============================================================================
// GrpcVoiceSynthesis
// =============================================================================

GrpcVoiceSynthesis::GrpcVoiceSynthesis(std::shared_ptr<grpc::Channel> channel,
                                       GrpcCollaboratorConfig config)
    : config_(config), stub_(proto::VoiceSynthesisService::NewStub(channel)) {}

SynthesisReply GrpcVoiceSynthesis::Synthesize(const std::string& text,
                                              const voice::VoiceProfile& profile) {
  proto::SynthesisRequest req;
  req.set_text(text);
  req.set_speaker(voice::SpeakerName(profile.speaker));
  req.set_reference_path(profile.reference_sample_path);
  if (!profile.reference_audio.empty()) {
    req.set_reference_audio(profile.reference_audio.data(),
                            profile.reference_audio.size());
  }
  auto* params = req.mutable_params();
  params->set_exaggeration(profile.synthesis_params.exaggeration);
  params->set_cfg_weight(profile.synthesis_params.cfg_weight);
  params->set_temperature(profile.synthesis_params.temperature);

  proto::SynthesisResponse resp;
  grpc::ClientContext context;
  SetDeadline(&context, config_.timeout_ms);
  grpc::Status status = stub_->Synthesize(&context, req, &resp);

  SynthesisReply reply;
  if (!status.ok()) {
    reply.error = StatusDetail(status);
    reply.timed_out = IsTimeout(status);
    return reply;
  }
  if (!resp.error().empty()) {
    reply.error = resp.error();
    return reply;
  }
  reply.ok = true;
  reply.audio = BytesFrom(resp.audio());
  return reply;
}

// =============================================================================
// GrpcReferenceVoiceGenerator
// =============================================================================

GrpcReferenceVoiceGenerator::GrpcReferenceVoiceGenerator(
    std::shared_ptr<grpc::Channel> channel, GrpcCollaboratorConfig config)
    : config_(config), stub_(proto::VoiceSynthesisService::NewStub(channel)) {}

ReferenceReply GrpcReferenceVoiceGenerator::GenerateReference(
    voice::Speaker speaker, const std::string& voice_id,
    const std::string& prompt_text) {
  proto::ReferenceVoiceRequest req;
  req.set_speaker(voice::SpeakerName(speaker));
  req.set_voice_id(voice_id);
  req.set_prompt_text(prompt_text);

  proto::ReferenceVoiceResponse resp;
  grpc::ClientContext context;
  SetDeadline(&context, config_.timeout_ms);
  grpc::Status status = stub_->GenerateReference(&context, req, &resp);

  ReferenceReply reply;
  if (!status.ok()) {
    reply.error = StatusDetail(status);
    return reply;
  }
  if (!resp.error().empty()) {
    reply.error = resp.error();
    return reply;
  }
  reply.ok = true;
  reply.audio = BytesFrom(resp.audio());
  return reply;
}

// =============================================================================
// Factory
// =============================================================================

Collaborators MakeGrpcCollaborators(const GrpcTargets& targets,
                                    GrpcCollaboratorConfig config) {
  Collaborators c;
  auto creds = grpc::InsecureChannelCredentials();
  if (!targets.content.empty()) {
    c.content = std::make_shared<GrpcContentStage>(
        grpc::CreateChannel(targets.content, creds), config);
  }
  if (!targets.search.empty()) {
    c.search = std::make_shared<GrpcSearchProvider>(
        grpc::CreateChannel(targets.search, creds), config);
  }
  if (!targets.voice.empty()) {
    c.voice = std::make_shared<GrpcVoiceSynthesis>(
        grpc::CreateChannel(targets.voice, creds), config);
  }
  if (!targets.reference.empty()) {
    c.reference_generator = std::make_shared<GrpcReferenceVoiceGenerator>(
        grpc::CreateChannel(targets.reference, creds), config);
  }
  return c;
}

}  // namespace podwright::collaborators
