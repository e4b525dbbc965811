// Repository: Podwright
// Component: gRPC collaborator adapters
// Purpose: Clients for ContentStageService, SearchService and
//          VoiceSynthesisService (collaborators.proto). Every call carries a
//          deadline; an expired deadline is reported as a timed-out failure.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_COLLABORATORS_GRPC_COLLABORATORS_HPP_
#define PODWRIGHT_COLLABORATORS_GRPC_COLLABORATORS_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "collaborators.grpc.pb.h"

#include "podwright/collaborators/Collaborators.hpp"

namespace podwright::collaborators {

struct GrpcCollaboratorConfig {
  int64_t timeout_ms = 120000;
};

// host:port per service. An empty search/reference target leaves that
// collaborator unset.
struct GrpcTargets {
  std::string content;
  std::string search;
  std::string voice;
  std::string reference;
};

class GrpcContentStage : public IContentStage {
 public:
  GrpcContentStage(std::shared_ptr<grpc::Channel> channel,
                   GrpcCollaboratorConfig config);

  StageReply RunStage(const StageRequest& request) override;

 private:
  GrpcCollaboratorConfig config_;
  std::unique_ptr<podwright::v1::ContentStageService::Stub> stub_;
};

class GrpcSearchProvider : public ISearchProvider {
 public:
  GrpcSearchProvider(std::shared_ptr<grpc::Channel> channel,
                     GrpcCollaboratorConfig config);

  SearchReply Search(const std::string& query, int32_t max_results) override;

 private:
  GrpcCollaboratorConfig config_;
  std::unique_ptr<podwright::v1::SearchService::Stub> stub_;
};

// Stubs are thread-safe; one instance serves all dispatcher workers.
class GrpcVoiceSynthesis : public IVoiceSynthesis {
 public:
  GrpcVoiceSynthesis(std::shared_ptr<grpc::Channel> channel,
                     GrpcCollaboratorConfig config);

  SynthesisReply Synthesize(const std::string& text,
                            const voice::VoiceProfile& profile) override;

 private:
  GrpcCollaboratorConfig config_;
  std::unique_ptr<podwright::v1::VoiceSynthesisService::Stub> stub_;
};

class GrpcReferenceVoiceGenerator : public IReferenceVoiceGenerator {
 public:
  GrpcReferenceVoiceGenerator(std::shared_ptr<grpc::Channel> channel,
                              GrpcCollaboratorConfig config);

  ReferenceReply GenerateReference(voice::Speaker speaker,
                                   const std::string& voice_id,
                                   const std::string& prompt_text) override;

 private:
  GrpcCollaboratorConfig config_;
  std::unique_ptr<podwright::v1::VoiceSynthesisService::Stub> stub_;
};

// Insecure channels to each target.
Collaborators MakeGrpcCollaborators(const GrpcTargets& targets,
                                    GrpcCollaboratorConfig config);

}  // namespace podwright::collaborators

#endif  // PODWRIGHT_COLLABORATORS_GRPC_COLLABORATORS_HPP_
