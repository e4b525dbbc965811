// Repository: Podwright
// Component: VoiceProfile Registry
// Copyright (c) 2025 Podwright

#include "podwright/voice/VoiceProfileRegistry.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "podwright/collaborators/Collaborators.hpp"
#include "podwright/util/Logger.hpp"

namespace podwright::voice {

using podwright::util::Logger;
namespace fs = std::filesystem;

namespace {

bool WriteReferenceClip(const fs::path& path, const std::vector<uint8_t>& bytes,
                        std::string* error) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    *error = "cannot create " + path.parent_path().string() + ": " + ec.message();
    return false;
  }
  std::ofstream of(path, std::ios::binary | std::ios::trunc);
  if (!of) {
    *error = "cannot open " + path.string();
    return false;
  }
  of.write(reinterpret_cast<const char*>(bytes.data()),
           static_cast<std::streamsize>(bytes.size()));
  of.flush();
  if (!of) {
    *error = "write failed " + path.string();
    return false;
  }
  return true;
}

bool ReadReferenceClip(const fs::path& path, std::vector<uint8_t>* bytes,
                       std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    *error = "cannot open " + path.string();
    return false;
  }
  bytes->assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
  if (in.bad()) {
    *error = "read failed " + path.string();
    return false;
  }
  if (bytes->empty()) {
    *error = "empty clip " + path.string();
    return false;
  }
  return true;
}

}  // namespace

std::vector<VoiceRoleConfig> DefaultVoiceRoles() {
  VoiceRoleConfig host;
  host.speaker = Speaker::kHost;
  host.reference_filename = "host_female_ref.wav";
  host.params.exaggeration = 0.65f;
  host.params.cfg_weight = 0.5f;
  host.params.temperature = 0.8f;
  host.generator_voice_id = "en-US-AvaNeural";
  host.generator_prompt =
      "Hey everyone! Welcome back to the show. I'm really, really excited "
      "to dive into today's topic. It's something that's been on my mind "
      "for a while, you know? So, yeah... I've brought in a real expert to "
      "help us break it all down. Let's get into it!";

  VoiceRoleConfig expert;
  expert.speaker = Speaker::kExpert;
  expert.reference_filename = "expert_male_ref.wav";
  expert.params.exaggeration = 0.4f;
  expert.params.cfg_weight = 0.6f;
  expert.params.temperature = 0.75f;
  expert.generator_voice_id = "en-US-AndrewNeural";
  expert.generator_prompt =
      "Thanks for the warm intro. You know, it's actually a pretty complex "
      "subject, but... well, I think we can make it really approachable. "
      "There's a lot of nuance here that people often miss, and I'm looking "
      "forward to sharing some of those insights today.";

  return {host, expert};
}

std::string VoiceProfileRegistry::CheckRoles(
    const std::vector<VoiceProfile>& profiles) {
  std::map<Speaker, int> seen;
  for (const auto& p : profiles) {
    if (p.speaker == Speaker::kUnknown) {
      return "profile bound to unrecognized speaker";
    }
    if (++seen[p.speaker] > 1) {
      return std::string("duplicate profile for ") + SpeakerName(p.speaker);
    }
  }
  for (Speaker role : {Speaker::kHost, Speaker::kExpert}) {
    if (seen.count(role) == 0) {
      return std::string("no profile for ") + SpeakerName(role);
    }
  }
  return "";
}

RegistryBuildResult VoiceProfileRegistry::FromProfiles(
    std::vector<VoiceProfile> profiles) {
  std::string problem = CheckRoles(profiles);
  if (!problem.empty()) {
    return RegistryBuildResult::Failure(problem);
  }
  VoiceProfileRegistry registry;
  for (auto& p : profiles) {
    Speaker role = p.speaker;
    registry.profiles_.emplace(role, std::move(p));
  }
  return RegistryBuildResult::Success(std::move(registry));
}

RegistryBuildResult VoiceProfileRegistry::Build(
    const RegistryConfig& config,
    collaborators::IReferenceVoiceGenerator* generator) {
  std::vector<VoiceProfile> profiles;
  profiles.reserve(config.roles.size());

  for (const auto& role : config.roles) {
    VoiceProfile profile;
    profile.speaker = role.speaker;
    profile.synthesis_params = role.params;

    fs::path ref_path = fs::path(config.reference_dir) / role.reference_filename;
    std::error_code ec;
    if (!role.reference_filename.empty() && fs::exists(ref_path, ec)) {
      std::string read_error;
      if (ReadReferenceClip(ref_path, &profile.reference_audio, &read_error)) {
        profile.reference_sample_path = ref_path.string();
      } else {
        profile.reference_audio.clear();
        Logger::Warn("[VoiceProfileRegistry] REFERENCE_FALLBACK speaker=" +
                     std::string(SpeakerName(role.speaker)) + " reason=" +
                     read_error + " using default voice");
      }
    } else if (generator != nullptr && !role.reference_filename.empty()) {
      std::ostringstream oss;
      oss << "[VoiceProfileRegistry] REFERENCE_MISSING speaker="
          << SpeakerName(role.speaker) << " path=" << ref_path.string()
          << " generating voice_id=" << role.generator_voice_id;
      Logger::Info(oss.str());

      auto reply = generator->GenerateReference(role.speaker,
                                                role.generator_voice_id,
                                                role.generator_prompt);
      std::string write_error;
      if (reply.ok && !reply.audio.empty() &&
          WriteReferenceClip(ref_path, reply.audio, &write_error)) {
        profile.reference_sample_path = ref_path.string();
        profile.reference_audio = std::move(reply.audio);
      } else {
        std::ostringstream warn;
        warn << "[VoiceProfileRegistry] REFERENCE_FALLBACK speaker="
             << SpeakerName(role.speaker) << " reason="
             << (!reply.ok ? reply.error
                           : reply.audio.empty() ? "empty clip" : write_error)
             << " using default voice";
        Logger::Warn(warn.str());
      }
    } else {
      std::ostringstream warn;
      warn << "[VoiceProfileRegistry] REFERENCE_FALLBACK speaker="
           << SpeakerName(role.speaker) << " path=" << ref_path.string()
           << " reason=no generator using default voice";
      Logger::Warn(warn.str());
    }

    std::ostringstream oss;
    oss << "[VoiceProfileRegistry] BOUND speaker=" << SpeakerName(role.speaker)
        << " reference=" << (profile.reference_sample_path.empty()
                                 ? "<default>" : profile.reference_sample_path)
        << " reference_bytes=" << profile.reference_audio.size()
        << " exaggeration=" << role.params.exaggeration
        << " cfg_weight=" << role.params.cfg_weight
        << " temperature=" << role.params.temperature;
    Logger::Debug(oss.str());

    profiles.push_back(std::move(profile));
  }

  return FromProfiles(std::move(profiles));
}

const VoiceProfile* VoiceProfileRegistry::Resolve(Speaker speaker) const {
  auto it = profiles_.find(speaker);
  return it == profiles_.end() ? nullptr : &it->second;
}

}  // namespace podwright::voice
