// Repository: Podwright
// Component: VoiceProfile Registry
// Purpose: Binds each speaker role to exactly one voice profile. Populated
//          once before a run starts and read-only afterwards, so synthesis
//          workers may share it without locking.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_VOICE_VOICE_PROFILE_REGISTRY_HPP_
#define PODWRIGHT_VOICE_VOICE_PROFILE_REGISTRY_HPP_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "podwright/voice/VoiceTypes.hpp"

namespace podwright::collaborators {
class IReferenceVoiceGenerator;
}

namespace podwright::voice {

// Per-role defaults: reference clip name, synthesis parameters and what to ask
// the reference generator for when the clip does not exist yet.
struct VoiceRoleConfig {
  Speaker speaker = Speaker::kUnknown;
  std::string reference_filename;
  SynthesisParams params;
  std::string generator_voice_id;
  std::string generator_prompt;
};

// Host: warm, expressive. Expert: steadier, measured delivery.
std::vector<VoiceRoleConfig> DefaultVoiceRoles();

struct RegistryConfig {
  std::string reference_dir = "voice_references";
  std::vector<VoiceRoleConfig> roles = DefaultVoiceRoles();
};

struct RegistryBuildResult;

class VoiceProfileRegistry {
 public:
  // Resolves every configured role. A missing reference clip is generated
  // through `generator` (may be null) and written into reference_dir; if that
  // fails the role is still bound, without a reference, and a warning is
  // logged. Fails when a recognized role is absent or configured twice.
  static RegistryBuildResult Build(const RegistryConfig& config,
                           collaborators::IReferenceVoiceGenerator* generator);

  // Registry from explicit profiles (no filesystem access). Same role rules.
  static RegistryBuildResult FromProfiles(std::vector<VoiceProfile> profiles);

  VoiceProfileRegistry() = default;

  // nullptr when the role has no profile.
  const VoiceProfile* Resolve(Speaker speaker) const;

  bool Contains(Speaker speaker) const { return profiles_.count(speaker) > 0; }
  size_t size() const { return profiles_.size(); }

 private:
  static std::string CheckRoles(const std::vector<VoiceProfile>& profiles);

  std::map<Speaker, VoiceProfile> profiles_;
};

struct RegistryBuildResult {
  bool ok = false;
  std::string detail;
  VoiceProfileRegistry registry;

  static RegistryBuildResult Success(VoiceProfileRegistry r) {
    RegistryBuildResult result;
    result.ok = true;
    result.registry = std::move(r);
    return result;
  }
  static RegistryBuildResult Failure(const std::string& detail) {
    RegistryBuildResult result;
    result.detail = detail;
    return result;
  }
};

}  // namespace podwright::voice

#endif  // PODWRIGHT_VOICE_VOICE_PROFILE_REGISTRY_HPP_
