// Repository: Podwright
// Component: Voice Types
// Copyright (c) 2025 Podwright

#include "podwright/voice/VoiceTypes.hpp"

#include <algorithm>
#include <cctype>

namespace podwright::voice {

const char* SpeakerName(Speaker speaker) {
  switch (speaker) {
    case Speaker::kHost:    return "Host";
    case Speaker::kExpert:  return "Expert";
    case Speaker::kUnknown: return "Unknown";
  }
  return "Unknown";
}

const char* SpeakerFileTag(Speaker speaker) {
  switch (speaker) {
    case Speaker::kHost:    return "host";
    case Speaker::kExpert:  return "expert";
    case Speaker::kUnknown: return "unknown";
  }
  return "unknown";
}

Speaker ParseSpeaker(const std::string& label) {
  size_t begin = 0;
  size_t end = label.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) --end;

  std::string lowered = label.substr(begin, end - begin);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "host") return Speaker::kHost;
  if (lowered == "expert") return Speaker::kExpert;
  return Speaker::kUnknown;
}

}  // namespace podwright::voice
