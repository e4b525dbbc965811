// Repository: Podwright
// Component: Script Parser
// Purpose: Turns the script-writing collaborator's reply, a JSON array of
//          {"speaker", "text"} objects optionally wrapped in markdown code
//          fences, into a Script with position-assigned indices.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_PIPELINE_SCRIPT_PARSER_HPP_
#define PODWRIGHT_PIPELINE_SCRIPT_PARSER_HPP_

#include <string>

#include "podwright/pipeline/PipelineTypes.hpp"

namespace podwright::pipeline {

struct ScriptParseResult {
  bool ok;
  std::string detail;
  Script script;

  static ScriptParseResult Success(Script s) { return {true, "", std::move(s)}; }
  static ScriptParseResult Failure(const std::string& detail) {
    return {false, detail, Script{}};
  }
};

class ScriptParser {
 public:
  // Unrecognized speaker labels become Speaker::kUnknown; rejecting them is
  // the validator's job. Extra keys are ignored. Malformed JSON or an entry
  // without "speaker"/"text" fails the parse.
  static ScriptParseResult Parse(const std::string& raw);

  // Drops every line starting with ``` when the trimmed text opens with one.
  static std::string StripCodeFences(const std::string& raw);
};

}  // namespace podwright::pipeline

#endif  // PODWRIGHT_PIPELINE_SCRIPT_PARSER_HPP_
