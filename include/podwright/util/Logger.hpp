// Repository: Podwright
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by pipeline, dispatcher workers
//          and gRPC adapters.
// Copyright (c) 2025 Podwright

#ifndef PODWRIGHT_UTIL_LOGGER_HPP_
#define PODWRIGHT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace podwright::util {

// Logger serializes every line through one static mutex so that lines from
// synthesis workers and the orchestrator thread never interleave.
//
// Info  -> stdout (stage progress, file output)
// Debug -> stdout only when PODWRIGHT_DEBUG is set
// Warn  -> stderr (retries, fallbacks, discarded snapshots)
// Error -> stderr (failed runs, fatal format mismatches)
//
// Callers prefix lines with the component in brackets and append key=value
// fields, e.g. "[PipelineOrchestrator] STAGE_FAILED stage=Scripting attempt=2".
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Test-only: capture lines in addition to the console stream.
  // Pass nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace podwright::util

#endif  // PODWRIGHT_UTIL_LOGGER_HPP_
