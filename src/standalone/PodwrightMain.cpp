// Repository: Podwright
// Component: Standalone Runner
// Purpose: Non-interactive harness that runs (or resumes) one podcast run
//          against gRPC collaborator services and reports the outcome.
// Copyright (c) 2025 Podwright
//
// This binary is a harness for exercising the pipeline end to end. It is not
// an interactive front end.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "podwright/collaborators/GrpcCollaborators.hpp"
#include "podwright/pipeline/PipelineConfig.hpp"
#include "podwright/pipeline/PipelineOrchestrator.hpp"
#include "podwright/time/SystemTimeSource.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string topic;
  std::string resume_run_id;

  std::string content_target;
  std::string search_target;
  std::string voice_target;
  std::string reference_target;  // Defaults to voice_target

  std::string output_root;  // Empty: PODWRIGHT_OUTPUT_ROOT or default
  int32_t workers = 0;      // 0: config default
  int32_t gap_ms = -1;      // -1: config default

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --topic TEXT --content HOST:PORT "
            << "--voice HOST:PORT [OPTIONS]\n"
            << "\n"
            << "Runs one topic through research, summary, script, per-line\n"
            << "synthesis and stitching, writing <output>/<run_id>/final_podcast.wav.\n"
            << "\n"
            << "COLLABORATORS:\n"
            << "  --content HOST:PORT    ContentStageService (required)\n"
            << "  --voice HOST:PORT      VoiceSynthesisService (required)\n"
            << "  --search HOST:PORT     SearchService (optional)\n"
            << "  --reference HOST:PORT  Reference voice generator (default: --voice)\n"
            << "\n"
            << "RUN OPTIONS:\n"
            << "  --topic TEXT           Podcast topic (required)\n"
            << "  --resume RUN_ID        Resume a persisted run\n"
            << "  --output DIR           Output root (default: output)\n"
            << "  --workers N            Synthesis workers (default: 1)\n"
            << "  --gap-ms MS            Silence at speaker changes (default: 500)\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  PODWRIGHT_OUTPUT_ROOT, PODWRIGHT_MAX_STAGE_ATTEMPTS,\n"
            << "  PODWRIGHT_MAX_LINE_ATTEMPTS, PODWRIGHT_GAP_MS, PODWRIGHT_SYNTH_WORKERS,\n"
            << "  PODWRIGHT_TIMEOUT_MS, PODWRIGHT_VOICE_REFERENCE_DIR, PODWRIGHT_PERSIST,\n"
            << "  PODWRIGHT_DEBUG\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --topic \"Quantum computing\" \\\n"
            << "      --content localhost:50051 --voice localhost:50052\n"
            << "\n";
}

bool ParseInt(const std::string& value, int32_t* out) {
  try {
    size_t used = 0;
    int v = std::stoi(value, &used);
    if (used != value.size()) return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--topic" && i + 1 < argc) {
      args.topic = argv[++i];
    } else if (arg == "--resume" && i + 1 < argc) {
      args.resume_run_id = argv[++i];
    } else if (arg == "--content" && i + 1 < argc) {
      args.content_target = argv[++i];
    } else if (arg == "--search" && i + 1 < argc) {
      args.search_target = argv[++i];
    } else if (arg == "--voice" && i + 1 < argc) {
      args.voice_target = argv[++i];
    } else if (arg == "--reference" && i + 1 < argc) {
      args.reference_target = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      args.output_root = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &args.workers) || args.workers < 1) {
        args.error = "--workers expects a positive integer";
        return args;
      }
    } else if (arg == "--gap-ms" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &args.gap_ms) || args.gap_ms < 0) {
        args.error = "--gap-ms expects a non-negative integer";
        return args;
      }
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (args.topic.empty()) {
    args.error = "--topic is required";
    return args;
  }
  if (args.content_target.empty() || args.voice_target.empty()) {
    args.error = "--content and --voice are required";
    return args;
  }
  if (args.reference_target.empty()) {
    args.reference_target = args.voice_target;
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  using podwright::pipeline::PipelineConfig;
  PipelineConfig config = PipelineConfig::FromEnvironment();
  if (!args.output_root.empty()) config.output_root = args.output_root;
  if (args.workers > 0) config.synthesis_workers = args.workers;
  if (args.gap_ms >= 0) config.inter_turn_gap_ms = args.gap_ms;

  podwright::collaborators::GrpcTargets targets;
  targets.content = args.content_target;
  targets.search = args.search_target;
  targets.voice = args.voice_target;
  targets.reference = args.reference_target;
  podwright::collaborators::GrpcCollaboratorConfig grpc_config;
  grpc_config.timeout_ms = config.collaborator_timeout_ms;

  std::unique_ptr<podwright::pipeline::PipelineOrchestrator> orchestrator;
  try {
    orchestrator = std::make_unique<podwright::pipeline::PipelineOrchestrator>(
        config, podwright::collaborators::MakeGrpcCollaborators(targets, grpc_config),
        std::make_shared<podwright::SystemTimeSource>());
  } catch (const std::runtime_error& e) {
    std::cerr << "[PODWRIGHT] Startup failed: " << e.what() << "\n";
    return 1;
  }

  // Signal handlers only set the flag; Cancel() is issued from this thread.
  std::atomic<bool> run_finished{false};
  std::thread cancel_watcher([&] {
    while (!run_finished.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        orchestrator->Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  podwright::pipeline::RunResult result =
      args.resume_run_id.empty()
          ? orchestrator->Run(args.topic)
          : orchestrator->Resume(args.resume_run_id, args.topic);

  run_finished.store(true, std::memory_order_release);
  cancel_watcher.join();

  if (!result.ok) {
    std::cerr << "[PODWRIGHT] Run " << result.run.run_id << " failed: "
              << result.error.Describe() << "\n";
    return 1;
  }

  std::cout << "[PODWRIGHT] Run " << result.run.run_id << " complete\n"
            << "  master:   " << result.master.output_path << "\n"
            << "  duration: " << (result.master.total_duration_ms() / 1000.0) << "s\n"
            << "  segments: " << result.master.boundaries.size() << "\n";
  return 0;
}
