// Repository: Podwright
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by pipeline, dispatcher workers
//          and gRPC adapters.
// Copyright (c) 2025 Podwright

#include "podwright/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace podwright::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("PODWRIGHT_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace podwright::util
