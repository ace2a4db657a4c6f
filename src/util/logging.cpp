// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kadcast {
namespace util {

namespace {

constexpr std::array<const char*, 4> kComponents = {"default", "network", "routing", "transport"};

struct LogState {
  std::mutex mutex;
  bool initialized{false};
  std::vector<spdlog::sink_ptr> sinks;
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LogState& State() {
  static LogState state;
  return state;
}

spdlog::level::level_enum ParseLevel(const std::string& level) {
  // spdlog maps unknown names to "off"
  return spdlog::level::from_str(level);
}

// Requires state.mutex held.
void InitializeLocked(LogState& state, const std::string& log_level, bool log_to_file,
                      const std::string& log_file_path) {
  if (state.initialized) {
    return;
  }

  state.sinks.clear();
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  state.sinks.push_back(console);

  if (log_to_file) {
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false);
    file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v");
    state.sinks.push_back(file);
  }

  const auto level = ParseLevel(log_level);
  state.loggers.clear();
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, state.sinks.begin(), state.sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    state.loggers.emplace(name, std::move(logger));
  }
  state.initialized = true;
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  InitializeLocked(state, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  for (auto& [name, logger] : state.loggers) {
    logger->flush();
  }
  state.loggers.clear();
  state.sinks.clear();
  state.initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (!state.initialized) {
    InitializeLocked(state, "off", false, "");
  }
  auto it = state.loggers.find(name);
  if (it == state.loggers.end()) {
    it = state.loggers.find("default");
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  const auto parsed = ParseLevel(level);
  for (auto& [name, logger] : state.loggers) {
    logger->set_level(parsed);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  auto it = state.loggers.find(component);
  if (it != state.loggers.end()) {
    it->second->set_level(ParseLevel(level));
  }
}

bool LogManager::IsInitialized() {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.initialized;
}

}  // namespace util
}  // namespace kadcast
