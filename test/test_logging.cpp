// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string &level) {
  custody::util::LogManager::Initialize(level, false, "");

  // Component loggers keep their own level; bring them along for "trace"
  if (level == "trace") {
    for (const auto &component : custody::util::LogManager::Components()) {
      custody::util::LogManager::SetComponentLevel(component, "trace");
    }
  }
}

void ShutdownTestLogging() { custody::util::LogManager::Shutdown(); }
