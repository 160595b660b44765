#pragma once
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace seagas::core {

// Application-level error handling
struct ApplicationError {
  std::string message;
  int exit_code;
};

struct CommandLineArgs {
  std::string config_file;
  std::optional<std::string> case_name; // overrides output.case_name from the config file
  bool help_requested = false;
};

// Application result for clean exit handling
struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

// Performance metrics for reporting
struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds generation_time{0};
  std::chrono::milliseconds output_time{0};
  std::vector<std::filesystem::path> output_files;
};

} // namespace seagas::core
