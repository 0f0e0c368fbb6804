#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace orckit::core {

enum class ExitCode : int { Success = 0, Usage = 1, Configuration = 2, Solver = 3, Output = 4 };

// Application-level error handling
struct ApplicationError {
  std::string message;
  ExitCode exit_code;
};

struct CommandLineArgs {
  std::string config_file;
  std::string output_name; // falls back to output.case_name
  bool help_requested = false;
};

// Application result for clean exit handling
struct ApplicationResult {
  bool success;
  ExitCode exit_code;
  std::string message;
};

struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds solve_time{0};
  std::chrono::milliseconds output_time{0};
  std::vector<std::filesystem::path> output_files;
};

} // namespace orckit::core
