#pragma once
#include "../io/config_manager.hpp"
#include "application_types.hpp"
#include "case_runner.hpp"
#include "output_manager.hpp"
#include <expected>
#include <memory>

namespace orckit::core {

class ApplicationRunner {
public:
  ApplicationRunner();
  ~ApplicationRunner();

  // Main application entry point
  [[nodiscard]] auto run(int argc, char* argv[]) -> ApplicationResult;

private:
  std::unique_ptr<io::ConfigurationManager> config_manager_;
  std::unique_ptr<OutputManager> output_manager_;
  std::unique_ptr<CaseRunner> case_runner_;

  [[nodiscard]] auto parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError>;

  auto display_usage(const std::string& program_name) const -> void;

  auto display_header() const -> void;

  auto display_performance_summary(const PerformanceMetrics& metrics) const -> void;

  auto handle_error(const ApplicationError& error) -> ApplicationResult;
};

} // namespace orckit::core
