#include "orckit/core/application_runner.hpp"
#include "orckit/thermophysics/fluid_library.hpp"
#include <chrono>
#include <iostream>
#include <string>

namespace orckit::core {

ApplicationRunner::ApplicationRunner()
    : config_manager_(std::make_unique<io::ConfigurationManager>()),
      output_manager_(std::make_unique<OutputManager>()), case_runner_(std::make_unique<CaseRunner>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[0] : "orckit");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[0]);
      return {true, ExitCode::Success, "Help displayed"};
    }

    display_header();

    std::cout << "Loading configuration from: " << args.config_file << std::endl;
    auto config_result = config_manager_->load(args.config_file);
    if (!config_result) {
      return handle_error(ApplicationError{config_result.error().message(), ExitCode::Configuration});
    }
    auto config = std::move(config_result.value());
    std::cout << "✓ Configuration loaded successfully" << std::endl;

    auto oracle_result = thermophysics::create_property_oracle(config.fluids);
    if (!oracle_result) {
      return handle_error(ApplicationError{oracle_result.error().message(), ExitCode::Configuration});
    }
    auto oracle = std::move(oracle_result.value());
    std::cout << "✓ Fluid library ready (" << oracle->fluid_names().size() << " fluids)" << std::endl;

    const std::string case_name = args.output_name.empty() ? config.output.case_name : args.output_name;

    if (config.output.write_hdf5) {
      if (auto output_init = output_manager_->initialize_output_system(config); !output_init) {
        return handle_error(output_init.error());
      }
    }

    auto run_result = case_runner_->run(config, *oracle, metrics);
    if (!run_result) {
      return handle_error(run_result.error());
    }
    auto dataset = std::move(run_result.value());
    dataset.metadata.case_name = case_name;
    dataset.metadata.config_file = config_manager_->config_file_path().string();

    case_runner_->display_results(dataset);

    if (config.output.write_hdf5) {
      auto output_result = output_manager_->write_results(dataset, case_name, metrics);
      if (!output_result) {
        return handle_error(output_result.error());
      }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    display_performance_summary(metrics);
    std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;

    return {true, ExitCode::Success, "Success"};

  } catch (const OrckitException& e) {
    return handle_error(ApplicationError{e.full_message(), ExitCode::Configuration});
  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), ExitCode::Configuration});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", ExitCode::Usage});
  }

  CommandLineArgs args;
  const std::string first = argv[1];
  if (first == "-h" || first == "--help") {
    args.help_requested = true;
    return args;
  }

  args.config_file = first;
  if (argc > min_required_args) {
    args.output_name = argv[2];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <case.yaml> [output_name]\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== ORCKIT Heat Exchanger and Expander Solver ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Solve time: " << metrics.solve_time.count() << " ms" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  for (const auto& file : metrics.output_files) {
    std::cout << "Output: " << file.string() << std::endl;
  }
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << "Error: " << error.message << std::endl;
  return {false, error.exit_code, error.message};
}

} // namespace orckit::core
