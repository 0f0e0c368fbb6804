#include "orckit/core/output_manager.hpp"
#include <chrono>
#include <format>
#include <iostream>

namespace orckit::core {

auto OutputManager::initialize_output_system(const io::Configuration& config) -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  output_directory_ = config.output.output_directory;
  std::error_code ec;
  std::filesystem::create_directories(output_directory_, ec);
  if (ec) {
    return std::unexpected(ApplicationError{
        std::format("Cannot create output directory '{}': {}", output_directory_.string(), ec.message()),
        ExitCode::Output});
  }

  if (auto version = io::output::hdf5::check_version()) {
    std::cout << "✓ HDF5 library version: " << version.value() << std::endl;
  } else {
    std::cerr << "Warning: " << version.error().message() << std::endl;
  }

  std::cout << "✓ Output system configured (" << output_directory_.string() << ")" << std::endl;
  return {};
}

auto OutputManager::write_results(const io::output::OutputDataset& dataset, const std::string& case_name,
                                  PerformanceMetrics& metrics)
    -> std::expected<std::filesystem::path, ApplicationError> {

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  const auto file_path = output_directory_ / (case_name + std::string(writer_.get_extension()));

  auto output_start = std::chrono::high_resolution_clock::now();
  auto output_result = writer_.write(file_path, dataset);
  auto output_end = std::chrono::high_resolution_clock::now();
  metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!output_result) {
    return std::unexpected(
        ApplicationError{"Failed to write output: " + output_result.error().message(), ExitCode::Output});
  }

  metrics.output_files.push_back(file_path);

  std::cout << "✓ Output written successfully!" << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(file_path, ec);
  std::cout << "  " << file_path.filename().string();
  if (!ec) {
    std::cout << std::format(" ({:.2f} KB)", static_cast<double>(file_size) / 1024.0);
  }
  std::cout << std::endl;

  return file_path;
}

} // namespace orckit::core
