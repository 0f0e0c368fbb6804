#pragma once
#include "../io/config_types.hpp"
#include "../io/output/hdf5_writer.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace orckit::core {

class OutputManager {
public:
  // Creates the output directory and reports the HDF5 library in use
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config) -> std::expected<void, ApplicationError>;

  // Writes <output_directory>/<case_name>.h5
  [[nodiscard]] auto write_results(const io::output::OutputDataset& dataset, const std::string& case_name,
                                   PerformanceMetrics& metrics)
      -> std::expected<std::filesystem::path, ApplicationError>;

private:
  io::output::HDF5Writer writer_;
  std::filesystem::path output_directory_;
};

} // namespace orckit::core
