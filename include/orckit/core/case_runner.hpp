#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_types.hpp"
#include "../thermophysics/property_oracle.hpp"
#include "application_types.hpp"
#include <expected>

namespace orckit::core {

// Runs every component configured in a case and prints their summaries
class CaseRunner {
public:
  [[nodiscard]] auto run(const io::Configuration& config, const thermophysics::PropertyOracle& oracle,
                         PerformanceMetrics& metrics) const -> std::expected<io::output::OutputDataset, ApplicationError>;

  auto display_results(const io::output::OutputDataset& dataset) const -> void;

private:
  [[nodiscard]] auto run_heat_exchanger(const io::HexCaseConfig& config, const thermophysics::PropertyOracle& oracle)
      const -> std::expected<hex::HexResult, ApplicationError>;

  [[nodiscard]] auto run_expander(const io::ExpanderCaseConfig& config, const thermophysics::PropertyOracle& oracle)
      const -> std::expected<expander::ExpanderResult, ApplicationError>;

  auto display_heat_exchanger(const hex::HexResult& result) const -> void;

  auto display_expander(const expander::ExpanderResult& result) const -> void;
};

} // namespace orckit::core
