#include "orckit/core/case_runner.hpp"
#include "orckit/expander/expander_solver.hpp"
#include "orckit/hex/hex_solver.hpp"
#include <chrono>
#include <cmath>
#include <format>
#include <iostream>

namespace orckit::core {

auto CaseRunner::run(const io::Configuration& config, const thermophysics::PropertyOracle& oracle,
                     PerformanceMetrics& metrics) const -> std::expected<io::output::OutputDataset, ApplicationError> {

  io::output::OutputDataset dataset;
  dataset.metadata.case_name = config.output.case_name;

  auto solve_start = std::chrono::high_resolution_clock::now();

  if (config.heat_exchanger) {
    auto hex_result = run_heat_exchanger(*config.heat_exchanger, oracle);
    if (!hex_result) {
      return std::unexpected(hex_result.error());
    }
    dataset.heat_exchanger = std::move(hex_result.value());
  }

  if (config.expander) {
    auto expander_result = run_expander(*config.expander, oracle);
    if (!expander_result) {
      return std::unexpected(expander_result.error());
    }
    dataset.expander = std::move(expander_result.value());
  }

  auto solve_end = std::chrono::high_resolution_clock::now();
  metrics.solve_time = std::chrono::duration_cast<std::chrono::milliseconds>(solve_end - solve_start);

  return dataset;
}

auto CaseRunner::run_heat_exchanger(const io::HexCaseConfig& config, const thermophysics::PropertyOracle& oracle) const
    -> std::expected<hex::HexResult, ApplicationError> {

  std::cout << "\n=== HEAT EXCHANGER ===" << std::endl;
  std::cout << std::format("  Model: {}", hex::model_name(config.exchanger.model)) << std::endl;
  std::cout << std::format("  Hot:  {} at {:.4g} bar, {:.4g} kg/s", config.hot.fluid, config.hot.pressure / 1e5,
                           config.hot.mass_flow)
            << std::endl;
  std::cout << std::format("  Cold: {} at {:.4g} bar, {:.4g} kg/s", config.cold.fluid, config.cold.pressure / 1e5,
                           config.cold.mass_flow)
            << std::endl;

  const hex::HexSolver solver(oracle, config.exchanger);
  auto result = solver.solve(config.hot, config.cold);
  if (!result) {
    return std::unexpected(ApplicationError{result.error().message(), ExitCode::Solver});
  }

  std::cout << "✓ Heat exchanger solved (flag " << result->flag_value() << ")" << std::endl;
  return std::move(result.value());
}

auto CaseRunner::run_expander(const io::ExpanderCaseConfig& config, const thermophysics::PropertyOracle& oracle) const
    -> std::expected<expander::ExpanderResult, ApplicationError> {

  std::cout << "\n=== EXPANDER ===" << std::endl;
  std::cout << std::format("  Model: {}", expander::model_name(config.machine.model)) << std::endl;
  std::cout << std::format("  Supply: {} at {:.4g} bar, {:.4g} kg/s", config.supply.fluid,
                           config.supply.pressure / 1e5, config.supply.mass_flow)
            << std::endl;
  std::cout << std::format("  Exhaust pressure: {:.4g} bar", config.exhaust_pressure / 1e5) << std::endl;

  const expander::ExpanderSolver solver(oracle, config.machine);
  auto result = solver.solve(config.supply, config.exhaust_pressure, config.ambient_temperature);
  if (!result) {
    return std::unexpected(ApplicationError{result.error().message(), ExitCode::Solver});
  }

  std::cout << "✓ Expander solved (flag " << result->flag_value() << ")" << std::endl;
  return std::move(result.value());
}

auto CaseRunner::display_results(const io::output::OutputDataset& dataset) const -> void {
  if (dataset.heat_exchanger) {
    display_heat_exchanger(*dataset.heat_exchanger);
  }
  if (dataset.expander) {
    display_expander(*dataset.expander);
  }
}

auto CaseRunner::display_heat_exchanger(const hex::HexResult& result) const -> void {
  std::cout << "\n=== HEAT EXCHANGER SUMMARY ===" << std::endl;
  std::cout << std::format("  Model:          {}{}", result.model, result.reversed ? " (streams reversed)" : "")
            << std::endl;
  std::cout << std::format("  Flag:           {}", result.flag_value()) << std::endl;
  std::cout << std::format("  Duty:           {:.2f} W (max {:.2f} W)", result.duty, result.duty_max) << std::endl;
  std::cout << std::format("  Effectiveness:  {:.4f}", result.effectiveness) << std::endl;
  std::cout << std::format("  Pinch:          {:.3f} K", result.pinch) << std::endl;
  std::cout << std::format("  Hot exhaust:    {:.2f} K", result.T_hot_ex) << std::endl;
  std::cout << std::format("  Cold exhaust:   {:.2f} K", result.T_cold_ex) << std::endl;
  std::cout << std::format("  Inventory:      {:.4f} kg hot, {:.4f} kg cold", result.mass_hot, result.mass_cold)
            << std::endl;
  if (!std::isnan(result.residual)) {
    std::cout << std::format("  Residual:       {:.3e} ({} iterations)", result.residual, result.iterations)
              << std::endl;
  }

  if (!result.zones.empty()) {
    std::cout << "\n  Zones (cold end first):" << std::endl;
    std::cout << std::format("  {:>4} {:>5} {:>5} {:>12} {:>10} {:>10}", "#", "hot", "cold", "Q [W]", "dTlog [K]",
                             "A_h [m2]")
              << std::endl;
    for (std::size_t i = 0; i < result.zones.size(); ++i) {
      const auto& zone = result.zones[i];
      std::cout << std::format("  {:>4} {:>5} {:>5} {:>12.2f} {:>10.3f} {:>10.4f}", i, hex::phase_name(zone.hot_phase),
                               hex::phase_name(zone.cold_phase), zone.duty(), zone.dt_log, zone.area_hot)
                << std::endl;
    }
  }
}

auto CaseRunner::display_expander(const expander::ExpanderResult& result) const -> void {
  std::cout << "\n=== EXPANDER SUMMARY ===" << std::endl;
  std::cout << std::format("  Model:                 {}", result.model) << std::endl;
  std::cout << std::format("  Flag:                  {}", result.flag_value()) << std::endl;
  std::cout << std::format("  Power:                 {:.2f} W", result.power) << std::endl;
  std::cout << std::format("  Isentropic efficiency: {:.4f}", result.isentropic_efficiency) << std::endl;
  std::cout << std::format("  Filling factor:        {:.4f}", result.filling_factor) << std::endl;
  std::cout << std::format("  Speed:                 {:.1f} rpm", result.speed) << std::endl;
  std::cout << std::format("  Exhaust temperature:   {:.2f} K", result.T_ex) << std::endl;
  std::cout << std::format("  Ambient loss:          {:.2f} W", result.ambient_loss) << std::endl;
  std::cout << std::format("  Retained mass:         {:.5f} kg", result.mass) << std::endl;
  if (!std::isnan(result.wall_temperature)) {
    std::cout << std::format("  Wall temperature:      {:.2f} K (residual {:.3e})", result.wall_temperature,
                             result.residual)
              << std::endl;
  }
}

} // namespace orckit::core
