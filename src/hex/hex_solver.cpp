#include "orckit/hex/hex_solver.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/hex/convection_strategy.hpp"
#include "orckit/hex/zone_inventory.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>
#include <optional>
#include <utility>

namespace orckit::hex {

using thermophysics::Property;
using thermophysics::SupplyConditions;

namespace {

[[nodiscard]] auto uses_subdivisions(const HexModel& model) noexcept -> bool {
  return std::holds_alternative<ScaledCoefficientModel>(model) || std::holds_alternative<CorrelationModel>(model);
}

[[nodiscard]] auto polynomial_effectiveness(const PolynomialEffectivenessModel& model, double hot_flow,
                                            double cold_flow) -> double {
  const double rh = hot_flow / model.nominal_hot_flow;
  const double rc = cold_flow / model.nominal_cold_flow;
  core::RegressionCoefficients features(6);
  features << 1.0, rh, rc, rh * rh, rh * rc, rc * rc;
  return std::clamp(model.coefficients.dot(features), constants::hex::min_polynomial_effectiveness, 1.0);
}

// Duty fraction along the hot enthalpy and cumulative hot side volume fraction
void fill_fractions(HexResult& result) {
  const std::size_t n_points = result.h_hot.size();
  result.duty_fraction.assign(n_points, 0.0);
  result.geometric_fraction.assign(n_points, 0.0);
  if (n_points < 2) {
    return;
  }

  const double span = result.h_hot.back() - result.h_hot.front();
  double total_volume = 0.0;
  for (const auto& zone : result.zones) {
    total_volume += zone.volume_hot;
  }

  double cumulative_volume = 0.0;
  for (std::size_t i = 0; i < n_points; ++i) {
    const double linear = static_cast<double>(i) / static_cast<double>(n_points - 1);
    result.duty_fraction[i] = span != 0.0 ? (result.h_hot[i] - result.h_hot.front()) / span : linear;
    if (i > 0) {
      cumulative_volume += result.zones[i - 1].volume_hot;
    }
    result.geometric_fraction[i] = total_volume > 0.0 ? cumulative_volume / total_volume : linear;
  }
  result.duty_fraction.back() = 1.0;
  result.geometric_fraction.back() = 1.0;
}

void mean_coefficients_by_phase(HexResult& result) {
  auto mean_of = [&](ZonePhase phase, bool hot_side) {
    double sum = 0.0;
    int count = 0;
    for (const auto& zone : result.zones) {
      if ((hot_side ? zone.hot_phase : zone.cold_phase) == phase) {
        sum += hot_side ? zone.h_conv_hot : zone.h_conv_cold;
        ++count;
      }
    }
    return count > 0 ? sum / count : nan;
  };
  result.h_conv_hot_mean = {mean_of(ZonePhase::Liquid, true), mean_of(ZonePhase::TwoPhase, true),
                            mean_of(ZonePhase::Vapor, true)};
  result.h_conv_cold_mean = {mean_of(ZonePhase::Liquid, false), mean_of(ZonePhase::TwoPhase, false),
                             mean_of(ZonePhase::Vapor, false)};
}

void swap_sides(BoundaryState& state, double total_duty) {
  std::swap(state.h_hot, state.h_cold);
  std::swap(state.T_hot, state.T_cold);
  state.duty = total_duty - state.duty;
}

void warn_root_failure(std::string_view search, const numerics::RootFinderError& error) {
  std::cerr << "Warning: " << search << " did not converge: " << error.message() << std::endl;
}

} // namespace

// ================================================================================================
// CONFIGURATION CHECKS AND ROLE EXCHANGE
// ================================================================================================

auto validate_hex_config(const HexConfig& config) -> std::expected<void, HexSolverError> {

  auto fail = [](std::string_view message) -> std::expected<void, HexSolverError> {
    return std::unexpected(HexSolverError(message));
  };

  if (config.two_phase_subdivisions < 1) {
    return fail("two-phase subdivisions must be at least 1");
  }
  if (config.hot.volume < 0.0 || config.cold.volume < 0.0) {
    return fail("side volumes must be non-negative");
  }

  if (const auto* pinch = std::get_if<ConstantPinchModel>(&config.model)) {
    if (!(pinch->pinch > 0.0)) {
      return fail("CstPinch requires a positive pinch");
    }
  } else if (const auto* eff = std::get_if<ConstantEffectivenessModel>(&config.model)) {
    if (!(eff->effectiveness > 0.0 && eff->effectiveness <= 1.0)) {
      return fail("CstEff requires an effectiveness in (0, 1]");
    }
  } else if (const auto* pol = std::get_if<PolynomialEffectivenessModel>(&config.model)) {
    if (pol->coefficients.size() != 6) {
      return fail(std::format("PolEff requires 6 coefficients, got {}", pol->coefficients.size()));
    }
    if (!(pol->nominal_hot_flow > 0.0 && pol->nominal_cold_flow > 0.0)) {
      return fail("PolEff requires positive nominal mass flows");
    }
  }

  if (!is_area_matching(config.model)) {
    return {};
  }

  if (!(config.hot.area > 0.0 && config.cold.area > 0.0)) {
    return fail(std::format("{} requires positive hot and cold side areas", model_name(config.model)));
  }

  if (const auto* scaled = std::get_if<ScaledCoefficientModel>(&config.model)) {
    if (!(scaled->nominal_hot_flow > 0.0 && scaled->nominal_cold_flow > 0.0)) {
      return fail("hConvVar requires positive nominal mass flows");
    }
  }

  if (const auto* correlation = std::get_if<CorrelationModel>(&config.model)) {
    if (!is_condensation(correlation->hot.two_phase) && correlation->hot.two_phase != TwoPhaseCorrelation::Manual) {
      return fail("hot side two-phase correlation must be a condensation correlation or Manual");
    }
    if (!is_boiling(correlation->cold.two_phase) && correlation->cold.two_phase != TwoPhaseCorrelation::Manual) {
      return fail("cold side two-phase correlation must be a boiling correlation or Manual");
    }
    for (const auto* side : {&config.hot, &config.cold}) {
      if (!(side->hydraulic_diameter > 0.0 && side->cross_section > 0.0 && side->n_canals > 0.0)) {
        return fail("hConvCor requires hydraulic diameter, cross section and canal count on both sides");
      }
    }
    const double max_thonon_angle = 60.0 * constants::physical::pi / 180.0;
    for (const auto* side : {&correlation->hot, &correlation->cold}) {
      if (side->single_phase == SinglePhaseCorrelation::Thonon && config.plate.chevron_angle > max_thonon_angle) {
        return fail("Thonon correlation is tabulated for chevron angles up to 60 degrees");
      }
    }
  }

  for (const auto& [settings, geometry] :
       {std::pair{&config.void_fraction_hot, &config.hot}, std::pair{&config.void_fraction_cold, &config.cold}}) {
    const bool needs_mass_flux =
        settings->model == VoidFractionModel::Premoli || settings->model == VoidFractionModel::Hughmark;
    if (needs_mass_flux && !(geometry->cross_section > 0.0 && geometry->hydraulic_diameter > 0.0)) {
      return fail("Premoli and Hughmark void fractions require hydraulic diameter and cross section");
    }
    if (settings->model == VoidFractionModel::Personal &&
        !(settings->mass_averaged_void_fraction >= 0.0 && settings->mass_averaged_void_fraction <= 1.0)) {
      return fail("mass-averaged void fraction must lie in [0, 1]");
    }
    if (settings->model == VoidFractionModel::SlipRatio && !(settings->slip_ratio > 0.0)) {
      return fail("slip ratio must be positive");
    }
  }

  return {};
}

auto reversed_config(const HexConfig& config) -> HexConfig {
  HexConfig reversed = config;
  std::swap(reversed.hot, reversed.cold);
  std::swap(reversed.void_fraction_hot, reversed.void_fraction_cold);

  if (auto* pol = std::get_if<PolynomialEffectivenessModel>(&reversed.model)) {
    const core::RegressionCoefficients c = pol->coefficients;
    pol->coefficients << c(0), c(2), c(1), c(5), c(4), c(3);
    std::swap(pol->nominal_hot_flow, pol->nominal_cold_flow);
  } else if (auto* scaled = std::get_if<ScaledCoefficientModel>(&reversed.model)) {
    std::swap(scaled->hot_nominal, scaled->cold_nominal);
    std::swap(scaled->hot_exponents, scaled->cold_exponents);
    std::swap(scaled->nominal_hot_flow, scaled->nominal_cold_flow);
  }
  return reversed;
}

void restore_stream_roles(HexResult& result) {
  std::ranges::reverse(result.zones);
  for (auto& zone : result.zones) {
    std::swap(zone.lower, zone.upper);
    swap_sides(zone.lower, result.duty);
    swap_sides(zone.upper, result.duty);
    std::swap(zone.hot_phase, zone.cold_phase);
    std::swap(zone.h_conv_hot, zone.h_conv_cold);
    std::swap(zone.fin_efficiency_hot, zone.fin_efficiency_cold);
    std::swap(zone.area_hot, zone.area_cold);
    std::swap(zone.volume_hot, zone.volume_cold);
    std::swap(zone.mass_hot, zone.mass_cold);
    std::swap(zone.liquid_weight_hot, zone.liquid_weight_cold);
  }

  std::swap(result.h_hot_ex, result.h_cold_ex);
  std::swap(result.T_hot_ex, result.T_cold_ex);
  std::swap(result.mass_hot, result.mass_cold);
  std::swap(result.h_conv_hot_mean, result.h_conv_cold_mean);

  for (auto [first, second] : {std::pair{&result.h_hot, &result.h_cold}, std::pair{&result.T_hot, &result.T_cold},
                               std::pair{&result.s_hot, &result.s_cold}, std::pair{&result.q_hot, &result.q_cold}}) {
    std::swap(*first, *second);
    std::ranges::reverse(*first);
    std::ranges::reverse(*second);
  }

  fill_fractions(result);
}

// ================================================================================================
// SOLVER
// ================================================================================================

HexSolver::HexSolver(const thermophysics::PropertyOracle& oracle, HexConfig config)
    : oracle_(oracle), config_(std::move(config)) {}

auto HexSolver::solve_closed_form(const HexModel& model, const SupplyConditions& hot, const SupplyConditions& cold,
                                  const MaximumDuty& maximum) const -> DutySolution {
  DutySolution solution;
  double effectiveness = 1.0;
  if (const auto* constant = std::get_if<ConstantEffectivenessModel>(&model)) {
    effectiveness = constant->effectiveness;
  } else if (const auto* polynomial = std::get_if<PolynomialEffectivenessModel>(&model)) {
    effectiveness = polynomial_effectiveness(*polynomial, hot.mass_flow, cold.mass_flow);
  }

  solution.duty = effectiveness * maximum.duty;
  solution.flag = std::abs(maximum.pinch) < constants::hex::zero_pinch_tolerance ? HexFlag::Converged
                                                                                  : HexFlag::InfeasiblePinch;
  return solution;
}

auto HexSolver::solve_constant_pinch(const ZoneProfileBuilder& builder, const ConstantPinchModel& model,
                                     const MaximumDuty& maximum) const -> std::expected<DutySolution, HexSolverError> {
  DutySolution solution;
  const double target = model.pinch;

  // Supply temperatures closer than the target pinch: nothing can be transferred
  if (builder.hot().temperature - builder.cold().temperature <= target) {
    solution.duty = 0.0;
    solution.flag = HexFlag::DutyLimited;
    return solution;
  }

  auto pinch_residual = [&](double duty) -> std::expected<double, HexSolverError> {
    double pinch = 0.0;
    ORCKIT_TRY_ASSIGN(pinch, builder.pinch(duty));
    return pinch - target;
  };

  if (maximum.pinch >= target) {
    solution.duty = maximum.duty;
  } else {
    numerics::RootFinderConfig root_config;
    root_config.relative_tolerance = constants::tolerance::duty_relative;
    root_config.absolute_tolerance = constants::tolerance::duty_absolute;
    const numerics::BrentRootFinder solver(root_config);

    auto root = solver.solve(pinch_residual, 0.0, maximum.duty);
    if (root) {
      solution.duty = root->root;
      solution.iterations = root->iterations;
    } else {
      warn_root_failure("pinch matching", root.error());
      const double last = root.error().last_iterate();
      solution.duty = std::isfinite(last) ? std::clamp(last, 0.0, maximum.duty) : 0.0;
    }
  }

  double pinch = 0.0;
  ORCKIT_TRY_ASSIGN(pinch, builder.pinch(solution.duty));
  solution.residual = std::abs(1.0 - pinch / target);
  solution.flag =
      solution.residual < constants::hex::pinch_residual_tolerance ? HexFlag::Converged : HexFlag::NotConverged;
  return solution;
}

auto HexSolver::solve_area_matching(const HexModel& model, const ZoneProfileBuilder& builder,
                                    const HeatTransferZoneEvaluator& evaluator, const MaximumDuty& maximum) const
    -> std::expected<DutySolution, HexSolverError> {

  auto area_residual = [&](double duty) -> std::expected<double, HexSolverError> {
    Profile profile;
    ORCKIT_TRY_ASSIGN(profile, builder.build(duty));
    AreaEvaluation evaluation;
    ORCKIT_TRY_ASSIGN(evaluation, evaluator.evaluate(profile, builder.hot(), builder.cold()));
    return evaluation.residual;
  };

  const bool correlated = std::holds_alternative<CorrelationModel>(model);
  const double lower = correlated ? constants::hex::correlation_min_duty : 0.0;

  DutySolution solution;
  double residual_at_max = 0.0;
  ORCKIT_TRY_ASSIGN_CTX(residual_at_max, area_residual(maximum.duty), HexSolverError,
                        "area residual at maximum duty");

  // Area left over at the maximum duty: the exchanger is oversized
  if (residual_at_max > 0.0 || maximum.duty <= lower) {
    solution.duty = maximum.duty;
    solution.residual = residual_at_max;
    solution.flag = std::abs(maximum.pinch) < constants::hex::zero_pinch_tolerance ? HexFlag::DutyLimited
                                                                                    : HexFlag::InfeasiblePinch;
    return solution;
  }

  numerics::RootFinderConfig root_config;
  root_config.relative_tolerance = constants::tolerance::duty_relative;
  root_config.absolute_tolerance = std::holds_alternative<ScaledCoefficientModel>(model)
                                       ? constants::tolerance::duty_absolute_fine
                                       : constants::tolerance::duty_absolute;
  const numerics::BrentRootFinder solver(root_config);

  // An unmatched area is blamed on the maximum duty when its pinch is not zero
  const HexFlag unmatched =
      std::abs(maximum.pinch) < constants::hex::zero_pinch_tolerance ? HexFlag::NotConverged : HexFlag::InfeasiblePinch;

  auto root = solver.solve(area_residual, lower, maximum.duty);
  if (!root) {
    warn_root_failure("area matching", root.error());
    const double last = root.error().last_iterate();
    solution.duty = std::isfinite(last) ? std::clamp(last, lower, maximum.duty) : lower;
    solution.flag = unmatched;
    return solution;
  }

  solution.duty = root->root;
  solution.residual = root->residual;
  solution.iterations = root->iterations;
  solution.flag = root->converged && std::abs(root->residual) < constants::hex::area_residual_tolerance
                      ? HexFlag::Converged
                      : unmatched;
  return solution;
}

auto HexSolver::assemble(Profile& profile, const SupplyConditions& hot, const SupplyConditions& cold,
                         const HexConfig& config, bool area_based) const -> std::expected<HexResult, HexSolverError> {
  const ZoneInventory inventory(oracle_, config);
  InventoryTotals totals;
  ORCKIT_TRY_ASSIGN(totals, inventory.fill(profile, hot, cold, area_based));

  HexResult result;
  result.duty = profile.total_duty;
  result.pinch = profile.pinch;
  result.h_hot_ex = profile.h_hot_ex;
  result.h_cold_ex = profile.h_cold_ex;
  result.T_hot_ex = profile.T_hot_ex;
  result.T_cold_ex = profile.T_cold_ex;
  result.mass_hot = totals.mass_hot;
  result.mass_cold = totals.mass_cold;
  result.zones = profile.zones;

  // Entropy and quality are reported as NaN where the fluid does not define them
  auto property_or_nan = [&](const SupplyConditions& side, Property output, double h) {
    if (output == Property::Quality && side.incompressible) {
      return nan;
    }
    auto value = oracle_.state(side.fluid, output, Property::Pressure, side.pressure, Property::Enthalpy, h);
    return value ? *value : nan;
  };

  auto push_point = [&](const BoundaryState& state) {
    result.h_hot.push_back(state.h_hot);
    result.h_cold.push_back(state.h_cold);
    result.T_hot.push_back(state.T_hot);
    result.T_cold.push_back(state.T_cold);
    result.s_hot.push_back(property_or_nan(hot, Property::Entropy, state.h_hot));
    result.s_cold.push_back(property_or_nan(cold, Property::Entropy, state.h_cold));
    result.q_hot.push_back(property_or_nan(hot, Property::Quality, state.h_hot));
    result.q_cold.push_back(property_or_nan(cold, Property::Quality, state.h_cold));
  };

  if (!result.zones.empty()) {
    push_point(result.zones.front().lower);
    for (const auto& zone : result.zones) {
      push_point(zone.upper);
    }
  }

  fill_fractions(result);
  if (area_based) {
    mean_coefficients_by_phase(result);
  }
  return result;
}

auto HexSolver::passthrough(const SupplyConditions& hot, const SupplyConditions& cold, const HexConfig& config,
                            HexFlag flag) const -> std::expected<HexResult, HexSolverError> {
  BoundaryState supply;
  supply.h_hot = hot.enthalpy;
  supply.h_cold = cold.enthalpy;
  supply.T_hot = hot.temperature;
  supply.T_cold = cold.temperature;

  Zone zone;
  zone.lower = supply;
  zone.upper = supply;
  zone.hot_phase = classify_phase(hot, hot.enthalpy);
  zone.cold_phase = classify_phase(cold, cold.enthalpy);

  Profile profile;
  profile.zones.push_back(zone);
  profile.pinch = supply.approach();
  profile.h_hot_ex = hot.enthalpy;
  profile.h_cold_ex = cold.enthalpy;
  profile.T_hot_ex = hot.temperature;
  profile.T_cold_ex = cold.temperature;

  HexResult result;
  ORCKIT_TRY_ASSIGN(result, assemble(profile, hot, cold, config, false));
  result.flag = flag;
  return result;
}

auto HexSolver::solve(const thermophysics::Stream& hot_stream, const thermophysics::Stream& cold_stream) const
    -> std::expected<HexResult, HexSolverError> {

  ORCKIT_TRY_VOID(validate_hex_config(config_));

  SupplyConditions hot;
  SupplyConditions cold;
  ORCKIT_TRY_ASSIGN_CTX(hot, thermophysics::resolve_supply(oracle_, hot_stream), HexSolverError, "hot stream supply");
  ORCKIT_TRY_ASSIGN_CTX(cold, thermophysics::resolve_supply(oracle_, cold_stream), HexSolverError,
                        "cold stream supply");

  // Normalize stream roles for models whose coefficients follow the labels
  HexConfig config = config_;
  const bool reversed = hot.temperature < cold.temperature && supports_stream_reversal(config_.model);
  if (reversed) {
    std::swap(hot, cold);
    config = reversed_config(config_);
  }

  auto finish = [&](HexResult result) -> HexResult {
    result.model = std::string(model_name(config_.model));
    result.reversed = reversed;
    if (reversed) {
      restore_stream_roles(result);
    }
    return result;
  };

  // Entry guard: no flow, unordered or equal supply temperatures
  const double supply_difference = hot.temperature - cold.temperature;
  if (!(hot.mass_flow > 0.0) || !(cold.mass_flow > 0.0)) {
    HexResult result;
    ORCKIT_TRY_ASSIGN(result, passthrough(hot, cold, config, HexFlag::NoFlow));
    return finish(std::move(result));
  }
  if (!(supply_difference > 0.0)) {
    HexResult result;
    ORCKIT_TRY_ASSIGN(result, passthrough(hot, cold, config, HexFlag::InfeasiblePinch));
    return finish(std::move(result));
  }
  if (supply_difference <= constants::hex::min_supply_temperature_difference) {
    HexResult result;
    ORCKIT_TRY_ASSIGN(result, passthrough(hot, cold, config, HexFlag::Degenerate));
    return finish(std::move(result));
  }

  const int subdivisions = uses_subdivisions(config.model) ? config.two_phase_subdivisions : 1;
  const ZoneProfileBuilder builder(oracle_, hot, cold, subdivisions);

  MaximumDuty maximum;
  ORCKIT_TRY_ASSIGN(maximum, builder.maximum_duty());

  const bool area_based = is_area_matching(config.model);
  const auto strategy = create_convection_strategy(config, oracle_);
  DutySolution solution;

  std::optional<HeatTransferZoneEvaluator> evaluator;
  if (area_based) {
    evaluator.emplace(*strategy, config.hot, config.cold);
  }

  if (const auto* pinch_model = std::get_if<ConstantPinchModel>(&config.model)) {
    ORCKIT_TRY_ASSIGN(solution, solve_constant_pinch(builder, *pinch_model, maximum));
  } else if (evaluator) {
    ORCKIT_TRY_ASSIGN(solution, solve_area_matching(config.model, builder, *evaluator, maximum));
  } else {
    solution = solve_closed_form(config.model, hot, cold, maximum);
  }

  Profile profile;
  ORCKIT_TRY_ASSIGN_CTX(profile, builder.build(solution.duty), HexSolverError, "final profile");

  if (evaluator) {
    AreaEvaluation evaluation;
    ORCKIT_TRY_ASSIGN_CTX(evaluation, evaluator->evaluate(profile, hot, cold), HexSolverError, "final profile");
    if (evaluation.unconverged_closures > 0) {
      std::cerr << std::format("Warning: boiling number closure not converged in {} zone(s), last iterate kept",
                               evaluation.unconverged_closures)
                << std::endl;
    }
  }

  HexResult result;
  ORCKIT_TRY_ASSIGN(result, assemble(profile, hot, cold, config, area_based));
  result.flag = solution.flag;
  result.duty_max = maximum.duty;
  result.effectiveness = maximum.duty > 0.0 ? solution.duty / maximum.duty : 0.0;
  result.residual = solution.residual;
  result.iterations = maximum.iterations + solution.iterations;
  return finish(std::move(result));
}

} // namespace orckit::hex
