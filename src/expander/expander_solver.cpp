#include "orckit/expander/expander_solver.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace orckit::expander {

using thermophysics::Property;

namespace {

[[nodiscard]] auto within_bounds(double h_ex, const ExpanderInlet& inlet) noexcept -> bool {
  return h_ex > inlet.h_min && h_ex < inlet.h_max;
}

[[nodiscard]] auto ambient_loss(double conductance, const ExpanderInlet& inlet) noexcept -> double {
  return std::max(0.0, conductance * (inlet.T_su - inlet.T_amb));
}

} // namespace

auto evaluate_regression(const core::RegressionCoefficients& coefficients, double pressure_ratio,
                         double supply_density, double speed) -> double {
  const double rp = pressure_ratio;
  const double rho = supply_density;
  const double N = speed;

  core::RegressionCoefficients features(coefficients.size());
  if (coefficients.size() == 6) {
    features << 1.0, rp, rho, rp * rp, rp * rho, rho * rho;
  } else if (coefficients.size() == 10) {
    features << 1.0, rp, rho, rp * rp, rp * rho, rho * rho, N, N * N, N * rp, N * rho;
  } else {
    return nan;
  }
  return coefficients.dot(features);
}

auto validate_expander_config(const ExpanderConfig& config) -> std::expected<void, ExpanderSolverError> {
  auto fail = [](std::string_view message) -> std::expected<void, ExpanderSolverError> {
    return std::unexpected(ExpanderSolverError(message));
  };

  if (!(config.swept_volume > 0.0)) {
    return fail("swept volume must be positive");
  }
  if (config.internal_volume < 0.0) {
    return fail("internal volume must be non-negative");
  }
  if (config.h_min && config.h_max && !(*config.h_min < *config.h_max)) {
    return fail("h_min must be lower than h_max");
  }

  if (const auto* constant = std::get_if<ConstantEfficiencyModel>(&config.model)) {
    if (!(constant->isentropic_efficiency > 0.0 && constant->isentropic_efficiency <= 1.0)) {
      return fail("CstEff requires an isentropic efficiency in (0, 1]");
    }
    if (!(constant->filling_factor > 0.0)) {
      return fail("CstEff requires a positive filling factor");
    }
  } else if (const auto* polynomial = std::get_if<PolynomialEfficiencyModel>(&config.model)) {
    for (const auto* coefficients : {&polynomial->efficiency_coefficients, &polynomial->filling_factor_coefficients}) {
      if (coefficients->size() != 6 && coefficients->size() != 10) {
        return fail(std::format("PolEff regressions take 6 or 10 coefficients, got {}", coefficients->size()));
      }
    }
  } else if (const auto* semi = std::get_if<SemiEmpiricalModel>(&config.model)) {
    if (!(semi->built_in_volume_ratio > 0.0)) {
      return fail("built-in volume ratio must be positive");
    }
    if (!(semi->supply_diameter > 0.0)) {
      return fail("supply port diameter must be positive");
    }
    if (!(semi->nominal_mass_flow > 0.0)) {
      return fail("nominal mass flow must be positive");
    }
    if (semi->leakage_area < 0.0 || semi->supply_conductance < 0.0 || semi->exhaust_conductance < 0.0 ||
        semi->ambient_conductance < 0.0) {
      return fail("leakage area and heat transfer conductances must be non-negative");
    }
    if (semi->gamma.superheated.coefficients().size() == 0 || semi->gamma.two_phase.coefficients().size() == 0) {
      return fail("gamma regressions must have at least one coefficient");
    }
  }
  return {};
}

ExpanderSolver::ExpanderSolver(const thermophysics::PropertyOracle& oracle, ExpanderConfig config)
    : oracle_(oracle), config_(std::move(config)) {}

auto ExpanderSolver::resolve_inlet(const thermophysics::Stream& supply, double P_ex, double T_amb) const
    -> std::expected<ExpanderInlet, ExpanderSolverError> {

  thermophysics::SupplyConditions su;
  ORCKIT_TRY_ASSIGN_CTX(su, thermophysics::resolve_supply(oracle_, supply), ExpanderSolverError, "supply state");

  ExpanderInlet inlet;
  inlet.fluid = su.fluid;
  inlet.P_su = su.pressure;
  inlet.h_su = su.enthalpy;
  inlet.T_su = su.temperature;
  inlet.mass_flow = su.mass_flow;
  inlet.P_ex = P_ex;
  inlet.T_amb = T_amb;

  auto state = [&](Property output, Property input1, double value1, Property input2, double value2) {
    return oracle_.state(inlet.fluid, output, input1, value1, input2, value2);
  };

  ORCKIT_TRY_ASSIGN_CTX(inlet.s_su, state(Property::Entropy, Property::Pressure, inlet.P_su, Property::Enthalpy, inlet.h_su),
                        ExpanderSolverError, "supply entropy");
  ORCKIT_TRY_ASSIGN_CTX(inlet.rho_su, state(Property::Density, Property::Pressure, inlet.P_su, Property::Enthalpy, inlet.h_su),
                        ExpanderSolverError, "supply density");
  return inlet;
}

auto ExpanderSolver::resolve_exhaust(ExpanderInlet& inlet) const -> std::expected<void, ExpanderSolverError> {
  auto state = [&](Property output, Property input1, double value1, Property input2, double value2) {
    return oracle_.state(inlet.fluid, output, input1, value1, input2, value2);
  };

  ORCKIT_TRY_ASSIGN_CTX(inlet.h_ex_s, state(Property::Enthalpy, Property::Pressure, inlet.P_ex, Property::Entropy, inlet.s_su),
                        ExpanderSolverError, "isentropic exhaust enthalpy");

  if (config_.h_min) {
    inlet.h_min = *config_.h_min;
  } else {
    ORCKIT_TRY_ASSIGN_CTX(inlet.h_min,
                          state(Property::Enthalpy, Property::Pressure, constants::expander::h_min_pressure,
                                Property::Temperature, constants::expander::h_min_temperature),
                          ExpanderSolverError, "default lower enthalpy bound");
  }
  if (config_.h_max) {
    inlet.h_max = *config_.h_max;
  } else {
    ORCKIT_TRY_ASSIGN_CTX(inlet.h_max,
                          state(Property::Enthalpy, Property::Pressure, constants::expander::h_max_pressure,
                                Property::Temperature, constants::expander::h_max_temperature),
                          ExpanderSolverError, "default upper enthalpy bound");
  }
  return {};
}

auto ExpanderSolver::exhaust_property_or_nan(const ExpanderInlet& inlet, Property output, double h_ex) const
    -> double {
  if (!std::isfinite(h_ex)) {
    return nan;
  }
  auto value = oracle_.state(inlet.fluid, output, Property::Pressure, inlet.P_ex, Property::Enthalpy, h_ex);
  return value ? *value : nan;
}

auto ExpanderSolver::solve_constant_efficiency(const ConstantEfficiencyModel& model, const ExpanderInlet& inlet) const
    -> ModelOutcome {
  ModelOutcome outcome;
  const double M_dot = inlet.mass_flow;
  outcome.speed = 60.0 * M_dot / (config_.swept_volume * model.filling_factor * inlet.rho_su);
  outcome.power = M_dot * (inlet.h_su - inlet.h_ex_s) * model.isentropic_efficiency;
  outcome.ambient_loss = ambient_loss(model.ambient_conductance, inlet);
  outcome.filling_factor = model.filling_factor;
  outcome.efficiency = model.isentropic_efficiency;
  outcome.h_ex = inlet.h_su - (outcome.power + outcome.ambient_loss) / M_dot;
  outcome.flag = within_bounds(outcome.h_ex, inlet) ? ExpanderFlag::Converged : ExpanderFlag::NotConverged;
  return outcome;
}

auto ExpanderSolver::solve_polynomial_efficiency(const PolynomialEfficiencyModel& model,
                                                 const ExpanderInlet& inlet) const
    -> std::expected<ModelOutcome, ExpanderSolverError> {
  ModelOutcome outcome;
  const double M_dot = inlet.mass_flow;
  const double rp = inlet.P_su / inlet.P_ex;
  const double nominal_speed = 60.0 * M_dot / (config_.swept_volume * inlet.rho_su);

  auto filling_factor = [&](double speed) {
    return std::clamp(evaluate_regression(model.filling_factor_coefficients, rp, inlet.rho_su, speed),
                      constants::expander::min_filling_factor, constants::expander::max_filling_factor_residual);
  };
  // N = 60 M_dot / (V_s FF(N) rho_su)
  auto speed_residual = [&](double speed) { return 1.0 - speed / (nominal_speed / filling_factor(speed)); };

  double speed_error = 0.0;
  if (model.filling_factor_coefficients.size() == 6) {
    outcome.speed = nominal_speed / filling_factor(0.0);
  } else {
    numerics::RootFinderConfig root_config;
    root_config.relative_tolerance = 1e-10;
    root_config.absolute_tolerance = 1e-10;
    const numerics::BrentRootFinder solver(root_config);

    // The clamp on FF bounds the speed between nominal / 5 and nominal / 0.2
    auto root = solver.solve(speed_residual, nominal_speed / constants::expander::max_filling_factor_residual,
                             nominal_speed / constants::expander::min_filling_factor);
    if (!root) {
      std::cerr << "Warning: expander speed search did not converge: " << root.error().message() << std::endl;
      const double last = root.error().last_iterate();
      outcome.speed = std::isfinite(last) ? last : nominal_speed;
    } else {
      outcome.speed = root->root;
      outcome.iterations = root->iterations;
    }
    speed_error = speed_residual(outcome.speed);
  }

  outcome.residual = speed_error;
  outcome.filling_factor =
      std::clamp(evaluate_regression(model.filling_factor_coefficients, rp, inlet.rho_su, outcome.speed),
                 constants::expander::min_filling_factor, constants::expander::max_filling_factor);
  outcome.efficiency =
      std::clamp(evaluate_regression(model.efficiency_coefficients, rp, inlet.rho_su, outcome.speed),
                 constants::expander::min_isentropic_efficiency, constants::expander::max_isentropic_efficiency);
  outcome.power = M_dot * (inlet.h_su - inlet.h_ex_s) * outcome.efficiency;
  outcome.ambient_loss = ambient_loss(model.ambient_conductance, inlet);
  outcome.h_ex = inlet.h_su - (outcome.power + outcome.ambient_loss) / M_dot;
  outcome.flag = within_bounds(outcome.h_ex, inlet) && std::abs(speed_error) < constants::tolerance::speed_residual
                     ? ExpanderFlag::Converged
                     : ExpanderFlag::NotConverged;
  return outcome;
}

auto ExpanderSolver::solve_semi_empirical(const SemiEmpiricalModel& model, const ExpanderInlet& inlet) const
    -> std::expected<ModelOutcome, ExpanderSolverError> {
  ModelOutcome outcome;
  const ExpanderInternalModel internal(oracle_, inlet, model, config_.swept_volume);

  auto wall_residual = [&](double T_w) -> std::expected<double, ExpanderSolverError> {
    InternalStates states;
    ORCKIT_TRY_ASSIGN(states, internal.evaluate(T_w));
    return states.residual;
  };

  numerics::RootFinderConfig root_config;
  root_config.relative_tolerance = 1e-10;
  root_config.absolute_tolerance = 1e-8;
  const numerics::BrentRootFinder solver(root_config);

  const double guess = internal.wall_temperature_guess();
  auto root = solver.solve(wall_residual, constants::expander::min_wall_temperature, 2.0 * guess);

  bool root_converged = false;
  double T_w = guess;
  if (root) {
    T_w = root->root;
    outcome.iterations = root->iterations;
    root_converged = root->converged;
  } else {
    std::cerr << "Warning: expander wall temperature search did not converge: " << root.error().message()
              << std::endl;
    const double last = root.error().last_iterate();
    if (std::isfinite(last)) {
      T_w = last;
    }
  }

  InternalStates states;
  ORCKIT_TRY_ASSIGN_CTX(states, internal.evaluate(T_w), ExpanderSolverError,
                        std::format("internal model at T_w = {:.3f} K", T_w));
  internal.describe(states);

  outcome.wall_temperature = T_w;
  outcome.residual = states.residual;
  outcome.h_ex = states.ex.enthalpy;
  outcome.power = states.power;
  outcome.efficiency = states.power / (inlet.mass_flow * (inlet.h_su - inlet.h_ex_s));
  outcome.speed = states.speed;
  outcome.filling_factor = inlet.mass_flow / (config_.swept_volume * states.speed / 60.0 * inlet.rho_su);
  outcome.ambient_loss = states.ambient_loss;
  outcome.internal = states;
  outcome.flag = root_converged && std::abs(states.residual) < constants::tolerance::wall_energy_balance &&
                         within_bounds(outcome.h_ex, inlet)
                     ? ExpanderFlag::Converged
                     : ExpanderFlag::NotConverged;
  return outcome;
}

auto ExpanderSolver::solve(const thermophysics::Stream& supply, double exhaust_pressure,
                           double ambient_temperature) const -> std::expected<ExpanderResult, ExpanderSolverError> {

  ORCKIT_TRY_VOID(validate_expander_config(config_));

  ExpanderInlet inlet;
  ORCKIT_TRY_ASSIGN(inlet, resolve_inlet(supply, exhaust_pressure, ambient_temperature));

  ModelOutcome outcome;
  const bool expandable = inlet.P_ex > 0.0 && inlet.P_su > inlet.P_ex && inlet.mass_flow > 0.0;
  if (!expandable) {
    outcome.flag = ExpanderFlag::NonPositivePressureRatio;
    // Best effort only: the exhaust state may lie outside the fluid tables
    auto h_ex_s = oracle_.state(inlet.fluid, Property::Enthalpy, Property::Pressure, inlet.P_ex, Property::Entropy,
                                inlet.s_su);
    inlet.h_ex_s = h_ex_s ? *h_ex_s : nan;
  } else {
    ORCKIT_TRY_VOID(resolve_exhaust(inlet));
    if (const auto* constant = std::get_if<ConstantEfficiencyModel>(&config_.model)) {
      outcome = solve_constant_efficiency(*constant, inlet);
    } else if (const auto* polynomial = std::get_if<PolynomialEfficiencyModel>(&config_.model)) {
      ORCKIT_TRY_ASSIGN(outcome, solve_polynomial_efficiency(*polynomial, inlet));
    } else {
      ORCKIT_TRY_ASSIGN(outcome, solve_semi_empirical(std::get<SemiEmpiricalModel>(config_.model), inlet));
    }
  }

  ExpanderResult result;
  result.flag = outcome.flag;
  result.model = std::string(model_name(config_.model));
  result.T_su = inlet.T_su;
  result.h_su = inlet.h_su;
  result.h_ex_s = inlet.h_ex_s;
  result.isentropic_power = inlet.mass_flow * (inlet.h_su - inlet.h_ex_s);
  result.residual = outcome.residual;
  result.iterations = outcome.iterations;
  result.internal = outcome.internal;

  if (result.flag_value() > 0) {
    result.h_ex = outcome.h_ex;
    result.power = outcome.power;
    result.isentropic_efficiency = outcome.efficiency;
    result.filling_factor = outcome.filling_factor;
    result.speed = outcome.speed;
    result.ambient_loss = outcome.ambient_loss;
    result.wall_temperature = outcome.wall_temperature;
  } else {
    // Isentropic fallback
    result.h_ex = inlet.h_ex_s;
    result.power = result.isentropic_power;
    result.isentropic_efficiency = 1.0;
    result.filling_factor = 1.0;
    result.speed = 60.0 * inlet.mass_flow / (config_.swept_volume * inlet.rho_su);
    result.ambient_loss = 0.0;
    result.wall_temperature = nan;
  }

  double rho_ex = 0.0;
  double s_ex = 0.0;
  if (!expandable) {
    result.T_ex = exhaust_property_or_nan(inlet, Property::Temperature, result.h_ex);
    rho_ex = exhaust_property_or_nan(inlet, Property::Density, result.h_ex);
    s_ex = exhaust_property_or_nan(inlet, Property::Entropy, result.h_ex);
  } else {
    ORCKIT_TRY_ASSIGN_CTX(result.T_ex,
                          oracle_.state(inlet.fluid, Property::Temperature, Property::Pressure, inlet.P_ex,
                                        Property::Enthalpy, result.h_ex),
                          ExpanderSolverError, "exhaust temperature");
    ORCKIT_TRY_ASSIGN_CTX(rho_ex,
                          oracle_.state(inlet.fluid, Property::Density, Property::Pressure, inlet.P_ex,
                                        Property::Enthalpy, result.h_ex),
                          ExpanderSolverError, "exhaust density");
    ORCKIT_TRY_ASSIGN_CTX(s_ex,
                          oracle_.state(inlet.fluid, Property::Entropy, Property::Pressure, inlet.P_ex,
                                        Property::Enthalpy, result.h_ex),
                          ExpanderSolverError, "exhaust entropy");
  }
  result.mass = config_.internal_volume * 0.5 * (inlet.rho_su + rho_ex);
  result.ts_temperature = {inlet.T_su, result.T_ex};
  result.ts_entropy = {inlet.s_su, s_ex};
  return result;
}

} // namespace orckit::expander
