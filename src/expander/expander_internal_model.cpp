#include "orckit/expander/expander_internal_model.hpp"
#include "orckit/core/expected_utils.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace orckit::expander {

using thermophysics::Property;

namespace {

// Effectiveness of a heat exchange with an isothermal wall
[[nodiscard]] auto wall_effectiveness(double conductance, double mass_flow, double cp) noexcept -> double {
  return std::max(0.0, 1.0 - std::exp(-conductance / (mass_flow * cp)));
}

} // namespace

ExpanderInternalModel::ExpanderInternalModel(const thermophysics::PropertyOracle& oracle, ExpanderInlet inlet,
                                             SemiEmpiricalModel model, double swept_volume)
    : oracle_(oracle), inlet_(std::move(inlet)), model_(std::move(model)), swept_volume_(swept_volume) {}

auto ExpanderInternalModel::property(Property output, Property input1, double value1, Property input2,
                                     double value2) const -> std::expected<double, ExpanderSolverError> {
  auto result = oracle_.state(inlet_.fluid, output, input1, value1, input2, value2);
  if (!result) {
    return std::unexpected(ExpanderSolverError(result.error().message()));
  }
  return *result;
}

auto ExpanderInternalModel::specific_heat(double pressure, double enthalpy) const
    -> std::expected<double, ExpanderSolverError> {
  auto cp = oracle_.state(inlet_.fluid, Property::SpecificHeat, Property::Pressure, pressure, Property::Enthalpy,
                          enthalpy);
  if (cp) {
    return *cp;
  }
  return property(Property::SpecificHeat, Property::Pressure, pressure, Property::Quality, 0.0);
}

auto ExpanderInternalModel::heat_capacity_ratio(double pressure, double enthalpy) const
    -> std::expected<double, ExpanderSolverError> {
  const double P_bar = pressure / 1e5;

  // Supercritical and single-phase states use the superheated regression
  auto quality = oracle_.state(inlet_.fluid, Property::Quality, Property::Pressure, pressure, Property::Enthalpy,
                               enthalpy);
  if (quality && *quality >= 0.0 && *quality <= 1.0) {
    return model_.gamma.two_phase.evaluate(P_bar, *quality);
  }

  double T = 0.0;
  ORCKIT_TRY_ASSIGN(T, property(Property::Temperature, Property::Pressure, pressure, Property::Enthalpy, enthalpy));
  return model_.gamma.superheated.evaluate(P_bar, T / 1e2);
}

auto ExpanderInternalModel::pressure_from_density_entropy(double density, double entropy) const
    -> std::expected<double, ExpanderSolverError> {
  auto direct = oracle_.state(inlet_.fluid, Property::Pressure, Property::Density, density, Property::Entropy, entropy);
  if (direct) {
    return *direct;
  }

  const double delta = constants::expander::density_perturbation;
  double above = 0.0;
  double below = 0.0;
  ORCKIT_TRY_ASSIGN(above,
                    property(Property::Pressure, Property::Density, density * (1.0 + delta), Property::Entropy, entropy));
  ORCKIT_TRY_ASSIGN(below,
                    property(Property::Pressure, Property::Density, density * (1.0 - delta), Property::Entropy, entropy));
  return 0.5 * (above + below);
}

auto ExpanderInternalModel::wall_temperature_guess() const noexcept -> double {
  const double w = constants::expander::wall_guess_supply_weight;
  return w * inlet_.T_su + (1.0 - w) * inlet_.T_amb;
}

auto ExpanderInternalModel::evaluate(double wall_temperature) const
    -> std::expected<InternalStates, ExpanderSolverError> {

  const double M_dot = inlet_.mass_flow;
  const double T_w = wall_temperature;
  const double flow_scaling = std::pow(M_dot / model_.nominal_mass_flow, constants::expander::conductance_flow_exponent);
  const double AU_su = model_.supply_conductance * flow_scaling;
  const double AU_ex = model_.exhaust_conductance * flow_scaling;

  InternalStates st;

  // Supply pressure drop: kinetic energy through the supply port at constant entropy
  const double port_area = constants::physical::pi * model_.supply_diameter * model_.supply_diameter / 4.0;
  const double velocity = M_dot / (port_area * inlet_.rho_su);
  const double h_throttle = std::max(inlet_.h_su - velocity * velocity / 2.0, inlet_.h_ex_s);
  double P_su1 = 0.0;
  ORCKIT_TRY_ASSIGN(P_su1, property(Property::Pressure, Property::Entropy, inlet_.s_su, Property::Enthalpy, h_throttle));
  P_su1 = std::max(P_su1, inlet_.P_ex + 1.0);

  st.su1.pressure = P_su1;
  st.su1.enthalpy = inlet_.h_su;
  ORCKIT_TRY_ASSIGN(st.T_su1, property(Property::Temperature, Property::Pressure, P_su1, Property::Enthalpy, inlet_.h_su));

  // Supply heat pickup
  double cp_su1 = 0.0;
  ORCKIT_TRY_ASSIGN(cp_su1, specific_heat(P_su1, inlet_.h_su));
  st.supply_heat = std::max(0.0, wall_effectiveness(AU_su, M_dot, cp_su1) * M_dot * cp_su1 * (st.T_su1 - T_w));

  double P_critical = 0.0;
  ORCKIT_TRY_ASSIGN(P_critical, property(Property::CriticalPressure, Property::Pressure, P_su1, Property::Quality, 0.0));
  double h_su2_min = inlet_.h_ex_s;
  if (P_su1 < P_critical) {
    double h_low_quality = 0.0;
    ORCKIT_TRY_ASSIGN(h_low_quality, property(Property::Enthalpy, Property::Pressure, P_su1, Property::Quality,
                                              constants::expander::supply_quality_floor));
    h_su2_min = std::max(h_su2_min, h_low_quality);
  }
  const double h_su2 = std::min(inlet_.h_max, std::max(h_su2_min, inlet_.h_su - st.supply_heat / M_dot));

  st.su2.pressure = P_su1;
  st.su2.enthalpy = h_su2;
  ORCKIT_TRY_ASSIGN(st.su2.entropy, property(Property::Entropy, Property::Pressure, P_su1, Property::Enthalpy, h_su2));
  ORCKIT_TRY_ASSIGN(st.su2.density, property(Property::Density, Property::Pressure, P_su1, Property::Enthalpy, h_su2));
  const double s_su2 = st.su2.entropy;
  const double rho_su2 = st.su2.density;

  // Leakage through the throat, choked below the critical pressure ratio
  ORCKIT_TRY_ASSIGN(st.gamma, heat_capacity_ratio(P_su1, h_su2));
  const double P_choked = P_su1 * std::pow(2.0 / (st.gamma + 1.0), st.gamma / (st.gamma - 1.0));
  st.throat_pressure = std::max(inlet_.P_ex, P_choked);

  double rho_throat = 0.0;
  double h_throat = 0.0;
  ORCKIT_TRY_ASSIGN(rho_throat,
                    property(Property::Density, Property::Pressure, st.throat_pressure, Property::Entropy, s_su2));
  ORCKIT_TRY_ASSIGN(h_throat,
                    property(Property::Enthalpy, Property::Pressure, st.throat_pressure, Property::Entropy, s_su2));
  const double throat_velocity = std::sqrt(std::max(0.0, 2.0 * (h_su2 - h_throat)));
  st.leakage_flow = std::min(M_dot, model_.leakage_area * throat_velocity * rho_throat);
  st.internal_flow = M_dot - st.leakage_flow;
  st.speed = 60.0 * st.internal_flow / (swept_volume_ * rho_su2);

  // Built-in volume ratio expansion, then constant volume expansion to the exhaust pressure
  const double rho_in = rho_su2 / model_.built_in_volume_ratio;
  double P_in = 0.0;
  ORCKIT_TRY_ASSIGN(P_in, pressure_from_density_entropy(rho_in, s_su2));
  st.in.pressure = P_in;
  st.in.density = rho_in;
  st.in.entropy = s_su2;
  ORCKIT_TRY_ASSIGN(st.in.enthalpy, property(Property::Enthalpy, Property::Density, rho_in, Property::Pressure, P_in));

  const double w_1 = h_su2 - st.in.enthalpy;
  const double w_2 = (P_in - inlet_.P_ex) / rho_in;
  st.ex2.pressure = inlet_.P_ex;
  st.ex2.enthalpy = st.in.enthalpy - w_2;

  st.internal_power = st.internal_flow * (w_1 + w_2);
  st.loss_power = model_.proportional_loss * st.internal_power + model_.constant_loss +
                  model_.loss_torque * st.speed / 60.0 * 2.0 * constants::physical::pi;
  st.power = st.internal_power - st.loss_power;

  // Leakage remixing
  const double h_mix = (st.internal_flow * st.ex2.enthalpy + st.leakage_flow * h_su2) / M_dot;
  st.ex1.pressure = inlet_.P_ex;
  st.ex1.enthalpy = std::max(std::min(h_mix, h_su2), st.ex2.enthalpy);
  ORCKIT_TRY_ASSIGN(st.T_ex1,
                    property(Property::Temperature, Property::Pressure, inlet_.P_ex, Property::Enthalpy, st.ex1.enthalpy));

  // Exhaust heat exchange and ambient loss
  double cp_ex1 = 0.0;
  ORCKIT_TRY_ASSIGN(cp_ex1, specific_heat(inlet_.P_ex, st.ex1.enthalpy));
  st.exhaust_heat = std::max(0.0, wall_effectiveness(AU_ex, M_dot, cp_ex1) * M_dot * cp_ex1 * (T_w - st.T_ex1));
  st.ex.pressure = inlet_.P_ex;
  st.ex.enthalpy = std::min(st.ex1.enthalpy + st.exhaust_heat / M_dot, inlet_.h_max);
  st.ambient_loss = model_.ambient_conductance * (T_w - inlet_.T_amb);

  const double balance = st.supply_heat + st.loss_power - st.exhaust_heat - st.ambient_loss;
  const double normalizer = st.supply_heat + st.loss_power;
  st.residual = normalizer > 0.0 ? balance / normalizer : balance;
  return st;
}

void ExpanderInternalModel::describe(InternalStates& states) const {
  for (auto* state : {&states.su1, &states.su2, &states.in, &states.ex2, &states.ex1, &states.ex}) {
    if (std::isnan(state->entropy)) {
      auto s = oracle_.state(inlet_.fluid, Property::Entropy, Property::Pressure, state->pressure, Property::Enthalpy,
                             state->enthalpy);
      state->entropy = s ? *s : nan;
    }
    if (std::isnan(state->density)) {
      auto rho = oracle_.state(inlet_.fluid, Property::Density, Property::Pressure, state->pressure,
                               Property::Enthalpy, state->enthalpy);
      state->density = rho ? *rho : nan;
    }
  }
}

} // namespace orckit::expander
