#include "orckit/hex/convection_strategy.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/hex/convection_correlations.hpp"
#include "orckit/hex/heat_transfer_zone_evaluator.hpp"
#include <cmath>
#include <format>

namespace orckit::hex {

using thermophysics::Property;
using thermophysics::PropertyOracle;
using thermophysics::SupplyConditions;

namespace {

[[nodiscard]] constexpr auto by_phase(const PhaseValues& values, ZonePhase phase) noexcept -> double {
  switch (phase) {
  case ZonePhase::Liquid:
    return values.liquid;
  case ZonePhase::TwoPhase:
    return values.two_phase;
  case ZonePhase::Vapor:
    return values.vapor;
  }
  return values.liquid;
}

// Property at the stream pressure and one other input
[[nodiscard]] auto property_at(const PropertyOracle& oracle, const SupplyConditions& side, Property output,
                               Property input, double value) -> std::expected<double, HexSolverError> {
  auto result = oracle.state(side.fluid, output, input, value, Property::Pressure, side.pressure);
  if (!result) {
    return std::unexpected(HexSolverError(std::format("{} of {} at {} = {}: {}", thermophysics::property_name(output),
                                                      side.fluid, thermophysics::property_name(input), value,
                                                      result.error().message())));
  }
  return *result;
}

struct TransportProperties {
  double viscosity = 0.0;
  double conductivity = 0.0;
  double prandtl = 0.0;
};

// Pure fluids at the mean enthalpy, incompressible fluids averaged over the end temperatures
[[nodiscard]] auto zone_transport(const PropertyOracle& oracle, const SupplyConditions& side, double h_mean,
                                  double T_lower, double T_upper) -> std::expected<TransportProperties, HexSolverError> {
  TransportProperties props;
  if (!side.incompressible) {
    ORCKIT_TRY_ASSIGN(props.viscosity, property_at(oracle, side, Property::Viscosity, Property::Enthalpy, h_mean));
    ORCKIT_TRY_ASSIGN(props.prandtl, property_at(oracle, side, Property::Prandtl, Property::Enthalpy, h_mean));
    ORCKIT_TRY_ASSIGN(props.conductivity,
                      property_at(oracle, side, Property::Conductivity, Property::Enthalpy, h_mean));
    return props;
  }

  auto mean_over = [&](Property output) -> std::expected<double, HexSolverError> {
    double lower = 0.0;
    double upper = 0.0;
    ORCKIT_TRY_ASSIGN(lower, property_at(oracle, side, output, Property::Temperature, T_lower));
    ORCKIT_TRY_ASSIGN(upper, property_at(oracle, side, output, Property::Temperature, T_upper));
    return 0.5 * (lower + upper);
  };

  double cp = 0.0;
  ORCKIT_TRY_ASSIGN(cp, mean_over(Property::SpecificHeat));
  ORCKIT_TRY_ASSIGN(props.conductivity, mean_over(Property::Conductivity));
  ORCKIT_TRY_ASSIGN(props.viscosity, mean_over(Property::Viscosity));
  props.prandtl = cp * props.viscosity / props.conductivity;
  return props;
}

[[nodiscard]] auto saturated_properties(const PropertyOracle& oracle, const SupplyConditions& side)
    -> std::expected<correlations::SaturatedProperties, HexSolverError> {
  correlations::SaturatedProperties sat;
  ORCKIT_TRY_ASSIGN(sat.rho_liquid, property_at(oracle, side, Property::Density, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(sat.rho_vapor, property_at(oracle, side, Property::Density, Property::Quality, 1.0));
  ORCKIT_TRY_ASSIGN(sat.mu_liquid, property_at(oracle, side, Property::Viscosity, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(sat.mu_vapor, property_at(oracle, side, Property::Viscosity, Property::Quality, 1.0));
  ORCKIT_TRY_ASSIGN(sat.k_liquid, property_at(oracle, side, Property::Conductivity, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(sat.prandtl_liquid, property_at(oracle, side, Property::Prandtl, Property::Quality, 0.0));
  sat.latent_heat = side.h_vapor - side.h_liquid;
  return sat;
}

[[nodiscard]] auto mass_flux(const SupplyConditions& side, const SideGeometry& geometry) noexcept -> double {
  return side.mass_flow / geometry.n_canals / geometry.cross_section;
}

} // namespace

// ================================================================================================
// CONSTANT AND SCALED COEFFICIENTS
// ================================================================================================

auto ConstantConvection::evaluate(const Zone& zone, const SupplyConditions& /*hot*/,
                                  const SupplyConditions& /*cold*/) const
    -> std::expected<ZoneCoefficients, HexSolverError> {
  ZoneCoefficients coefficients;
  coefficients.hot = by_phase(model_.hot, zone.hot_phase);
  coefficients.cold = by_phase(model_.cold, zone.cold_phase);
  return coefficients;
}

auto ScaledConvection::evaluate(const Zone& zone, const SupplyConditions& hot, const SupplyConditions& cold) const
    -> std::expected<ZoneCoefficients, HexSolverError> {
  ZoneCoefficients coefficients;
  coefficients.hot = by_phase(model_.hot_nominal, zone.hot_phase) *
                     std::pow(hot.mass_flow / model_.nominal_hot_flow, by_phase(model_.hot_exponents, zone.hot_phase));
  coefficients.cold =
      by_phase(model_.cold_nominal, zone.cold_phase) *
      std::pow(cold.mass_flow / model_.nominal_cold_flow, by_phase(model_.cold_exponents, zone.cold_phase));
  return coefficients;
}

// ================================================================================================
// CORRELATIONS
// ================================================================================================

CorrelationConvection::CorrelationConvection(const PropertyOracle& oracle, CorrelationModel model,
                                             SideGeometry hot_geometry, SideGeometry cold_geometry,
                                             PlateGeometry plate)
    : oracle_(oracle), model_(model), hot_geometry_(std::move(hot_geometry)),
      cold_geometry_(std::move(cold_geometry)), plate_(plate) {}

auto CorrelationConvection::single_phase(const Zone& zone, const SupplyConditions& side, const SideGeometry& geometry,
                                         const CorrelationSide& settings, bool hot_side) const
    -> std::expected<double, HexSolverError> {

  if (settings.single_phase == SinglePhaseCorrelation::Manual) {
    return settings.manual_single_phase;
  }

  const double h_mean = hot_side ? zone.mean_h_hot() : zone.mean_h_cold();
  const double T_lower = hot_side ? zone.lower.T_hot : zone.lower.T_cold;
  const double T_upper = hot_side ? zone.upper.T_hot : zone.upper.T_cold;

  TransportProperties props;
  ORCKIT_TRY_ASSIGN(props, zone_transport(oracle_, side, h_mean, T_lower, T_upper));

  const double D = geometry.hydraulic_diameter;
  const double Re = mass_flux(side, geometry) * D / props.viscosity;
  const correlations::SinglePhaseFlow flow{Re, props.prandtl, settings.factor_single_phase,
                                           settings.exponent_factor_single_phase};

  switch (settings.single_phase) {
  case SinglePhaseCorrelation::Martin:
    return correlations::martin_nusselt(flow, plate_.chevron_angle) * props.conductivity / D;
  case SinglePhaseCorrelation::Wanniarachchi:
    return correlations::wanniarachchi_nusselt(flow, plate_.chevron_angle) * props.conductivity / D;
  case SinglePhaseCorrelation::Thonon:
    return correlations::thonon_nusselt(flow, plate_.chevron_angle) * props.conductivity / D;
  case SinglePhaseCorrelation::Gnielinski:
    return settings.factor_single_phase * correlations::gnielinski_nusselt(Re, props.prandtl) * props.conductivity /
           D;
  case SinglePhaseCorrelation::GnielinskiSha:
    return settings.factor_single_phase *
           correlations::gnielinski_sha_nusselt(Re, props.prandtl, D, geometry.tube_length) * props.conductivity / D;
  case SinglePhaseCorrelation::VdiFinnedTubesStaggered: {
    const double area_ratio = geometry.fins ? geometry.fins->area_ratio : 1.0;
    return correlations::vdi_finned_tubes_nusselt(flow, area_ratio) * props.conductivity / D;
  }
  case SinglePhaseCorrelation::WangFinnedTubesStaggered: {
    // Outer collar diameter in hydraulic_diameter, true hydraulic diameter in the secondary one
    const correlations::FinnedTubeBank bank{geometry.n_tube_rows, geometry.fin_pitch, D, geometry.longitudinal_pitch,
                                            geometry.secondary_hydraulic_diameter};
    return correlations::wang_finned_tubes_nusselt(flow, bank) * props.conductivity / D;
  }
  case SinglePhaseCorrelation::Manual:
    break;
  }
  return settings.manual_single_phase;
}

auto CorrelationConvection::condensation(const Zone& zone, const SupplyConditions& side) const
    -> std::expected<double, HexSolverError> {

  const auto& settings = model_.hot;
  if (settings.two_phase == TwoPhaseCorrelation::Manual) {
    return settings.manual_two_phase;
  }
  if (!is_condensation(settings.two_phase)) {
    return std::unexpected(HexSolverError("hot side two-phase correlation must be a condensation correlation"));
  }

  correlations::SaturatedProperties sat;
  ORCKIT_TRY_ASSIGN(sat, saturated_properties(oracle_, side));

  correlations::CondensationFlow flow;
  flow.mass_flux = mass_flux(side, hot_geometry_);
  ORCKIT_TRY_ASSIGN(flow.quality, property_at(oracle_, side, Property::Quality, Property::Enthalpy, zone.mean_h_hot()));
  flow.hydraulic_diameter = hot_geometry_.hydraulic_diameter;
  flow.saturation_temperature = 0.5 * (zone.lower.T_hot + zone.upper.T_hot);
  flow.wall_temperature = 0.25 * (zone.lower.T_hot + zone.upper.T_hot + zone.lower.T_cold + zone.upper.T_cold);
  flow.factor = settings.factor_two_phase;
  flow.exponent_factor = settings.exponent_factor_two_phase;

  switch (settings.two_phase) {
  case TwoPhaseCorrelation::HanCondensation:
    return correlations::han_condensation_coefficient(flow, sat, plate_);
  case TwoPhaseCorrelation::LongoCondensation:
    return correlations::longo_condensation_coefficient(flow, sat, plate_);
  case TwoPhaseCorrelation::CavalliniCondensation:
    return correlations::cavallini_condensation_coefficient(flow, sat);
  case TwoPhaseCorrelation::ShahCondensation: {
    double p_critical = 0.0;
    ORCKIT_TRY_ASSIGN(p_critical, property_at(oracle_, side, Property::CriticalPressure, Property::Quality, 1.0));
    return correlations::shah_condensation_coefficient(flow, sat, side.pressure / p_critical);
  }
  default:
    break;
  }
  return settings.manual_two_phase;
}

auto CorrelationConvection::boiling(const Zone& zone, const SupplyConditions& side, double h_hot,
                                    ZoneCoefficients& coefficients) const -> std::expected<double, HexSolverError> {

  const auto& settings = model_.cold;
  if (settings.two_phase == TwoPhaseCorrelation::Manual) {
    return settings.manual_two_phase;
  }
  if (!is_boiling(settings.two_phase)) {
    return std::unexpected(HexSolverError("cold side two-phase correlation must be a boiling correlation"));
  }

  const double h_mean = zone.mean_h_cold();
  ClosureResult closure;

  if (settings.two_phase == TwoPhaseCorrelation::CooperBoiling) {
    double p_critical = 0.0;
    double molar_mass = 0.0;
    ORCKIT_TRY_ASSIGN(p_critical, property_at(oracle_, side, Property::CriticalPressure, Property::Quality, 1.0));
    ORCKIT_TRY_ASSIGN(molar_mass, property_at(oracle_, side, Property::MolarMass, Property::Quality, 1.0));
    const double p_star = side.pressure / p_critical;
    const double molar_mass_g = 1e3 * molar_mass;

    auto cooper = [&](double q) {
      return correlations::cooper_boiling_coefficient(q, p_star, molar_mass_g, settings.factor_two_phase,
                                                      settings.exponent_factor_two_phase);
    };
    closure = close_heat_flux_loop(cooper, zone.duty() / cold_geometry_.area, 1.0, h_hot, zone.dt_log);
  } else {
    correlations::SaturatedProperties sat;
    ORCKIT_TRY_ASSIGN(sat, saturated_properties(oracle_, side));

    correlations::BoilingFlow flow;
    flow.mass_flux = mass_flux(side, cold_geometry_);
    ORCKIT_TRY_ASSIGN(flow.quality, property_at(oracle_, side, Property::Quality, Property::Enthalpy, h_mean));
    flow.hydraulic_diameter = cold_geometry_.hydraulic_diameter;
    flow.factor = settings.factor_two_phase;
    flow.exponent_factor = settings.exponent_factor_two_phase;

    const double boiling_scale = correlations::equivalent_mass_flux(flow.mass_flux, flow.quality, sat) *
                                 sat.latent_heat;

    if (settings.two_phase == TwoPhaseCorrelation::HanBoiling) {
      auto han = [&](double bo) { return correlations::han_boiling_coefficient(flow, sat, plate_, bo); };
      closure = close_heat_flux_loop(han, 1.0, boiling_scale, h_hot, zone.dt_log);
    } else {
      correlations::AlmalfiInputs inputs;
      ORCKIT_TRY_ASSIGN(inputs.surface_tension,
                        property_at(oracle_, side, Property::SurfaceTension, Property::Enthalpy, h_mean));
      ORCKIT_TRY_ASSIGN(inputs.mean_density, property_at(oracle_, side, Property::Density, Property::Enthalpy, h_mean));
      auto almalfi = [&](double bo) {
        return correlations::almalfi_boiling_coefficient(flow, sat, plate_, inputs, bo);
      };
      closure = close_heat_flux_loop(almalfi, 1.0, boiling_scale, h_hot, zone.dt_log);
    }
  }

  coefficients.closure_iterations = closure.iterations;
  coefficients.closure_converged = closure.converged;
  return closure.h_conv;
}

auto CorrelationConvection::evaluate(const Zone& zone, const SupplyConditions& hot, const SupplyConditions& cold) const
    -> std::expected<ZoneCoefficients, HexSolverError> {
  ZoneCoefficients coefficients;

  if (zone.hot_phase == ZonePhase::TwoPhase) {
    ORCKIT_TRY_ASSIGN(coefficients.hot, condensation(zone, hot));
  } else {
    ORCKIT_TRY_ASSIGN(coefficients.hot, single_phase(zone, hot, hot_geometry_, model_.hot, true));
  }

  // Boiling closures need the hot side coefficient of the same zone
  if (zone.cold_phase == ZonePhase::TwoPhase) {
    ORCKIT_TRY_ASSIGN(coefficients.cold, boiling(zone, cold, coefficients.hot, coefficients));
  } else {
    ORCKIT_TRY_ASSIGN(coefficients.cold, single_phase(zone, cold, cold_geometry_, model_.cold, false));
  }

  return coefficients;
}

auto create_convection_strategy(const HexConfig& config, const PropertyOracle& oracle)
    -> std::unique_ptr<ConvectionStrategy> {
  if (const auto* constant = std::get_if<ConstantCoefficientModel>(&config.model)) {
    return std::make_unique<ConstantConvection>(*constant);
  }
  if (const auto* scaled = std::get_if<ScaledCoefficientModel>(&config.model)) {
    return std::make_unique<ScaledConvection>(*scaled);
  }
  if (const auto* correlation = std::get_if<CorrelationModel>(&config.model)) {
    return std::make_unique<CorrelationConvection>(oracle, *correlation, config.hot, config.cold, config.plate);
  }
  return nullptr;
}

} // namespace orckit::hex
