#include "orckit/hex/zone_inventory.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/hex/void_fraction.hpp"
#include <algorithm>
#include <format>

namespace orckit::hex {

using thermophysics::Property;

auto ZoneInventory::side_mass(const Zone& zone, const thermophysics::SupplyConditions& side,
                              const SideGeometry& geometry, const VoidFractionSettings& void_fraction, bool hot_side,
                              double volume, double& weight) const -> std::expected<double, HexSolverError> {

  auto at_pressure = [&](Property output, Property input, double value) -> std::expected<double, HexSolverError> {
    auto result = oracle_.state(side.fluid, output, input, value, Property::Pressure, side.pressure);
    if (!result) {
      return std::unexpected(HexSolverError(std::format("{} side {}: {}", hot_side ? "hot" : "cold",
                                                        thermophysics::property_name(output),
                                                        result.error().message())));
    }
    return *result;
  };

  const double h_lower = hot_side ? zone.lower.h_hot : zone.lower.h_cold;
  const double h_upper = hot_side ? zone.upper.h_hot : zone.upper.h_cold;
  const ZonePhase phase = hot_side ? zone.hot_phase : zone.cold_phase;

  if (side.incompressible) {
    const double T_lower = hot_side ? zone.lower.T_hot : zone.lower.T_cold;
    const double T_upper = hot_side ? zone.upper.T_hot : zone.upper.T_cold;
    double rho_lower = 0.0;
    double rho_upper = 0.0;
    ORCKIT_TRY_ASSIGN(rho_lower, at_pressure(Property::Density, Property::Temperature, T_lower));
    ORCKIT_TRY_ASSIGN(rho_upper, at_pressure(Property::Density, Property::Temperature, T_upper));
    return volume * 0.5 * (rho_lower + rho_upper);
  }

  if (phase != ZonePhase::TwoPhase) {
    double rho_lower = 0.0;
    double rho_upper = 0.0;
    ORCKIT_TRY_ASSIGN(rho_lower, at_pressure(Property::Density, Property::Enthalpy, h_lower));
    ORCKIT_TRY_ASSIGN(rho_upper, at_pressure(Property::Density, Property::Enthalpy, h_upper));
    return volume * 0.5 * (rho_lower + rho_upper);
  }

  TwoPhaseMixture mixture;
  ORCKIT_TRY_ASSIGN(mixture.rho_liquid, at_pressure(Property::Density, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(mixture.rho_vapor, at_pressure(Property::Density, Property::Quality, 1.0));
  ORCKIT_TRY_ASSIGN(mixture.mu_liquid, at_pressure(Property::Viscosity, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(mixture.mu_vapor, at_pressure(Property::Viscosity, Property::Quality, 1.0));
  ORCKIT_TRY_ASSIGN(mixture.surface_tension, at_pressure(Property::SurfaceTension, Property::Quality, 0.0));
  mixture.hydraulic_diameter = geometry.hydraulic_diameter;
  mixture.mass_flux = geometry.cross_section > 0.0 ? side.mass_flow / geometry.n_canals / geometry.cross_section : 0.0;

  double q1 = 0.0;
  double q2 = 0.0;
  ORCKIT_TRY_ASSIGN(q1, at_pressure(Property::Quality, Property::Enthalpy, h_lower));
  ORCKIT_TRY_ASSIGN(q2, at_pressure(Property::Quality, Property::Enthalpy, h_upper));
  q2 = std::clamp(q2, 0.0, constants::hex::max_integrated_quality);
  q1 = std::clamp(q1, 0.0, q2);

  ORCKIT_TRY_ASSIGN(weight, liquid_weight(void_fraction, mixture, q1, q2));
  return volume * (mixture.rho_liquid * weight + mixture.rho_vapor * (1.0 - weight));
}

auto ZoneInventory::fill(Profile& profile, const thermophysics::SupplyConditions& hot,
                         const thermophysics::SupplyConditions& cold, bool area_based) const
    -> std::expected<InventoryTotals, HexSolverError> {

  const auto n_zones = static_cast<double>(profile.zones.size());
  double total_area_hot = 0.0;
  double total_area_cold = 0.0;
  for (const auto& zone : profile.zones) {
    total_area_hot += zone.area_hot;
    total_area_cold += zone.area_cold;
  }

  InventoryTotals totals;
  for (auto& zone : profile.zones) {
    if (profile.total_duty <= 0.0) {
      zone.volume_hot = config_.hot.volume / n_zones;
      zone.volume_cold = config_.cold.volume / n_zones;
    } else if (area_based && total_area_hot > 0.0 && total_area_cold > 0.0) {
      zone.volume_hot = config_.hot.volume * zone.area_hot / total_area_hot;
      zone.volume_cold = config_.cold.volume * zone.area_cold / total_area_cold;
    } else {
      zone.volume_hot = config_.hot.volume * zone.duty() / profile.total_duty;
      zone.volume_cold = config_.cold.volume * zone.duty() / profile.total_duty;
    }

    ORCKIT_TRY_ASSIGN(zone.mass_hot, side_mass(zone, hot, config_.hot, config_.void_fraction_hot, true,
                                               zone.volume_hot, zone.liquid_weight_hot));
    ORCKIT_TRY_ASSIGN(zone.mass_cold, side_mass(zone, cold, config_.cold, config_.void_fraction_cold, false,
                                                zone.volume_cold, zone.liquid_weight_cold));
    totals.mass_hot += zone.mass_hot;
    totals.mass_cold += zone.mass_cold;
  }
  return totals;
}

} // namespace orckit::hex
