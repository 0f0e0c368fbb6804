#include "orckit/thermophysics/stream.hpp"
#include "orckit/core/expected_utils.hpp"

namespace orckit::thermophysics {

auto resolve_supply(const PropertyOracle& oracle, const Stream& stream)
    -> std::expected<SupplyConditions, PropertyUndefined> {

  if (!oracle.has_fluid(stream.fluid)) {
    return std::unexpected(PropertyUndefined(std::format("unknown fluid '{}'", stream.fluid)));
  }

  SupplyConditions conditions;
  conditions.fluid = stream.fluid;
  conditions.pressure = stream.pressure;
  conditions.mass_flow = stream.mass_flow;
  conditions.incompressible = oracle.is_incompressible(stream.fluid);

  const double P = stream.pressure;
  if (stream.supply.kind == SupplyState::Kind::Enthalpy) {
    conditions.enthalpy = stream.supply.value;
    ORCKIT_TRY_ASSIGN(conditions.temperature, oracle.state(stream.fluid, Property::Temperature, Property::Pressure, P,
                                                           Property::Enthalpy, conditions.enthalpy));
  } else {
    conditions.temperature = stream.supply.value;
    ORCKIT_TRY_ASSIGN(conditions.enthalpy, oracle.state(stream.fluid, Property::Enthalpy, Property::Pressure, P,
                                                        Property::Temperature, conditions.temperature));
  }

  if (!conditions.incompressible) {
    auto h_l = oracle.state(stream.fluid, Property::Enthalpy, Property::Pressure, P, Property::Quality, 0.0);
    auto h_v = oracle.state(stream.fluid, Property::Enthalpy, Property::Pressure, P, Property::Quality, 1.0);
    // Supercritical streams have no saturation: they stay single phase
    if (h_l && h_v) {
      conditions.has_dome = true;
      conditions.h_liquid = *h_l;
      conditions.h_vapor = *h_v;
    }
  }

  return conditions;
}

} // namespace orckit::thermophysics
