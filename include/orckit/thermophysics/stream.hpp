#pragma once
#include "property_oracle.hpp"
#include <expected>
#include <string>

namespace orckit::thermophysics {

// Supply state of a stream: either an enthalpy or a temperature
struct SupplyState {
  enum class Kind { Enthalpy, Temperature };

  Kind kind = Kind::Enthalpy;
  double value = 0.0;

  [[nodiscard]] static auto enthalpy(double h) noexcept -> SupplyState { return {Kind::Enthalpy, h}; }
  [[nodiscard]] static auto temperature(double T) noexcept -> SupplyState { return {Kind::Temperature, T}; }
};

struct Stream {
  std::string fluid;
  double pressure = 0.0;  // [Pa]
  SupplyState supply;
  double mass_flow = 0.0; // [kg/s]
};

/**
 * @brief Stream supply state resolved against a property oracle
 *
 * The saturation enthalpies are only meaningful when has_dome is true
 * (subcritical pure fluid). Without a dome the stream is single phase.
 */
struct SupplyConditions {
  std::string fluid;
  double pressure = 0.0;
  double mass_flow = 0.0;
  double enthalpy = 0.0;
  double temperature = 0.0;
  bool incompressible = false;
  bool has_dome = false;
  double h_liquid = 0.0;
  double h_vapor = 0.0;
};

[[nodiscard]] auto resolve_supply(const PropertyOracle& oracle, const Stream& stream)
    -> std::expected<SupplyConditions, PropertyUndefined>;

} // namespace orckit::thermophysics
