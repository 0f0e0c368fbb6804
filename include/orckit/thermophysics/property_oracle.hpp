#pragma once
#include "../core/exceptions.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace orckit::thermophysics {

enum class Property {
  Temperature,
  Pressure,
  Enthalpy,
  Entropy,
  Density,
  Quality,
  SpecificHeat,
  Viscosity,
  Conductivity,
  SurfaceTension,
  Prandtl,
  CriticalPressure,
  MolarMass
};

[[nodiscard]] auto property_name(Property property) noexcept -> std::string_view;

// Signalled when a property pair falls outside the valid region of a fluid
class PropertyUndefined : public core::OrckitException {
public:
  explicit PropertyUndefined(std::string_view message, std::source_location location = std::source_location::current())
      : OrckitException(std::format("Property Undefined: {}", message), location) {}
};

// Abstract interface for fluid state queries. Implementations must be reentrant.
class PropertyOracle {
public:
  virtual ~PropertyOracle() = default;

  /**
   * @brief Evaluate one property from two independent inputs
   *
   * Mirrors the usual (output, name1, value1, name2, value2) fluid library call.
   * Fluid constants (critical pressure, molar mass) ignore the input pair.
   */
  [[nodiscard]] virtual auto state(std::string_view fluid, Property output, Property input1, double value1,
                                   Property input2, double value2) const
      -> std::expected<double, PropertyUndefined> = 0;

  [[nodiscard]] virtual auto has_fluid(std::string_view fluid) const noexcept -> bool = 0;

  // Incompressible fluids have no saturation dome and are always treated as liquid
  [[nodiscard]] virtual auto is_incompressible(std::string_view fluid) const noexcept -> bool = 0;

  [[nodiscard]] virtual auto fluid_names() const -> std::vector<std::string> = 0;
};

} // namespace orckit::thermophysics
