#include "orckit/thermophysics/fluid_library.hpp"
#include <algorithm>

namespace orckit::thermophysics {

auto property_name(Property property) noexcept -> std::string_view {
  switch (property) {
  case Property::Temperature:
    return "T";
  case Property::Pressure:
    return "P";
  case Property::Enthalpy:
    return "H";
  case Property::Entropy:
    return "S";
  case Property::Density:
    return "D";
  case Property::Quality:
    return "Q";
  case Property::SpecificHeat:
    return "C";
  case Property::Viscosity:
    return "V";
  case Property::Conductivity:
    return "L";
  case Property::SurfaceTension:
    return "I";
  case Property::Prandtl:
    return "Prandtl";
  case Property::CriticalPressure:
    return "Pcrit";
  case Property::MolarMass:
    return "M";
  }
  return "?";
}

void FluidLibrary::add(IncompressibleFluidParameters params) {
  const std::string name = params.name;
  thermal_oils_.insert_or_assign(name, IncompressibleFluidModel(std::move(params)));
}

auto FluidLibrary::state(std::string_view fluid, Property output, Property input1, double value1, Property input2,
                         double value2) const -> std::expected<double, PropertyUndefined> {

  if (auto it = thermal_oils_.find(fluid); it != thermal_oils_.end()) {
    return it->second.evaluate(output, input1, value1, input2, value2);
  }
  return coolprop_.state(fluid, output, input1, value1, input2, value2);
}

auto FluidLibrary::has_fluid(std::string_view fluid) const noexcept -> bool {
  return thermal_oils_.contains(fluid) || coolprop_.has_fluid(fluid);
}

auto FluidLibrary::is_incompressible(std::string_view fluid) const noexcept -> bool {
  return thermal_oils_.contains(fluid) || coolprop_.is_incompressible(fluid);
}

auto FluidLibrary::fluid_names() const -> std::vector<std::string> {
  auto names = coolprop_.fluid_names();
  for (const auto& [name, model] : thermal_oils_) {
    if (std::ranges::find(names, name) == names.end()) {
      names.push_back(name);
    }
  }
  std::ranges::sort(names);
  return names;
}

auto validate_fluid(const IncompressibleFluidParameters& params) -> std::expected<void, ThermophysicsError> {
  if (params.name.empty()) {
    return std::unexpected(ThermophysicsError("fluid without a name"));
  }
  if (params.cp_reference <= 0.0 || params.density_reference <= 0.0 || params.conductivity_reference <= 0.0 ||
      params.viscosity_reference <= 0.0) {
    return std::unexpected(
        ThermophysicsError(std::format("'{}': cp, density, conductivity and viscosity must be positive", params.name)));
  }
  if (params.min_temperature <= 0.0 || params.max_temperature <= params.min_temperature) {
    return std::unexpected(
        ThermophysicsError(std::format("'{}': invalid temperature range [{}, {}]", params.name,
                                       params.min_temperature, params.max_temperature)));
  }
  return {};
}

auto create_property_oracle(const io::FluidsConfig& config)
    -> std::expected<std::unique_ptr<PropertyOracle>, ThermophysicsError> {

  auto library = std::make_unique<FluidLibrary>();

  for (const auto& params : config.incompressible) {
    if (auto valid = validate_fluid(params); !valid) {
      return std::unexpected(valid.error());
    }
    library->add(params);
  }

  return std::unique_ptr<PropertyOracle>(std::move(library));
}

} // namespace orckit::thermophysics
