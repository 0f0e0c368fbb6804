#pragma once
#include "../io/config_types.hpp"
#include "coolprop_backend.hpp"
#include "incompressible_fluid_model.hpp"
#include "property_oracle.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>

namespace orckit::thermophysics {

class ThermophysicsError : public core::OrckitException {
public:
  explicit ThermophysicsError(std::string_view message, std::source_location location = std::source_location::current())
      : OrckitException(std::format("Thermophysics Error: {}", message), location) {}
};

// CoolProp fluids plus thermal oils declared in the configuration. A declared oil shadows a
// CoolProp fluid of the same name.
class FluidLibrary : public PropertyOracle {
private:
  CoolPropBackend coolprop_;
  std::map<std::string, IncompressibleFluidModel, std::less<>> thermal_oils_;

public:
  FluidLibrary() = default;

  void add(IncompressibleFluidParameters params);

  [[nodiscard]] auto state(std::string_view fluid, Property output, Property input1, double value1, Property input2,
                           double value2) const -> std::expected<double, PropertyUndefined> override;

  [[nodiscard]] auto has_fluid(std::string_view fluid) const noexcept -> bool override;

  [[nodiscard]] auto is_incompressible(std::string_view fluid) const noexcept -> bool override;

  [[nodiscard]] auto fluid_names() const -> std::vector<std::string> override;
};

[[nodiscard]] auto validate_fluid(const IncompressibleFluidParameters& params)
    -> std::expected<void, ThermophysicsError>;

// Factory: CoolProp plus the thermal oils declared in the configuration
[[nodiscard]] auto create_property_oracle(const io::FluidsConfig& config)
    -> std::expected<std::unique_ptr<PropertyOracle>, ThermophysicsError>;

} // namespace orckit::thermophysics
