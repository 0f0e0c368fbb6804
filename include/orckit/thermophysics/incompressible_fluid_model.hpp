#pragma once
#include "fluid_parameters.hpp"
#include "property_oracle.hpp"
#include <expected>

namespace orckit::thermophysics {

// Temperature-only liquid: pressure is carried through but never changes a property
class IncompressibleFluidModel {
private:
  IncompressibleFluidParameters params_;

  [[nodiscard]] auto enthalpy(double T) const noexcept -> double;
  [[nodiscard]] auto entropy(double T) const noexcept -> double;
  [[nodiscard]] auto temperature_from_enthalpy(double h) const -> std::expected<double, PropertyUndefined>;
  [[nodiscard]] auto temperature_from_entropy(double s) const -> std::expected<double, PropertyUndefined>;
  [[nodiscard]] auto check_range(double T) const -> std::expected<double, PropertyUndefined>;

public:
  explicit IncompressibleFluidModel(IncompressibleFluidParameters params) : params_(std::move(params)) {}

  [[nodiscard]] auto parameters() const noexcept -> const IncompressibleFluidParameters& { return params_; }

  [[nodiscard]] auto evaluate(Property output, Property input1, double value1, Property input2, double value2) const
      -> std::expected<double, PropertyUndefined>;
};

} // namespace orckit::thermophysics
