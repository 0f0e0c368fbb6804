#include "orckit/thermophysics/incompressible_fluid_model.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <cmath>

namespace orckit::thermophysics {

auto IncompressibleFluidModel::enthalpy(double T) const noexcept -> double {
  const double theta = T - params_.reference_temperature;
  return params_.cp_reference * theta + 0.5 * params_.cp_slope * theta * theta;
}

auto IncompressibleFluidModel::entropy(double T) const noexcept -> double {
  const double T_ref = params_.reference_temperature;
  return (params_.cp_reference - params_.cp_slope * T_ref) * std::log(T / T_ref) + params_.cp_slope * (T - T_ref);
}

auto IncompressibleFluidModel::check_range(double T) const -> std::expected<double, PropertyUndefined> {
  if (!(T >= params_.min_temperature && T <= params_.max_temperature)) {
    return std::unexpected(PropertyUndefined(std::format("{}: T = {} K outside [{}, {}] K", params_.name, T,
                                                         params_.min_temperature, params_.max_temperature)));
  }
  return T;
}

auto IncompressibleFluidModel::temperature_from_enthalpy(double h) const -> std::expected<double, PropertyUndefined> {
  const double a = 0.5 * params_.cp_slope;
  const double b = params_.cp_reference;
  double theta;
  if (std::abs(a) < 1e-12) {
    theta = h / b;
  } else {
    const double discriminant = b * b + 4.0 * a * h;
    if (discriminant < 0.0) {
      return std::unexpected(PropertyUndefined(std::format("{}: enthalpy {} not reachable", params_.name, h)));
    }
    theta = (-b + std::sqrt(discriminant)) / (2.0 * a);
  }
  return check_range(params_.reference_temperature + theta);
}

auto IncompressibleFluidModel::temperature_from_entropy(double s) const -> std::expected<double, PropertyUndefined> {
  const numerics::BrentRootFinder solver(numerics::RootFinderConfig{.relative_tolerance = 1e-12,
                                                                     .absolute_tolerance = 1e-10});
  auto result =
      solver.solve([&](double T) { return entropy(T) - s; }, params_.min_temperature, params_.max_temperature);
  if (!result || !result->converged) {
    return std::unexpected(PropertyUndefined(std::format("{}: entropy {} outside the table", params_.name, s)));
  }
  return result->root;
}

auto IncompressibleFluidModel::evaluate(Property output, Property input1, double value1, Property input2,
                                        double value2) const -> std::expected<double, PropertyUndefined> {

  const auto has = [&](Property p) { return input1 == p || input2 == p; };
  const auto value_of = [&](Property p) { return input1 == p ? value1 : value2; };

  double T;
  if (has(Property::Temperature)) {
    ORCKIT_TRY_ASSIGN(T, check_range(value_of(Property::Temperature)));
  } else if (has(Property::Enthalpy)) {
    ORCKIT_TRY_ASSIGN(T, temperature_from_enthalpy(value_of(Property::Enthalpy)));
  } else if (has(Property::Entropy)) {
    ORCKIT_TRY_ASSIGN(T, temperature_from_entropy(value_of(Property::Entropy)));
  } else if (has(Property::Density) && params_.density_slope != 0.0) {
    T = params_.reference_temperature +
        (value_of(Property::Density) - params_.density_reference) / params_.density_slope;
    ORCKIT_TRY_ASSIGN(T, check_range(T));
  } else {
    return std::unexpected(PropertyUndefined(std::format("{}: unsupported input pair ({}, {})", params_.name,
                                                         property_name(input1), property_name(input2))));
  }

  const double theta = T - params_.reference_temperature;
  const double cp = params_.cp_reference + params_.cp_slope * theta;
  const double mu = params_.viscosity_reference *
                    std::exp(params_.viscosity_activation * (params_.reference_temperature / T - 1.0));
  const double k = params_.conductivity_reference + params_.conductivity_slope * theta;

  switch (output) {
  case Property::Temperature:
    return T;
  case Property::Pressure:
    if (has(Property::Pressure)) {
      return value_of(Property::Pressure);
    }
    break;
  case Property::Enthalpy:
    return enthalpy(T);
  case Property::Entropy:
    return entropy(T);
  case Property::Density:
    return params_.density_reference + params_.density_slope * theta;
  case Property::SpecificHeat:
    return cp;
  case Property::Viscosity:
    return mu;
  case Property::Conductivity:
    return k;
  case Property::Prandtl:
    return cp * mu / k;
  case Property::Quality:
  case Property::SurfaceTension:
  case Property::CriticalPressure:
  case Property::MolarMass:
    break;
  }

  return std::unexpected(PropertyUndefined(
      std::format("{}: {} undefined for an incompressible fluid", params_.name, property_name(output))));
}

} // namespace orckit::thermophysics
