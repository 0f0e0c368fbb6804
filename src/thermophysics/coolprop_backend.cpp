#include "orckit/thermophysics/coolprop_backend.hpp"
#include "orckit/core/expected_utils.hpp"
#include "CoolProp.h"
#include <algorithm>
#include <cmath>
#include <ranges>

namespace orckit::thermophysics {

namespace {

auto split_list(const std::string& list) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto part : list | std::views::split(',')) {
    std::string name(part.begin(), part.end());
    if (!name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

auto last_error() -> std::string {
  try {
    return CoolProp::get_global_param_string("errstring");
  } catch (const std::exception& e) {
    return e.what();
  }
}

} // namespace

auto CoolPropBackend::props(std::string_view fluid, Property output, Property input1, double value1,
                            Property input2, double value2) const -> std::expected<double, PropertyUndefined> {

  double value = 0.0;
  try {
    std::lock_guard lock(mutex_);
    value = CoolProp::PropsSI(std::string(property_name(output)), std::string(property_name(input1)), value1,
                              std::string(property_name(input2)), value2, std::string(fluid));
    if (!std::isfinite(value)) {
      return std::unexpected(PropertyUndefined(std::format("{}({}={}, {}={}) for '{}': {}", property_name(output),
                                                           property_name(input1), value1, property_name(input2),
                                                           value2, fluid, last_error())));
    }
  } catch (const std::exception& e) {
    return std::unexpected(PropertyUndefined(std::format("{} for '{}': {}", property_name(output), fluid, e.what())));
  }
  return value;
}

auto CoolPropBackend::constant(std::string_view fluid, Property output) const
    -> std::expected<double, PropertyUndefined> {

  if (is_incompressible(fluid)) {
    return std::unexpected(
        PropertyUndefined(std::format("'{}' is incompressible and has no {}", fluid, property_name(output))));
  }

  double value = 0.0;
  try {
    std::lock_guard lock(mutex_);
    value = CoolProp::Props1SI(std::string(fluid), std::string(property_name(output)));
    if (!std::isfinite(value)) {
      return std::unexpected(
          PropertyUndefined(std::format("{} of '{}': {}", property_name(output), fluid, last_error())));
    }
  } catch (const std::exception& e) {
    return std::unexpected(PropertyUndefined(std::format("{} of '{}': {}", property_name(output), fluid, e.what())));
  }
  return value;
}

auto CoolPropBackend::extrapolated_quality(std::string_view fluid, Property input1, double value1, Property input2,
                                           double value2) const -> std::expected<double, PropertyUndefined> {

  if (input1 == Property::Quality) {
    return value1;
  }
  if (input2 == Property::Quality) {
    return value2;
  }
  if (is_incompressible(fluid)) {
    return std::unexpected(PropertyUndefined(std::format("'{}' is incompressible and has no quality", fluid)));
  }

  auto from_pair = [&](Property wanted) -> std::expected<double, PropertyUndefined> {
    if (input1 == wanted) {
      return value1;
    }
    if (input2 == wanted) {
      return value2;
    }
    return props(fluid, wanted, input1, value1, input2, value2);
  };

  double P = 0.0;
  double h = 0.0;
  double P_critical = 0.0;
  ORCKIT_TRY_ASSIGN(P, from_pair(Property::Pressure));
  ORCKIT_TRY_ASSIGN(h, from_pair(Property::Enthalpy));
  ORCKIT_TRY_ASSIGN(P_critical, constant(fluid, Property::CriticalPressure));

  if (P >= P_critical) {
    return std::unexpected(
        PropertyUndefined(std::format("quality of '{}' undefined above the critical pressure ({} Pa)", fluid, P)));
  }

  double h_liquid = 0.0;
  double h_vapor = 0.0;
  ORCKIT_TRY_ASSIGN(h_liquid, props(fluid, Property::Enthalpy, Property::Pressure, P, Property::Quality, 0.0));
  ORCKIT_TRY_ASSIGN(h_vapor, props(fluid, Property::Enthalpy, Property::Pressure, P, Property::Quality, 1.0));

  if (!(h_vapor > h_liquid)) {
    return std::unexpected(PropertyUndefined(std::format("degenerate dome of '{}' at {} Pa", fluid, P)));
  }
  return (h - h_liquid) / (h_vapor - h_liquid);
}

auto CoolPropBackend::state(std::string_view fluid, Property output, Property input1, double value1, Property input2,
                            double value2) const -> std::expected<double, PropertyUndefined> {

  switch (output) {
  case Property::CriticalPressure:
  case Property::MolarMass:
    return constant(fluid, output);
  case Property::Quality:
    return extrapolated_quality(fluid, input1, value1, input2, value2);
  default:
    return props(fluid, output, input1, value1, input2, value2);
  }
}

auto CoolPropBackend::has_fluid(std::string_view fluid) const noexcept -> bool {
  try {
    std::lock_guard lock(mutex_);
    if (fluid.starts_with(incompressible_prefix)) {
      const auto names = split_list(CoolProp::get_global_param_string("incompressible_list_pure"));
      const std::string_view bare = fluid.substr(incompressible_prefix.size());
      return std::ranges::find(names, bare) != names.end();
    }
    // Throws for names CoolProp cannot resolve, aliases included
    return !CoolProp::get_fluid_param_string(std::string(fluid), "CAS").empty();
  } catch (const std::exception&) {
    return false;
  }
}

auto CoolPropBackend::is_incompressible(std::string_view fluid) const noexcept -> bool {
  return fluid.starts_with(incompressible_prefix);
}

auto CoolPropBackend::fluid_names() const -> std::vector<std::string> {
  std::lock_guard lock(mutex_);
  auto names = split_list(CoolProp::get_global_param_string("FluidsList"));
  for (const auto& name : split_list(CoolProp::get_global_param_string("incompressible_list_pure"))) {
    names.push_back(std::format("{}{}", incompressible_prefix, name));
  }
  std::ranges::sort(names);
  return names;
}

} // namespace orckit::thermophysics
