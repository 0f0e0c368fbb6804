#include "orckit/hex/zone_profile_builder.hpp"
#include "orckit/core/expected_utils.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace orckit::hex {

using thermophysics::Property;

namespace {

// Approach temperatures above this value are accepted as touching profiles at the enthalpy limit
constexpr double touching_approach = -1e-6;

} // namespace

auto classify_phase(const thermophysics::SupplyConditions& side, double h_mean) noexcept -> ZonePhase {
  if (side.incompressible || !side.has_dome) {
    return ZonePhase::Liquid;
  }
  if (h_mean < side.h_liquid) {
    return ZonePhase::Liquid;
  }
  if (h_mean > side.h_vapor) {
    return ZonePhase::Vapor;
  }
  return ZonePhase::TwoPhase;
}

ZoneProfileBuilder::ZoneProfileBuilder(const thermophysics::PropertyOracle& oracle,
                                       thermophysics::SupplyConditions hot, thermophysics::SupplyConditions cold,
                                       int two_phase_subdivisions)
    : oracle_(oracle), hot_(std::move(hot)), cold_(std::move(cold)),
      two_phase_subdivisions_(std::max(1, two_phase_subdivisions)) {}

auto ZoneProfileBuilder::boundary_state(double duty, double h_hot_ex) const
    -> std::expected<BoundaryState, HexSolverError> {

  BoundaryState state;
  state.duty = duty;
  state.h_hot = h_hot_ex + duty / hot_.mass_flow;
  state.h_cold = cold_.enthalpy + duty / cold_.mass_flow;

  ORCKIT_TRY_ASSIGN_CTX(state.T_hot,
                        oracle_.state(hot_.fluid, Property::Temperature, Property::Pressure, hot_.pressure,
                                      Property::Enthalpy, state.h_hot),
                        HexSolverError, std::format("hot side temperature at duty {:.6g} W", duty));
  ORCKIT_TRY_ASSIGN_CTX(state.T_cold,
                        oracle_.state(cold_.fluid, Property::Temperature, Property::Pressure, cold_.pressure,
                                      Property::Enthalpy, state.h_cold),
                        HexSolverError, std::format("cold side temperature at duty {:.6g} W", duty));
  return state;
}

auto ZoneProfileBuilder::breakpoints(double duty, double h_hot_ex, double h_cold_ex) const -> std::vector<double> {
  std::vector<double> points{0.0, duty};

  if (hot_.has_dome && !hot_.incompressible) {
    for (const double h_sat : {hot_.h_liquid, hot_.h_vapor}) {
      if (h_sat > h_hot_ex && h_sat < hot_.enthalpy) {
        points.push_back(hot_.mass_flow * (h_sat - h_hot_ex));
      }
    }
  }
  if (cold_.has_dome && !cold_.incompressible) {
    for (const double h_sat : {cold_.h_liquid, cold_.h_vapor}) {
      if (h_sat > cold_.enthalpy && h_sat < h_cold_ex) {
        points.push_back(cold_.mass_flow * (h_sat - cold_.enthalpy));
      }
    }
  }

  std::ranges::sort(points);

  // Merge breakpoints closer than round-off
  const double merge_tolerance = 1e-12 * std::max(1.0, duty);
  auto last = std::unique(points.begin(), points.end(),
                          [merge_tolerance](double a, double b) { return std::abs(b - a) <= merge_tolerance; });
  points.erase(last, points.end());
  return points;
}

auto ZoneProfileBuilder::build(double duty) const -> std::expected<Profile, HexSolverError> {
  if (!std::isfinite(duty) || duty < 0.0) {
    return std::unexpected(HexSolverError(std::format("invalid candidate duty {}", duty)));
  }

  Profile profile;
  profile.total_duty = duty;
  profile.h_hot_ex = hot_.enthalpy - duty / hot_.mass_flow;
  profile.h_cold_ex = cold_.enthalpy + duty / cold_.mass_flow;

  auto points = breakpoints(duty, profile.h_hot_ex, profile.h_cold_ex);
  if (points.size() < 2) {
    points.push_back(duty);
  }

  std::vector<BoundaryState> states;
  states.reserve(points.size());
  for (const double q : points) {
    BoundaryState state;
    ORCKIT_TRY_ASSIGN(state, boundary_state(q, profile.h_hot_ex));
    states.push_back(state);
  }

  for (std::size_t i = 0; i + 1 < states.size(); ++i) {
    Zone zone;
    zone.lower = states[i];
    zone.upper = states[i + 1];
    zone.hot_phase = classify_phase(hot_, zone.mean_h_hot());
    zone.cold_phase = classify_phase(cold_, zone.mean_h_cold());

    const bool split = two_phase_subdivisions_ > 1 &&
                       (zone.hot_phase == ZonePhase::TwoPhase || zone.cold_phase == ZonePhase::TwoPhase);
    if (!split) {
      profile.zones.push_back(zone);
      continue;
    }

    BoundaryState lower = zone.lower;
    const double step = zone.duty() / two_phase_subdivisions_;
    for (int k = 1; k <= two_phase_subdivisions_; ++k) {
      BoundaryState upper = zone.upper;
      if (k < two_phase_subdivisions_) {
        ORCKIT_TRY_ASSIGN(upper, boundary_state(zone.lower.duty + k * step, profile.h_hot_ex));
      }
      Zone sub = zone;
      sub.lower = lower;
      sub.upper = upper;
      profile.zones.push_back(sub);
      lower = upper;
    }
  }

  profile.pinch = profile.zones.front().lower.approach();
  for (const auto& zone : profile.zones) {
    profile.pinch = std::min(profile.pinch, zone.upper.approach());
  }

  profile.T_hot_ex = profile.zones.front().lower.T_hot;
  profile.T_cold_ex = profile.zones.back().upper.T_cold;
  return profile;
}

auto ZoneProfileBuilder::pinch(double duty) const -> std::expected<double, HexSolverError> {
  const double h_hot_ex = hot_.enthalpy - duty / hot_.mass_flow;
  const double h_cold_ex = cold_.enthalpy + duty / cold_.mass_flow;

  double pinch = std::numeric_limits<double>::infinity();
  for (const double q : breakpoints(duty, h_hot_ex, h_cold_ex)) {
    BoundaryState state;
    ORCKIT_TRY_ASSIGN(state, boundary_state(q, h_hot_ex));
    pinch = std::min(pinch, state.approach());
  }
  return pinch;
}

auto ZoneProfileBuilder::enthalpy_limited_duty() const -> std::expected<double, HexSolverError> {
  double h_hot_limit;
  ORCKIT_TRY_ASSIGN_CTX(h_hot_limit,
                        oracle_.state(hot_.fluid, Property::Enthalpy, Property::Pressure, hot_.pressure,
                                      Property::Temperature, cold_.temperature),
                        HexSolverError, "hot side enthalpy at the cold supply temperature");
  double h_cold_limit;
  ORCKIT_TRY_ASSIGN_CTX(h_cold_limit,
                        oracle_.state(cold_.fluid, Property::Enthalpy, Property::Pressure, cold_.pressure,
                                      Property::Temperature, hot_.temperature),
                        HexSolverError, "cold side enthalpy at the hot supply temperature");

  const double duty_hot = hot_.mass_flow * (hot_.enthalpy - h_hot_limit);
  const double duty_cold = cold_.mass_flow * (h_cold_limit - cold_.enthalpy);
  return std::max(0.0, std::min(duty_hot, duty_cold));
}

auto ZoneProfileBuilder::maximum_duty() const -> std::expected<MaximumDuty, HexSolverError> {
  MaximumDuty result;
  ORCKIT_TRY_ASSIGN(result.enthalpy_limited_duty, enthalpy_limited_duty());

  const double duty_limit = result.enthalpy_limited_duty;
  ORCKIT_TRY_ASSIGN(result.pinch, pinch(duty_limit));
  result.duty = duty_limit;

  // Profiles cross before either stream reaches its limit: locate the touching duty
  if (result.pinch < touching_approach && duty_limit > 0.0) {
    numerics::RootFinderConfig root_config;
    root_config.relative_tolerance = 1e-10;
    root_config.absolute_tolerance = constants::tolerance::duty_absolute;
    const numerics::BrentRootFinder solver(root_config);

    auto pinch_residual = [this](double duty) -> std::expected<double, HexSolverError> { return pinch(duty); };
    auto root = solver.solve(pinch_residual, 0.0, duty_limit);
    if (!root) {
      return std::unexpected(HexSolverError(std::format("maximum duty search failed: {}", root.error().message())));
    }
    result.duty = root->root;
    result.pinch = root->residual;
    result.iterations = root->iterations;
  }

  return result;
}

} // namespace orckit::hex
