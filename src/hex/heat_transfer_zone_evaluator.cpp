#include "orckit/hex/heat_transfer_zone_evaluator.hpp"
#include "orckit/hex/convection_correlations.hpp"
#include <format>

namespace orckit::hex {

HeatTransferZoneEvaluator::HeatTransferZoneEvaluator(const ConvectionStrategy& strategy, SideGeometry hot_geometry,
                                                     SideGeometry cold_geometry)
    : strategy_(strategy), hot_geometry_(std::move(hot_geometry)), cold_geometry_(std::move(cold_geometry)) {}

auto HeatTransferZoneEvaluator::evaluate(Profile& profile, const thermophysics::SupplyConditions& hot,
                                         const thermophysics::SupplyConditions& cold) const
    -> std::expected<AreaEvaluation, HexSolverError> {

  const double area_ratio = cold_geometry_.area / hot_geometry_.area;
  AreaEvaluation evaluation;

  for (std::size_t j = 0; j < profile.zones.size(); ++j) {
    auto& zone = profile.zones[j];

    zone.dt_log = correlations::log_mean_temperature_difference(zone.upper.T_hot - zone.upper.T_cold,
                                                                zone.lower.T_hot - zone.lower.T_cold);

    auto coefficients = strategy_.evaluate(zone, hot, cold);
    if (!coefficients) {
      return std::unexpected(HexSolverError(
          std::format("zone {} convective coefficients: {}", j, coefficients.error().message())));
    }
    if (!coefficients->closure_converged) {
      ++evaluation.unconverged_closures;
    }

    zone.h_conv_hot = coefficients->hot;
    zone.h_conv_cold = coefficients->cold;
    zone.fin_efficiency_hot = correlations::surface_efficiency(zone.h_conv_hot, hot_geometry_.fins);
    zone.fin_efficiency_cold = correlations::surface_efficiency(zone.h_conv_cold, cold_geometry_.fins);

    zone.conductance = 1.0 / (1.0 / (zone.h_conv_hot * zone.fin_efficiency_hot) +
                              1.0 / (zone.h_conv_cold * zone.fin_efficiency_cold * area_ratio));
    zone.area_hot = zone.duty() / zone.dt_log / zone.conductance;
    zone.area_cold = zone.area_hot * area_ratio;

    evaluation.area_hot += zone.area_hot;
  }

  evaluation.residual = 1.0 - evaluation.area_hot / hot_geometry_.area;
  return evaluation;
}

} // namespace orckit::hex
