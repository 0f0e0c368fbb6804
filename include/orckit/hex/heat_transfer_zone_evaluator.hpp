#pragma once
#include "../core/constants.hpp"
#include "convection_strategy.hpp"
#include "hex_config.hpp"
#include "hex_types.hpp"
#include <cmath>
#include <expected>

namespace orckit::hex {

struct ClosureResult {
  double h_conv = 0.0;
  double relative_change = 1.0;
  int iterations = 0;
  bool converged = false;
};

/**
 * @brief Fixed point between a heat-flux dependent coefficient and the zone area
 *
 * Iterates x -> h(x) -> U = (1/h + 1/h_hot)^-1 -> q = U·LMTD -> x = q/scale until the relative
 * change of x drops below 5% or the iteration cap is reached. The last coefficient is kept
 * either way; the caller decides how to report a non-converged closure.
 */
template <typename F>
[[nodiscard]] auto close_heat_flux_loop(F&& coefficient, double initial, double scale, double h_hot, double dt_log)
    -> ClosureResult {
  ClosureResult result;
  double x = initial;
  while (result.iterations < constants::iteration_limits::boiling_number_max &&
         result.relative_change > constants::hex::boiling_number_tolerance) {
    ++result.iterations;
    result.h_conv = coefficient(x);
    const double U = 1.0 / (1.0 / result.h_conv + 1.0 / h_hot);
    const double x_new = U * dt_log / scale;
    result.relative_change = x > 0.0 ? std::abs(x_new - x) / x : 1.0;
    x = x_new;
  }
  result.converged = result.relative_change <= constants::hex::boiling_number_tolerance;
  return result;
}

struct AreaEvaluation {
  double area_hot = 0.0; // required hot side area [m²]
  double residual = 0.0; // 1 - required / available
  int unconverged_closures = 0;
};

/**
 * @brief Zone-wise convective coefficients, fin efficiencies, conductance and required area
 */
class HeatTransferZoneEvaluator {
private:
  const ConvectionStrategy& strategy_;
  SideGeometry hot_geometry_;
  SideGeometry cold_geometry_;

public:
  HeatTransferZoneEvaluator(const ConvectionStrategy& strategy, SideGeometry hot_geometry,
                            SideGeometry cold_geometry);

  // Fills the heat transfer fields of every zone and returns the area residual
  [[nodiscard]] auto evaluate(Profile& profile, const thermophysics::SupplyConditions& hot,
                              const thermophysics::SupplyConditions& cold) const
      -> std::expected<AreaEvaluation, HexSolverError>;
};

} // namespace orckit::hex
