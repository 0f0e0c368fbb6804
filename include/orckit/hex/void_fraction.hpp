#pragma once
#include "hex_config.hpp"
#include "hex_types.hpp"
#include <expected>

namespace orckit::hex {

// Saturated two-phase flow seen by the void fraction models
struct TwoPhaseMixture {
  double rho_liquid = 0.0;
  double rho_vapor = 0.0;
  double mu_liquid = 0.0;
  double mu_vapor = 0.0;
  double surface_tension = 0.0;
  double hydraulic_diameter = 0.0;
  double mass_flux = 0.0;
};

/**
 * @brief Local void fraction alpha(q) of the selected model
 *
 * Closed-form models never fail; Hughmark solves an implicit relation and reports a failed
 * bracket as an error. ZiviIntegrated and Personal have no local form and use Zivi and the
 * configured mass-averaged value respectively.
 */
[[nodiscard]] auto void_fraction(const VoidFractionSettings& settings, const TwoPhaseMixture& mixture, double q)
    -> std::expected<double, HexSolverError>;

/**
 * @brief Mean liquid volume fraction W = 1/(q2 - q1) ∫ (1 - alpha) dq over [q1, q2]
 */
[[nodiscard]] auto liquid_weight(const VoidFractionSettings& settings, const TwoPhaseMixture& mixture, double q1,
                                 double q2) -> std::expected<double, HexSolverError>;

} // namespace orckit::hex
