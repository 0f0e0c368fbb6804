#pragma once
#include "hex_config.hpp"
#include <optional>

namespace orckit::hex::correlations {

// ================================================================================================
// ZONE HEAT TRANSFER HELPERS
// ================================================================================================

/**
 * @brief Log-mean temperature difference of a counter-flow zone
 * @param dt_hot_end Hot supply side difference T_h,in - T_c,out [K]
 * @param dt_cold_end Cold supply side difference T_h,out - T_c,in [K]
 *
 * Both differences are floored at 1e-2 K. Equal differences return that value.
 */
[[nodiscard]] auto log_mean_temperature_difference(double dt_hot_end, double dt_cold_end) noexcept -> double;

// Schmidt efficiency of the equivalent circular fin
[[nodiscard]] auto schmidt_fin_efficiency(double h_conv, const FinGeometry& fin) noexcept -> double;

// Surface efficiency 1 - omega_f (1 - eta_fin), 1 for an unfinned side
[[nodiscard]] auto surface_efficiency(double h_conv, const std::optional<FinGeometry>& fin) noexcept -> double;

// ================================================================================================
// SINGLE-PHASE NUSSELT NUMBERS
// ================================================================================================

struct SinglePhaseFlow {
  double reynolds = 0.0;
  double prandtl = 0.0;
  double factor = 1.0;          // multiplies the Nusselt number
  double exponent_factor = 1.0; // scales the Reynolds exponent
};

// Chevron plates, Martin (VDI Heat Atlas)
[[nodiscard]] auto martin_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double;

[[nodiscard]] auto wanniarachchi_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double;

// Thonon coefficients tabulated for chevron angles up to 60°
[[nodiscard]] auto thonon_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double;

// Smooth tubes, Gnielinski with Konakov friction factor, 3.66 in laminar flow (factor not applied)
[[nodiscard]] auto gnielinski_nusselt(double reynolds, double prandtl) noexcept -> double;

// Gnielinski with the developing laminar flow of Shah (factor not applied)
[[nodiscard]] auto gnielinski_sha_nusselt(double reynolds, double prandtl, double hydraulic_diameter,
                                          double tube_length) noexcept -> double;

// Staggered finned tube banks, VDI Heat Atlas M1
[[nodiscard]] auto vdi_finned_tubes_nusselt(const SinglePhaseFlow& flow, double area_ratio) noexcept -> double;

struct FinnedTubeBank {
  double n_rows = 0.0;
  double fin_pitch = 0.0;
  double collar_diameter = 0.0;
  double longitudinal_pitch = 0.0;
  double hydraulic_diameter = 0.0;
};

// Staggered finned tube banks, Wang (Reynolds based on the collar diameter)
[[nodiscard]] auto wang_finned_tubes_nusselt(const SinglePhaseFlow& flow, const FinnedTubeBank& bank) noexcept
    -> double;

// ================================================================================================
// TWO-PHASE CORRELATIONS
// ================================================================================================

struct SaturatedProperties {
  double rho_liquid = 0.0;
  double rho_vapor = 0.0;
  double mu_liquid = 0.0;
  double mu_vapor = 0.0;
  double k_liquid = 0.0;
  double prandtl_liquid = 0.0;
  double latent_heat = 0.0;
};

// G_eq = G ((1 - x) + x sqrt(rho_l / rho_v))
[[nodiscard]] auto equivalent_mass_flux(double mass_flux, double quality, const SaturatedProperties& sat) noexcept
    -> double;

struct CondensationFlow {
  double mass_flux = 0.0;
  double quality = 0.0;
  double hydraulic_diameter = 0.0;
  double saturation_temperature = 0.0; // zone mean hot temperature [K]
  double wall_temperature = 0.0;       // zone mean of both streams [K]
  double factor = 1.0;
  double exponent_factor = 1.0;
};

[[nodiscard]] auto han_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                                const PlateGeometry& plate) noexcept -> double;

[[nodiscard]] auto longo_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                                  const PlateGeometry& plate) noexcept -> double;

[[nodiscard]] auto cavallini_condensation_coefficient(const CondensationFlow& flow,
                                                      const SaturatedProperties& sat) noexcept -> double;

[[nodiscard]] auto shah_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                                 double reduced_pressure) noexcept -> double;

struct BoilingFlow {
  double mass_flux = 0.0;
  double quality = 0.0;
  double hydraulic_diameter = 0.0;
  double factor = 1.0;
  double exponent_factor = 1.0;
};

// Nusselt number of Han's plate boiling correlation at boiling number bo
[[nodiscard]] auto han_boiling_coefficient(const BoilingFlow& flow, const SaturatedProperties& sat,
                                           const PlateGeometry& plate, double bo) noexcept -> double;

struct AlmalfiInputs {
  double surface_tension = 0.0; // at the zone mean enthalpy [N/m]
  double mean_density = 0.0;    // at the zone mean enthalpy [kg/m³]
};

[[nodiscard]] auto bond_number(const SaturatedProperties& sat, double surface_tension,
                               double hydraulic_diameter) noexcept -> double;

[[nodiscard]] auto almalfi_boiling_coefficient(const BoilingFlow& flow, const SaturatedProperties& sat,
                                               const PlateGeometry& plate, const AlmalfiInputs& inputs,
                                               double bo) noexcept -> double;

// Cooper pool boiling at heat flux q [W/m²], molar mass in g/mol
[[nodiscard]] auto cooper_boiling_coefficient(double heat_flux, double reduced_pressure, double molar_mass_g,
                                              double factor, double exponent_factor) noexcept -> double;

} // namespace orckit::hex::correlations
