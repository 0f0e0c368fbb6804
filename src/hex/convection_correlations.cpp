#include "orckit/hex/convection_correlations.hpp"
#include "orckit/core/constants.hpp"
#include <algorithm>
#include <cmath>

namespace orckit::hex::correlations {

namespace {

using constants::physical::gravity;
using constants::physical::pi;

constexpr double one_third = 1.0 / 3.0;

// Konakov friction factor of smooth tubes
[[nodiscard]] auto konakov_friction(double reynolds) noexcept -> double {
  return std::pow(1.8 * std::log10(reynolds) - 1.5, -2.0);
}

[[nodiscard]] auto gnielinski_turbulent(double reynolds, double prandtl) noexcept -> double {
  const double f = konakov_friction(reynolds);
  return (f / 8.0) * (reynolds - 1000.0) * prandtl /
         (1.0 + 12.7 * std::sqrt(f / 8.0) * (std::pow(prandtl, 2.0 / 3.0) - 1.0));
}

} // namespace

auto log_mean_temperature_difference(double dt_hot_end, double dt_cold_end) noexcept -> double {
  const double floor = constants::hex::min_end_temperature_difference;
  const double dt_h = std::max(dt_hot_end, floor);
  const double dt_c = std::max(dt_cold_end, floor);
  if (dt_h == dt_c) {
    return dt_h;
  }
  return (dt_h - dt_c) / std::log(dt_h / dt_c);
}

auto schmidt_fin_efficiency(double h_conv, const FinGeometry& fin) noexcept -> double {
  const double m = std::sqrt(2.0 * h_conv / fin.conductivity / fin.thickness);
  const double phi_f = fin.half_width / fin.tube_radius;
  const double beta_f = fin.half_length / fin.half_width;
  const double R_e = fin.tube_radius * 1.27 * phi_f * std::sqrt(beta_f - 0.3);
  const double phi = (R_e / fin.tube_radius - 1.0) * (1.0 + 0.35 * std::log(R_e / fin.tube_radius));
  const double x = m * R_e * phi;
  return std::tanh(x) / x;
}

auto surface_efficiency(double h_conv, const std::optional<FinGeometry>& fin) noexcept -> double {
  if (!fin) {
    return 1.0;
  }
  return 1.0 - fin->finned_area_fraction * (1.0 - schmidt_fin_efficiency(h_conv, *fin));
}

// ================================================================================================
// SINGLE-PHASE
// ================================================================================================

auto martin_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double {
  const double Re = flow.reynolds;
  double f_0, f_90;
  if (Re < 2000.0) {
    f_0 = 16.0 / Re;
    f_90 = 149.25 / Re + 0.9625;
  } else {
    f_0 = std::pow(1.56 * std::log(Re) - 3.0, -2.0);
    f_90 = 9.75 / std::pow(Re, 0.289);
  }

  const double c = std::cos(chevron_angle);
  const double f = std::pow(c / std::sqrt(0.045 * std::tan(chevron_angle) + 0.09 * std::sin(chevron_angle) + f_0 / c) +
                                (1.0 - c) / std::sqrt(3.8 * f_90),
                            -0.5);

  return flow.factor * 0.205 * std::pow(flow.prandtl, one_third) *
         std::pow(f * Re * Re * std::sin(2.0 * chevron_angle), flow.exponent_factor * 0.374);
}

auto wanniarachchi_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double {
  const double beta = 90.0 - chevron_angle * 180.0 / pi;
  const double Re = flow.reynolds;
  const double j_turbulent =
      12.6 * std::pow(beta, -1.142) * std::pow(Re, flow.exponent_factor * (0.646 + 0.00111 * beta));
  const double j_laminar = 3.65 * std::pow(beta, -0.455) * std::pow(Re, flow.exponent_factor * -0.339);
  return flow.factor * std::cbrt(std::pow(j_laminar, 3) + std::pow(j_turbulent, 3)) *
         std::pow(flow.prandtl, one_third);
}

auto thonon_nusselt(const SinglePhaseFlow& flow, double chevron_angle) noexcept -> double {
  const double degree = pi / 180.0;
  double C, m;
  if (chevron_angle <= 15.0 * degree) {
    C = 0.1;
    m = 0.687;
  } else if (chevron_angle <= 30.0 * degree) {
    C = 0.2267;
    m = 0.631;
  } else if (chevron_angle <= 45.0 * degree) {
    C = 0.2998;
    m = 0.645;
  } else {
    C = 0.2946;
    m = 0.7;
  }
  return flow.factor * C * std::pow(flow.reynolds, flow.exponent_factor * m) * std::pow(flow.prandtl, one_third);
}

auto gnielinski_nusselt(double reynolds, double prandtl) noexcept -> double {
  if (reynolds > 2300.0) {
    return gnielinski_turbulent(reynolds, prandtl);
  }
  return 3.66;
}

auto gnielinski_sha_nusselt(double reynolds, double prandtl, double hydraulic_diameter, double tube_length) noexcept
    -> double {
  if (reynolds > 2300.0) {
    return gnielinski_turbulent(reynolds, prandtl);
  }
  const double Nu_1 = 4.364;
  const double Nu_2 = 1.953 * std::cbrt(reynolds * prandtl * hydraulic_diameter / tube_length);
  return std::cbrt(Nu_1 * Nu_1 * Nu_1 + 0.6 * 0.6 * 0.6 + std::pow(Nu_2 - 0.6, 3));
}

auto vdi_finned_tubes_nusselt(const SinglePhaseFlow& flow, double area_ratio) noexcept -> double {
  return flow.factor * 0.38 * std::pow(flow.reynolds, flow.exponent_factor * 0.6) *
         std::pow(flow.prandtl, one_third) * std::pow(area_ratio, -0.15);
}

auto wang_finned_tubes_nusselt(const SinglePhaseFlow& flow, const FinnedTubeBank& bank) noexcept -> double {
  const double Re = flow.reynolds;
  const double N = bank.n_rows;
  const double F_p = bank.fin_pitch;
  const double D_c = bank.collar_diameter;
  const double P_l = bank.longitudinal_pitch;
  const double D_h = bank.hydraulic_diameter;
  const double ln_Re = std::log(Re);

  const double p1 = -0.361 - 0.042 * N / ln_Re + 0.158 * std::log(N * std::pow(F_p / D_c, 0.41));
  const double p2 = -1.224 - 0.076 * std::pow(P_l / D_h, 1.42) / ln_Re;
  const double p3 = -0.083 + 0.058 * N / ln_Re;
  const double p4 = -5.735 + 1.21 * std::log(Re / N);
  const double p5 = -0.93;

  const double j = 0.086 * std::pow(Re, p1) * std::pow(N, p2) * std::pow(F_p / D_c, p3) * std::pow(F_p / D_h, p4) *
                   std::pow(F_p / P_l, p5);
  return flow.factor * std::pow(j * Re, flow.exponent_factor) * std::pow(flow.prandtl, one_third);
}

// ================================================================================================
// TWO-PHASE
// ================================================================================================

auto equivalent_mass_flux(double mass_flux, double quality, const SaturatedProperties& sat) noexcept -> double {
  return mass_flux * ((1.0 - quality) + quality * std::sqrt(sat.rho_liquid / sat.rho_vapor));
}

auto han_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                  const PlateGeometry& plate) noexcept -> double {
  const double pitch_ratio = plate.corrugation_pitch / flow.hydraulic_diameter;
  const double Ge1 = 11.22 * std::pow(pitch_ratio, -2.83) * std::pow(plate.chevron_angle, -4.5);
  const double Ge2 = 0.35 * std::pow(pitch_ratio, 0.23) * std::pow(plate.chevron_angle, 1.48);
  const double Re_eq = equivalent_mass_flux(flow.mass_flux, flow.quality, sat) * flow.hydraulic_diameter / sat.mu_liquid;
  const double Nu = flow.factor * Ge1 * std::pow(Re_eq, flow.exponent_factor * Ge2) *
                    std::pow(sat.prandtl_liquid, one_third);
  return Nu * sat.k_liquid / flow.hydraulic_diameter;
}

auto longo_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                    const PlateGeometry& plate) noexcept -> double {
  const double Re_eq = equivalent_mass_flux(flow.mass_flux, flow.quality, sat) * flow.hydraulic_diameter / sat.mu_liquid;

  // Gravity-controlled film condensation
  if (Re_eq < 1600.0) {
    const double k3 = std::pow(sat.k_liquid, 3);
    const double film = k3 * sat.rho_liquid * sat.rho_liquid * gravity * sat.latent_heat /
                        (sat.mu_liquid * (flow.saturation_temperature - flow.wall_temperature) * plate.plate_length);
    return flow.factor * plate.enlargement_factor * 0.943 * std::pow(film, 0.25);
  }

  return flow.factor * 1.875 * plate.enlargement_factor * sat.k_liquid / flow.hydraulic_diameter *
         std::pow(Re_eq, flow.exponent_factor * 0.445) * std::pow(sat.prandtl_liquid, one_third);
}

auto cavallini_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat) noexcept
    -> double {
  const double x = flow.quality;
  const double d = flow.hydraulic_diameter;
  const double G = flow.mass_flux;
  const double C_T = 2.6; // 1.6 for hydrocarbons

  const double X_tt = std::pow(sat.mu_liquid / sat.mu_vapor, 0.1) * std::sqrt(sat.rho_vapor / sat.rho_liquid) *
                      std::pow((1.0 - x) / x, 0.9);
  const double Re_l = G * d / sat.mu_liquid;
  const double J_v = x * G / std::sqrt(gravity * d * sat.rho_vapor * (sat.rho_liquid - sat.rho_vapor));
  const double J_v_T =
      std::pow(std::pow(7.5 / (4.3 * std::pow(X_tt, 1.111) + 1.0), -3.0) + std::pow(C_T, -3.0), -one_third);

  const double h_lo = 0.023 * std::pow(Re_l, flow.exponent_factor * 0.8) * std::pow(sat.prandtl_liquid, 0.4) *
                      sat.k_liquid / d;
  const double h_a = h_lo * (1.0 + 1.128 * std::pow(x, 0.817) * std::pow(sat.rho_liquid / sat.rho_vapor, 0.3685) *
                                       std::pow(sat.mu_liquid / sat.mu_vapor, 0.2363) *
                                       std::pow(1.0 - sat.mu_vapor / sat.mu_liquid, 2.144) *
                                       std::pow(sat.prandtl_liquid, -0.1));

  // Temperature-difference independent regime
  if (J_v > J_v_T) {
    return flow.factor * h_a;
  }

  const double k3 = std::pow(sat.k_liquid, 3);
  const double film = k3 * sat.rho_liquid * (sat.rho_liquid - sat.rho_vapor) * gravity * sat.latent_heat /
                      (sat.mu_liquid * d * (flow.saturation_temperature - flow.wall_temperature));
  const double h_strat = 0.725 / (1.0 + 0.741 * std::pow((1.0 - x) / x, 0.3321)) * std::pow(film, 0.25) +
                         (1.0 - std::pow(x, 0.087)) * h_lo;
  const double h_d = J_v / J_v_T * (h_a * std::pow(J_v_T / J_v, 0.8) - h_strat) + h_strat;
  return flow.factor * h_d;
}

auto shah_condensation_coefficient(const CondensationFlow& flow, const SaturatedProperties& sat,
                                   double reduced_pressure) noexcept -> double {
  const double x = flow.quality;
  const double Re_l = flow.mass_flux * flow.hydraulic_diameter / sat.mu_liquid;
  return flow.factor * 0.023 * (sat.k_liquid / flow.hydraulic_diameter) *
         std::pow(Re_l, flow.exponent_factor * 0.8) * std::pow(sat.prandtl_liquid, 0.4) *
         (std::pow(1.0 - x, 0.8) + 3.8 * std::pow(x, 0.76) * std::pow(1.0 - x, 0.04) / std::pow(reduced_pressure, 0.38));
}

auto han_boiling_coefficient(const BoilingFlow& flow, const SaturatedProperties& sat, const PlateGeometry& plate,
                             double bo) noexcept -> double {
  const double pitch_ratio = plate.corrugation_pitch / flow.hydraulic_diameter;
  const double Ge1 = 2.81 * std::pow(pitch_ratio, -0.041) * std::pow(plate.chevron_angle, -2.83);
  const double Ge2 = 0.746 * std::pow(pitch_ratio, -0.082) * std::pow(plate.chevron_angle, 0.61);
  const double Re_eq = equivalent_mass_flux(flow.mass_flux, flow.quality, sat) * flow.hydraulic_diameter / sat.mu_liquid;
  const double Nu = flow.factor * Ge1 * std::pow(Re_eq, flow.exponent_factor * Ge2) * std::pow(bo, 0.3) *
                    std::pow(sat.prandtl_liquid, 0.4);
  return Nu * sat.k_liquid / flow.hydraulic_diameter;
}

auto bond_number(const SaturatedProperties& sat, double surface_tension, double hydraulic_diameter) noexcept
    -> double {
  return (sat.rho_liquid - sat.rho_vapor) * gravity * hydraulic_diameter * hydraulic_diameter / surface_tension;
}

auto almalfi_boiling_coefficient(const BoilingFlow& flow, const SaturatedProperties& sat, const PlateGeometry& plate,
                                 const AlmalfiInputs& inputs, double bo) noexcept -> double {
  const double D = flow.hydraulic_diameter;
  const double G = flow.mass_flux;
  const double Bd = bond_number(sat, inputs.surface_tension, D);
  const double beta_star = plate.chevron_angle / (70.0 * pi / 180.0);
  const double rho_star = sat.rho_liquid / sat.rho_vapor;

  double Nu;
  if (Bd < 4.0) {
    const double We = G * G * D / (inputs.mean_density * inputs.surface_tension);
    Nu = flow.factor * 982.0 * std::pow(beta_star, 1.101) * std::pow(We, flow.exponent_factor * 0.315) *
         std::pow(bo, 0.32) * std::pow(rho_star, -0.224);
  } else {
    const double Re_v = G * flow.quality * D / sat.mu_vapor;
    const double Re_lo = G * D / sat.mu_liquid;
    Nu = flow.factor * 18.495 * std::pow(beta_star, 0.248) * std::pow(Re_v, flow.exponent_factor * 0.135) *
         std::pow(Re_lo, flow.exponent_factor * 0.351) * std::pow(Bd, 0.235) * std::pow(bo, 0.198) *
         std::pow(rho_star, -0.223);
  }
  return Nu * sat.k_liquid / D;
}

auto cooper_boiling_coefficient(double heat_flux, double reduced_pressure, double molar_mass_g, double factor,
                                double exponent_factor) noexcept -> double {
  const double roughness = 0.4; // [µm]
  return factor * 55.0 * std::pow(reduced_pressure, 0.12 - 0.2 * std::log10(roughness)) *
         std::pow(-std::log10(reduced_pressure), -0.55 * exponent_factor) *
         std::pow(heat_flux, exponent_factor * 0.67) / std::sqrt(molar_mass_g);
}

} // namespace orckit::hex::correlations
