#include "orckit/hex/convection_correlations.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <numbers>

namespace orckit::hex::correlations {
namespace {

TEST(LogMeanTemperatureDifference, MatchesDefinition) {
  EXPECT_NEAR(log_mean_temperature_difference(20.0, 10.0), 10.0 / std::log(2.0), 1e-12);
  EXPECT_NEAR(log_mean_temperature_difference(10.0, 20.0), 10.0 / std::log(2.0), 1e-12);
}

TEST(LogMeanTemperatureDifference, EqualEndsReturnCommonValue) {
  EXPECT_DOUBLE_EQ(log_mean_temperature_difference(7.5, 7.5), 7.5);
}

TEST(LogMeanTemperatureDifference, FloorsNonPositiveDifferences) {
  const double value = log_mean_temperature_difference(-3.0, 5.0);
  EXPECT_TRUE(std::isfinite(value));
  EXPECT_GT(value, 0.0);
  EXPECT_LT(value, 5.0);
}

TEST(FinEfficiency, UnfinnedSurfaceIsIdeal) {
  EXPECT_DOUBLE_EQ(surface_efficiency(500.0, std::nullopt), 1.0);
}

TEST(FinEfficiency, DecreasesWithCoefficient) {
  FinGeometry fin;
  fin.conductivity = 200.0;
  fin.thickness = 2e-4;
  fin.tube_radius = 5e-3;
  fin.half_width = 1.25e-2;
  fin.half_length = 1.5e-2;
  fin.finned_area_fraction = 0.9;

  const double low = schmidt_fin_efficiency(20.0, fin);
  const double high = schmidt_fin_efficiency(200.0, fin);
  EXPECT_GT(low, high);
  EXPECT_LT(low, 1.0);
  EXPECT_GT(high, 0.0);

  const double surface = surface_efficiency(200.0, fin);
  EXPECT_NEAR(surface, 1.0 - 0.9 * (1.0 - high), 1e-12);
}

TEST(SinglePhase, GnielinskiLaminarPlateau) {
  EXPECT_DOUBLE_EQ(gnielinski_nusselt(1500.0, 5.0), 3.66);
  EXPECT_GT(gnielinski_nusselt(1e4, 5.0), 3.66);
  EXPECT_GT(gnielinski_nusselt(5e4, 5.0), gnielinski_nusselt(1e4, 5.0));
}

TEST(SinglePhase, GnielinskiShaDevelopingFlowExceedsFullyDeveloped) {
  EXPECT_GT(gnielinski_sha_nusselt(1500.0, 5.0, 0.01, 0.5), 4.364);
}

TEST(SinglePhase, NusseltFactorScalesLinearly) {
  SinglePhaseFlow flow{2000.0, 4.0, 1.0, 1.0};
  const double angle = 30.0 * std::numbers::pi / 180.0;
  const double base = martin_nusselt(flow, angle);
  flow.factor = 2.0;
  EXPECT_NEAR(martin_nusselt(flow, angle), 2.0 * base, 1e-9 * base);
}

TEST(SinglePhase, PlateCorrelationsIncreaseWithReynolds) {
  const double angle = 45.0 * std::numbers::pi / 180.0;
  const SinglePhaseFlow slow{500.0, 5.0, 1.0, 1.0};
  const SinglePhaseFlow fast{5000.0, 5.0, 1.0, 1.0};
  EXPECT_GT(martin_nusselt(fast, angle), martin_nusselt(slow, angle));
  EXPECT_GT(wanniarachchi_nusselt(fast, angle), wanniarachchi_nusselt(slow, angle));
  EXPECT_GT(thonon_nusselt(fast, angle), thonon_nusselt(slow, angle));
}

TEST(TwoPhase, EquivalentMassFluxLimits) {
  SaturatedProperties sat;
  sat.rho_liquid = 1200.0;
  sat.rho_vapor = 12.0;
  EXPECT_DOUBLE_EQ(equivalent_mass_flux(50.0, 0.0, sat), 50.0);
  EXPECT_NEAR(equivalent_mass_flux(50.0, 1.0, sat), 50.0 * 10.0, 1e-9);
}

TEST(TwoPhase, CooperIncreasesWithHeatFlux) {
  const double low = cooper_boiling_coefficient(5e3, 0.1, 134.05, 1.0, 1.0);
  const double high = cooper_boiling_coefficient(2e4, 0.1, 134.05, 1.0, 1.0);
  EXPECT_GT(low, 0.0);
  EXPECT_NEAR(high / low, std::pow(4.0, 0.67), 1e-9);
}

TEST(TwoPhase, CondensationCoefficientsArePositive) {
  SaturatedProperties sat;
  sat.rho_liquid = 1200.0;
  sat.rho_vapor = 20.0;
  sat.mu_liquid = 3e-4;
  sat.mu_vapor = 1.2e-5;
  sat.k_liquid = 0.08;
  sat.prandtl_liquid = 5.0;
  sat.latent_heat = 1.7e5;

  CondensationFlow flow;
  flow.mass_flux = 30.0;
  flow.quality = 0.5;
  flow.hydraulic_diameter = 3.5e-3;
  flow.saturation_temperature = 330.0;
  flow.wall_temperature = 320.0;

  PlateGeometry plate;
  plate.chevron_angle = 30.0 * std::numbers::pi / 180.0;
  plate.corrugation_pitch = 7e-3;
  plate.enlargement_factor = 1.2;
  plate.plate_length = 0.5;

  EXPECT_GT(han_condensation_coefficient(flow, sat, plate), 0.0);
  EXPECT_GT(longo_condensation_coefficient(flow, sat, plate), 0.0);
  EXPECT_GT(cavallini_condensation_coefficient(flow, sat), 0.0);
  EXPECT_GT(shah_condensation_coefficient(flow, sat, 0.1), 0.0);
}

} // namespace
} // namespace orckit::hex::correlations
