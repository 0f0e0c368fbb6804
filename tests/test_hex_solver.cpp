#include "orckit/hex/heat_transfer_zone_evaluator.hpp"
#include "orckit/hex/hex_solver.hpp"
#include "orckit/thermophysics/fluid_library.hpp"
#include "test_fluids.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <numbers>
#include <utility>

namespace orckit::hex {
namespace {

using thermophysics::Stream;
using thermophysics::SupplyState;

class HexSolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto oracle = thermophysics::create_property_oracle(test_support::fluids_with_thermal_oil());
    ASSERT_TRUE(oracle.has_value());
    oracle_ = std::move(*oracle);
  }

  [[nodiscard]] auto solve(const HexConfig& config, const Stream& hot, const Stream& cold) const -> HexResult {
    const HexSolver solver(*oracle_, config);
    auto result = solver.solve(hot, cold);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().full_message());
    return result.value_or(HexResult{});
  }

  static auto base_config(HexModel model) -> HexConfig {
    HexConfig config;
    config.model = std::move(model);
    config.hot.volume = 0.009;
    config.cold.volume = 0.009;
    return config;
  }

  // Brazed plate evaporator of the thermal oil loop: 100 plates, 9.8 m² effective area.
  // A smaller area keeps the plate geometry and only shrinks the matched area.
  static auto plate_config(TwoPhaseCorrelation boiling, double area = 9.8) -> HexConfig {
    CorrelationModel model;
    model.hot.single_phase = SinglePhaseCorrelation::Martin;
    model.hot.two_phase = TwoPhaseCorrelation::LongoCondensation;
    model.hot.factor_single_phase = 0.268088007690337;
    model.cold.single_phase = SinglePhaseCorrelation::Martin;
    model.cold.two_phase = boiling;
    model.cold.factor_single_phase = 0.268088007690337;

    const double plate_length = 0.519 - 0.06;
    const double plate_width = 0.191;
    const double channel_gap = 0.0022 - 0.0004;
    const double enlargement = (9.8 / 98.0) / (plate_width * plate_length);

    auto config = base_config(model);
    config.hot.area = area;
    config.cold.area = area;
    config.hot.n_canals = 49.0;
    config.cold.n_canals = 50.0;
    for (auto* side : {&config.hot, &config.cold}) {
      side->cross_section = plate_width * channel_gap;
      side->hydraulic_diameter = 2.0 * channel_gap / enlargement;
    }
    config.plate.chevron_angle = 30.0 * std::numbers::pi / 180.0;
    config.plate.corrugation_pitch = 0.007213;
    config.plate.enlargement_factor = enlargement;
    config.plate.plate_length = plate_length;
    return config;
  }

  [[nodiscard]] auto supply_enthalpies() const -> std::pair<double, double> {
    auto hot = thermophysics::resolve_supply(*oracle_, oil_);
    auto cold = thermophysics::resolve_supply(*oracle_, refrigerant_);
    EXPECT_TRUE(hot && cold);
    return {hot ? hot->enthalpy : nan, cold ? cold->enthalpy : nan};
  }

  const Stream oil_{"PiroblocBasic", 2e5, SupplyState::temperature(363.15), 0.09};
  const Stream refrigerant_{"R245fa", 4.188e5, SupplyState::temperature(293.15), 0.0252};

  std::unique_ptr<thermophysics::PropertyOracle> oracle_;
};

void expect_energy_balance(const HexResult& result, double hot_flow, double cold_flow, double h_hot_su,
                           double h_cold_su) {
  EXPECT_NEAR(hot_flow * (h_hot_su - result.h_hot_ex), result.duty, 1e-6 * std::max(1.0, result.duty));
  EXPECT_NEAR(cold_flow * (result.h_cold_ex - h_cold_su), result.duty, 1e-6 * std::max(1.0, result.duty));
}

void expect_zone_duties_add_up(const HexResult& result) {
  ASSERT_FALSE(result.zones.empty());
  double total = 0.0;
  for (const auto& zone : result.zones) {
    EXPECT_GE(zone.duty(), 0.0);
    total += zone.duty();
  }
  EXPECT_NEAR(total, result.duty, 1e-6 * std::max(1.0, result.duty));
}

TEST_F(HexSolverTest, ConstantEffectivenessScalesMaximumDuty) {
  const auto result = solve(base_config(ConstantEffectivenessModel{0.8}), oil_, refrigerant_);

  EXPECT_EQ(result.flag, HexFlag::Converged);
  EXPECT_EQ(result.model, "CstEff");
  EXPECT_FALSE(result.reversed);
  EXPECT_GT(result.duty_max, 0.0);
  EXPECT_NEAR(result.duty, 0.8 * result.duty_max, 1e-9 * result.duty_max);
  EXPECT_NEAR(result.effectiveness, 0.8, 1e-12);
  EXPECT_GT(result.pinch, 0.0);

  auto supply_hot = thermophysics::resolve_supply(*oracle_, oil_);
  auto supply_cold = thermophysics::resolve_supply(*oracle_, refrigerant_);
  ASSERT_TRUE(supply_hot && supply_cold);
  expect_energy_balance(result, 0.09, 0.0252, supply_hot->enthalpy, supply_cold->enthalpy);

  EXPECT_EQ(result.h_hot.size(), result.zones.size() + 1);
  EXPECT_DOUBLE_EQ(result.duty_fraction.front(), 0.0);
  EXPECT_DOUBLE_EQ(result.duty_fraction.back(), 1.0);
  EXPECT_GT(result.mass_cold, 0.0);
}

TEST_F(HexSolverTest, TemperatureProfilesNeverCross) {
  const auto result = solve(base_config(ConstantEffectivenessModel{1.0}), oil_, refrigerant_);
  ASSERT_EQ(result.T_hot.size(), result.T_cold.size());
  for (std::size_t i = 0; i < result.T_hot.size(); ++i) {
    EXPECT_GE(result.T_hot[i] - result.T_cold[i], -1e-2) << "boundary " << i;
  }
}

TEST_F(HexSolverTest, PolynomialEffectivenessUsesFlowRatios) {
  PolynomialEffectivenessModel model;
  model.coefficients = core::RegressionCoefficients::Zero(6);
  model.coefficients << 0.5, 0.1, 0.1, 0.0, 0.0, 0.0;
  model.nominal_hot_flow = 0.09;
  model.nominal_cold_flow = 0.0252;

  const auto result = solve(base_config(model), oil_, refrigerant_);
  EXPECT_EQ(result.model, "PolEff");
  EXPECT_NEAR(result.effectiveness, 0.7, 1e-9);
}

TEST_F(HexSolverTest, ConstantPinchReachesTarget) {
  const auto result = solve(base_config(ConstantPinchModel{5.0}), oil_, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::Converged);
  EXPECT_NEAR(result.pinch, 5.0, 1e-3);
  EXPECT_LT(result.duty, result.duty_max);
}

TEST_F(HexSolverTest, ConstantPinchAboveSupplyDifferenceTransfersNothing) {
  const auto result = solve(base_config(ConstantPinchModel{80.0}), oil_, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::DutyLimited);
  EXPECT_DOUBLE_EQ(result.duty, 0.0);
}

TEST_F(HexSolverTest, MissingFlowIsPassthrough) {
  Stream stagnant = refrigerant_;
  stagnant.mass_flow = 0.0;
  const auto result = solve(base_config(ConstantEffectivenessModel{0.8}), oil_, stagnant);

  EXPECT_EQ(result.flag, HexFlag::NoFlow);
  EXPECT_EQ(result.flag_value(), -3);
  EXPECT_DOUBLE_EQ(result.duty, 0.0);
  EXPECT_DOUBLE_EQ(result.T_hot_ex, 363.15);
  EXPECT_DOUBLE_EQ(result.T_cold_ex, 293.15);
}

TEST_F(HexSolverTest, NearlyEqualSupplyTemperaturesAreDegenerate) {
  Stream lukewarm = oil_;
  lukewarm.supply = SupplyState::temperature(293.155);
  const auto result = solve(base_config(ConstantPinchModel{5.0}), lukewarm, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::Degenerate);
  EXPECT_DOUBLE_EQ(result.duty, 0.0);
}

TEST_F(HexSolverTest, EqualSupplyTemperaturesAreInfeasible) {
  Stream lukewarm = oil_;
  lukewarm.supply = SupplyState::temperature(293.15);
  const auto result = solve(base_config(ConstantPinchModel{5.0}), lukewarm, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::InfeasiblePinch);
  EXPECT_DOUBLE_EQ(result.duty, 0.0);
}

TEST_F(HexSolverTest, UnorderedStreamsWithoutReversalAreInfeasible) {
  Stream cool_oil = oil_;
  cool_oil.supply = SupplyState::temperature(283.15);
  const auto result = solve(base_config(ConstantPinchModel{5.0}), cool_oil, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::InfeasiblePinch);
  EXPECT_EQ(result.flag_value(), -2);
  EXPECT_DOUBLE_EQ(result.duty, 0.0);
}

TEST_F(HexSolverTest, EffectivenessModelsFollowSwappedStreams) {
  const auto config = base_config(ConstantEffectivenessModel{0.8});
  const auto normal = solve(config, oil_, refrigerant_);
  const auto swapped = solve(config, refrigerant_, oil_);

  EXPECT_TRUE(swapped.reversed);
  EXPECT_NEAR(swapped.duty, normal.duty, 1e-6 * normal.duty);
  // Labels follow the caller: the "hot" argument is the refrigerant here
  EXPECT_NEAR(swapped.h_hot_ex, normal.h_cold_ex, 1e-6);
  EXPECT_NEAR(swapped.h_cold_ex, normal.h_hot_ex, 1e-6);
  EXPECT_NEAR(swapped.T_hot_ex, normal.T_cold_ex, 1e-6);
  EXPECT_NEAR(swapped.mass_hot, normal.mass_cold, 1e-9);
}

TEST_F(HexSolverTest, OversizedAreaIsDutyLimited) {
  ConstantCoefficientModel model;
  model.hot = {1000.0, 1000.0, 1000.0};
  model.cold = {1000.0, 3000.0, 500.0};
  auto config = base_config(model);
  config.hot.area = 50.0;
  config.cold.area = 50.0;

  const auto result = solve(config, oil_, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::DutyLimited);
  EXPECT_EQ(result.flag_value(), 2);
  EXPECT_NEAR(result.duty, result.duty_max, 1e-9 * result.duty_max);
  EXPECT_GT(result.residual, 0.0);

  const auto [h_hot_su, h_cold_su] = supply_enthalpies();
  expect_energy_balance(result, 0.09, 0.0252, h_hot_su, h_cold_su);
  expect_zone_duties_add_up(result);
}

TEST_F(HexSolverTest, AreaMatchingConsumesAvailableArea) {
  ConstantCoefficientModel model;
  model.hot = {1000.0, 1000.0, 1000.0};
  model.cold = {1000.0, 3000.0, 500.0};
  auto config = base_config(model);
  config.hot.area = 0.3;
  config.cold.area = 0.3;

  const auto result = solve(config, oil_, refrigerant_);
  EXPECT_EQ(result.flag, HexFlag::Converged);
  EXPECT_LT(result.duty, result.duty_max);
  EXPECT_LT(std::abs(result.residual), 1e-4);

  double area = 0.0;
  for (const auto& zone : result.zones) {
    area += zone.area_hot;
    EXPECT_GT(zone.conductance, 0.0);
  }
  EXPECT_NEAR(area, 0.3, 1e-3);
  EXPECT_DOUBLE_EQ(result.h_conv_cold_mean.liquid, 1000.0);
  EXPECT_TRUE(std::isnan(result.h_conv_hot_mean.vapor));

  const auto [h_hot_su, h_cold_su] = supply_enthalpies();
  expect_energy_balance(result, 0.09, 0.0252, h_hot_su, h_cold_su);
  expect_zone_duties_add_up(result);
}

TEST_F(HexSolverTest, RepeatedSolvesAreIdentical) {
  ConstantCoefficientModel model;
  model.hot = {1000.0, 1000.0, 1000.0};
  model.cold = {1000.0, 3000.0, 500.0};
  auto config = base_config(model);
  config.hot.area = 0.3;
  config.cold.area = 0.3;

  const auto first = solve(config, oil_, refrigerant_);
  const auto second = solve(config, oil_, refrigerant_);

  EXPECT_EQ(first.flag, second.flag);
  EXPECT_EQ(first.iterations, second.iterations);
  EXPECT_DOUBLE_EQ(first.duty, second.duty);
  EXPECT_DOUBLE_EQ(first.h_hot_ex, second.h_hot_ex);
  EXPECT_DOUBLE_EQ(first.h_cold_ex, second.h_cold_ex);
  EXPECT_DOUBLE_EQ(first.mass_cold, second.mass_cold);
  ASSERT_EQ(first.T_cold.size(), second.T_cold.size());
  for (std::size_t i = 0; i < first.T_cold.size(); ++i) {
    EXPECT_DOUBLE_EQ(first.T_hot[i], second.T_hot[i]);
    EXPECT_DOUBLE_EQ(first.T_cold[i], second.T_cold[i]);
  }
}

TEST_F(HexSolverTest, LargerAreaTransfersMore) {
  ConstantCoefficientModel model;
  model.hot = {800.0, 800.0, 800.0};
  model.cold = {900.0, 2500.0, 400.0};

  auto small = base_config(model);
  small.hot.area = small.cold.area = 0.2;
  auto large = base_config(model);
  large.hot.area = large.cold.area = 0.5;

  EXPECT_LT(solve(small, oil_, refrigerant_).duty, solve(large, oil_, refrigerant_).duty);
}

TEST_F(HexSolverTest, CorrelatedPlateExchangerConverges) {
  CorrelationModel model;
  model.hot.single_phase = SinglePhaseCorrelation::Martin;
  model.hot.two_phase = TwoPhaseCorrelation::LongoCondensation;
  model.cold.single_phase = SinglePhaseCorrelation::Martin;
  model.cold.two_phase = TwoPhaseCorrelation::CooperBoiling;

  auto config = base_config(model);
  for (auto* side : {&config.hot, &config.cold}) {
    side->area = 1.0;
    side->hydraulic_diameter = 3.5e-3;
    side->cross_section = 1.6e-4;
    side->n_canals = 10.0;
  }
  config.plate.chevron_angle = 30.0 * std::numbers::pi / 180.0;
  config.plate.corrugation_pitch = 7.2e-3;
  config.plate.enlargement_factor = 1.2;
  config.plate.plate_length = 0.46;

  const auto result = solve(config, oil_, refrigerant_);
  EXPECT_GT(result.flag_value(), 0);
  EXPECT_GT(result.duty, 0.0);
  EXPECT_LE(result.duty, result.duty_max * (1.0 + 1e-9));
  EXPECT_GT(result.h_conv_cold_mean.two_phase, 0.0);
}

TEST_F(HexSolverTest, OilHeatedPlateEvaporator) {
  const auto result = solve(plate_config(TwoPhaseCorrelation::AlmalfiBoiling), oil_, refrigerant_);

  EXPECT_TRUE(result.flag == HexFlag::Converged || result.flag == HexFlag::DutyLimited)
      << "flag " << result.flag_value();
  EXPECT_EQ(result.model, "hConvCor");
  EXPECT_GT(result.duty, 0.0);
  EXPECT_LE(result.duty, result.duty_max * (1.0 + 1e-9));

  const auto [h_hot_su, h_cold_su] = supply_enthalpies();
  auto h_cold_ceiling = oracle_->state("R245fa", thermophysics::Property::Enthalpy, thermophysics::Property::Pressure,
                                       4.188e5, thermophysics::Property::Temperature, 363.15);
  ASSERT_TRUE(h_cold_ceiling.has_value());
  EXPECT_GT(result.h_cold_ex, h_cold_su);
  EXPECT_LE(result.h_cold_ex, *h_cold_ceiling + 1e-6 * std::abs(*h_cold_ceiling));
  EXPECT_LE(result.T_cold_ex, 363.15 + 1e-6);

  expect_energy_balance(result, 0.09, 0.0252, h_hot_su, h_cold_su);
  expect_zone_duties_add_up(result);
  EXPECT_GT(result.h_conv_cold_mean.two_phase, 0.0);
}

TEST_F(HexSolverTest, HanAndAlmalfiBoilingBothMatchArea) {
  for (const auto boiling : {TwoPhaseCorrelation::HanBoiling, TwoPhaseCorrelation::AlmalfiBoiling}) {
    const auto result = solve(plate_config(boiling, 0.6), oil_, refrigerant_);
    EXPECT_GT(result.flag_value(), 0) << "correlation " << static_cast<int>(boiling);
    EXPECT_GT(result.duty, 0.0);
    EXPECT_LE(result.duty, result.duty_max * (1.0 + 1e-9));
    EXPECT_GT(result.h_conv_cold_mean.two_phase, 0.0);
    EXPECT_TRUE(std::isfinite(result.h_conv_cold_mean.two_phase));

    for (const auto& zone : result.zones) {
      if (zone.cold_phase == ZonePhase::TwoPhase) {
        EXPECT_GT(zone.h_conv_cold, 0.0);
        EXPECT_GT(zone.area_hot, 0.0);
      }
    }
    const auto [h_hot_su, h_cold_su] = supply_enthalpies();
    expect_energy_balance(result, 0.09, 0.0252, h_hot_su, h_cold_su);
  }
}

TEST(BoilingClosure, ConvergesOnFluxIndependentCoefficient) {
  const auto closure = close_heat_flux_loop([](double) { return 2500.0; }, 1.0, 1e4, 1e3, 8.0);
  EXPECT_TRUE(closure.converged);
  EXPECT_EQ(closure.iterations, 2);
  EXPECT_DOUBLE_EQ(closure.h_conv, 2500.0);
}

TEST(BoilingClosure, KeepsLastIterateAtIterationCap) {
  // Coefficient jumping between two branches: the boiling number never settles
  auto oscillating = [](double bo) { return bo > 1.0 ? 100.0 : 10000.0; };
  const auto closure = close_heat_flux_loop(oscillating, 1.0, 5000.0, 1e12, 1.0);

  EXPECT_FALSE(closure.converged);
  EXPECT_EQ(closure.iterations, constants::iteration_limits::boiling_number_max);
  EXPECT_GT(closure.relative_change, constants::hex::boiling_number_tolerance);
  EXPECT_DOUBLE_EQ(closure.h_conv, 100.0);
}

TEST(ValidateHexConfig, RejectsOutOfRangeEffectiveness) {
  HexConfig config;
  config.model = ConstantEffectivenessModel{1.5};
  EXPECT_FALSE(validate_hex_config(config).has_value());
}

TEST(ValidateHexConfig, AreaModelsNeedArea) {
  HexConfig config;
  config.model = ConstantCoefficientModel{};
  EXPECT_FALSE(validate_hex_config(config).has_value());
  config.hot.area = config.cold.area = 1.0;
  EXPECT_TRUE(validate_hex_config(config).has_value());
}

TEST(ValidateHexConfig, ColdSideMustBoil) {
  HexConfig config;
  CorrelationModel model;
  model.cold.two_phase = TwoPhaseCorrelation::HanCondensation;
  config.model = model;
  for (auto* side : {&config.hot, &config.cold}) {
    side->area = 1.0;
    side->hydraulic_diameter = 3e-3;
    side->cross_section = 1e-4;
  }
  EXPECT_FALSE(validate_hex_config(config).has_value());
}

TEST(ReversedConfig, SwapsSideAttachedCoefficients) {
  HexConfig config;
  PolynomialEffectivenessModel model;
  model.coefficients = core::RegressionCoefficients::Zero(6);
  model.coefficients << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
  model.nominal_hot_flow = 0.1;
  model.nominal_cold_flow = 0.2;
  config.model = model;
  config.hot.area = 1.0;
  config.cold.area = 2.0;

  const auto reversed = reversed_config(config);
  const auto& swapped = std::get<PolynomialEffectivenessModel>(reversed.model);
  EXPECT_DOUBLE_EQ(swapped.coefficients(1), 3.0);
  EXPECT_DOUBLE_EQ(swapped.coefficients(2), 2.0);
  EXPECT_DOUBLE_EQ(swapped.coefficients(3), 6.0);
  EXPECT_DOUBLE_EQ(swapped.coefficients(5), 4.0);
  EXPECT_DOUBLE_EQ(swapped.nominal_hot_flow, 0.2);
  EXPECT_DOUBLE_EQ(reversed.hot.area, 2.0);
}

} // namespace
} // namespace orckit::hex
