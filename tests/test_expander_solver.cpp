#include "orckit/expander/expander_solver.hpp"
#include "orckit/thermophysics/fluid_library.hpp"
#include "test_fluids.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace orckit::expander {
namespace {

using thermophysics::Stream;
using thermophysics::SupplyState;

constexpr double swept_volume = 1.2799e-5;
constexpr double internal_volume = 1.492257e-3;
constexpr double exhaust_pressure = 2.5e5;
constexpr double ambient_temperature = 298.15;

class ExpanderSolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto oracle = thermophysics::create_property_oracle(test_support::fluids_with_thermal_oil());
    ASSERT_TRUE(oracle.has_value());
    oracle_ = std::move(*oracle);
  }

  [[nodiscard]] auto config_for(ExpanderModel model) const -> ExpanderConfig {
    ExpanderConfig config;
    config.model = std::move(model);
    config.swept_volume = swept_volume;
    config.internal_volume = internal_volume;
    return config;
  }

  [[nodiscard]] auto solve(const ExpanderConfig& config, const Stream& supply,
                           double P_ex = exhaust_pressure) const -> ExpanderResult {
    const ExpanderSolver solver(*oracle_, config);
    auto result = solver.solve(supply, P_ex, ambient_temperature);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().full_message());
    return result.value_or(ExpanderResult{});
  }

  [[nodiscard]] auto supply_density() const -> double {
    auto rho = oracle_->state("R245fa", thermophysics::Property::Density, thermophysics::Property::Pressure, 20e5,
                              thermophysics::Property::Temperature, 413.15);
    EXPECT_TRUE(rho.has_value());
    return rho.value_or(0.0);
  }

  // Superheated vapor supply
  const Stream supply_{"R245fa", 20e5, SupplyState::temperature(413.15), 0.05};

  std::unique_ptr<thermophysics::PropertyOracle> oracle_;
};

TEST_F(ExpanderSolverTest, ConstantEfficiencyScalesIsentropicWork) {
  const auto result = solve(config_for(ConstantEfficiencyModel{0.7, 1.2, 0.0}), supply_);

  EXPECT_EQ(result.flag, ExpanderFlag::Converged);
  EXPECT_EQ(result.model, "CstEff");
  EXPECT_LT(result.h_ex_s, result.h_su);
  EXPECT_NEAR(result.power, 0.7 * result.isentropic_power, 1e-9 * result.isentropic_power);
  EXPECT_NEAR(result.h_ex, result.h_su - result.power / 0.05, 1e-6);
  EXPECT_NEAR(result.speed, 60.0 * 0.05 / (swept_volume * 1.2 * supply_density()), 1e-6);
  EXPECT_DOUBLE_EQ(result.filling_factor, 1.2);
  EXPECT_TRUE(std::isnan(result.wall_temperature));
  EXPECT_GT(result.T_ex, 0.0);
  EXPECT_LT(result.T_ex, result.T_su);
  EXPECT_GT(result.mass, 0.0);
  EXPECT_DOUBLE_EQ(result.ts_temperature[0], result.T_su);
  EXPECT_DOUBLE_EQ(result.ts_temperature[1], result.T_ex);
}

TEST_F(ExpanderSolverTest, AmbientLossLowersExhaustEnthalpy) {
  const auto adiabatic = solve(config_for(ConstantEfficiencyModel{0.7, 1.0, 0.0}), supply_);
  const auto cooled = solve(config_for(ConstantEfficiencyModel{0.7, 1.0, 2.0}), supply_);

  EXPECT_NEAR(cooled.ambient_loss, 2.0 * (413.15 - ambient_temperature), 1e-6);
  EXPECT_NEAR(adiabatic.h_ex - cooled.h_ex, cooled.ambient_loss / 0.05, 1e-6);
  EXPECT_DOUBLE_EQ(adiabatic.power, cooled.power);
}

TEST_F(ExpanderSolverTest, ReversedPressureRatioFallsBackToIsentropic) {
  const auto result = solve(config_for(ConstantEfficiencyModel{0.7, 1.2, 1.0}), supply_, 25e5);

  EXPECT_EQ(result.flag, ExpanderFlag::NonPositivePressureRatio);
  EXPECT_EQ(result.flag_value(), -2);
  EXPECT_DOUBLE_EQ(result.h_ex, result.h_ex_s);
  EXPECT_DOUBLE_EQ(result.power, result.isentropic_power);
  EXPECT_DOUBLE_EQ(result.isentropic_efficiency, 1.0);
  EXPECT_DOUBLE_EQ(result.filling_factor, 1.0);
  EXPECT_DOUBLE_EQ(result.ambient_loss, 0.0);
  EXPECT_TRUE(std::isnan(result.wall_temperature));
}

TEST_F(ExpanderSolverTest, ZeroMassFlowFallsBack) {
  Stream idle = supply_;
  idle.mass_flow = 0.0;
  const auto result = solve(config_for(ConstantEfficiencyModel{}), idle);
  EXPECT_EQ(result.flag, ExpanderFlag::NonPositivePressureRatio);
  EXPECT_DOUBLE_EQ(result.power, 0.0);
  EXPECT_DOUBLE_EQ(result.speed, 0.0);
}

TEST_F(ExpanderSolverTest, PolynomialWithoutSpeedTermsIsDirect) {
  PolynomialEfficiencyModel model;
  model.efficiency_coefficients = core::RegressionCoefficients::Zero(6);
  model.efficiency_coefficients(0) = 0.65;
  model.filling_factor_coefficients = core::RegressionCoefficients::Zero(6);
  model.filling_factor_coefficients(0) = 1.1;

  const auto result = solve(config_for(model), supply_);
  EXPECT_EQ(result.flag, ExpanderFlag::Converged);
  EXPECT_EQ(result.model, "PolEff");
  EXPECT_NEAR(result.isentropic_efficiency, 0.65, 1e-12);
  EXPECT_NEAR(result.filling_factor, 1.1, 1e-12);
  EXPECT_NEAR(result.speed, 60.0 * 0.05 / (swept_volume * 1.1 * supply_density()), 1e-6);
}

TEST_F(ExpanderSolverTest, PolynomialSolvesSpeedDependentFillingFactor) {
  PolynomialEfficiencyModel model;
  model.efficiency_coefficients = core::RegressionCoefficients::Zero(6);
  model.efficiency_coefficients(0) = 0.6;
  model.filling_factor_coefficients = core::RegressionCoefficients::Zero(10);
  model.filling_factor_coefficients(0) = 0.9;
  model.filling_factor_coefficients(6) = 1e-5;

  const auto result = solve(config_for(model), supply_);
  ASSERT_EQ(result.flag, ExpanderFlag::Converged);

  const double nominal_speed = 60.0 * 0.05 / (swept_volume * supply_density());
  EXPECT_NEAR(result.filling_factor, 0.9 + 1e-5 * result.speed, 1e-9);
  EXPECT_NEAR(result.speed * result.filling_factor, nominal_speed, 1e-4 * nominal_speed);
  EXPECT_LT(std::abs(result.residual), 1e-5);
}

[[nodiscard]] auto scroll_model() -> SemiEmpiricalModel {
  SemiEmpiricalModel model;
  model.built_in_volume_ratio = 2.19;
  model.leakage_area = 1.3447e-6;
  model.supply_diameter = 0.0032276;
  model.proportional_loss = 1.2537e-5;
  model.loss_torque = 7.9529e-7;
  model.supply_conductance = 50.0336;
  model.exhaust_conductance = 94.017;
  model.ambient_conductance = 0.674;
  model.nominal_mass_flow = 0.068378;
  return model;
}

void expect_wall_balance_closed(const ExpanderResult& result, double mass_flow) {
  ASSERT_TRUE(result.internal.has_value());
  const auto& internal = *result.internal;
  const double heat_in = internal.supply_heat + internal.loss_power;
  const double heat_out = internal.exhaust_heat + internal.ambient_loss;
  EXPECT_GT(heat_in, 0.0);
  EXPECT_NEAR(heat_in - heat_out, 0.0, 1e-4 * heat_in);
  EXPECT_LT(std::abs(result.residual), 1e-4);
  EXPECT_NEAR(internal.internal_flow + internal.leakage_flow, mass_flow, 1e-12);
  EXPECT_GE(internal.leakage_flow, 0.0);
  EXPECT_LE(internal.leakage_flow, mass_flow);
}

TEST_F(ExpanderSolverTest, SemiEmpiricalClosesWallEnergyBalance) {
  const auto result = solve(config_for(scroll_model()), supply_);
  EXPECT_EQ(result.model, "SemiEmp");
  ASSERT_EQ(result.flag, ExpanderFlag::Converged);

  expect_wall_balance_closed(result, 0.05);
  EXPECT_GT(result.wall_temperature, ambient_temperature);
  EXPECT_LT(result.wall_temperature, result.T_su);
  EXPECT_GT(result.power, 0.0);
  EXPECT_LT(result.power, result.isentropic_power);
  EXPECT_GT(result.h_ex, result.h_ex_s);
  EXPECT_NEAR(result.filling_factor * result.speed * swept_volume * supply_density() / 60.0, 0.05, 1e-9);
}

TEST_F(ExpanderSolverTest, SemiEmpiricalSupercriticalR134aScroll) {
  const double P_su = 50.753498330038136e5;
  const double P_ex = 2.471310061849047e5;
  const double M_dot = 0.15982;
  const Stream supply{"R134a", P_su, SupplyState::temperature(473.15), M_dot};

  SemiEmpiricalModel model;
  model.built_in_volume_ratio = 2.19;
  model.leakage_area = 1.344675598144531e-06;
  model.supply_diameter = 0.003227564086914;
  model.proportional_loss = 1.253662109374984e-05;
  model.constant_loss = 0.0;
  model.loss_torque = 7.952880859375330e-07;
  model.supply_conductance = 50.0335693359375;
  model.exhaust_conductance = 94.01702880859375;
  model.ambient_conductance = 0.674005126953125;
  model.nominal_mass_flow = 0.068378356905196;

  ExpanderConfig config;
  config.model = model;
  config.swept_volume = 1.279908675799087e-05;
  config.internal_volume = 1.492257e-3;

  const auto result = solve(config, supply, P_ex);
  ASSERT_EQ(result.flag, ExpanderFlag::Converged);
  EXPECT_EQ(result.flag_value(), 1);

  expect_wall_balance_closed(result, M_dot);
  EXPECT_GT(result.power, 0.0);
  EXPECT_LT(result.power, result.isentropic_power);
  EXPECT_GT(result.speed, 0.0);
  EXPECT_GT(result.wall_temperature, ambient_temperature);
  EXPECT_LT(result.wall_temperature, 473.15);
  EXPECT_GT(result.isentropic_efficiency, 0.0);
  EXPECT_LT(result.isentropic_efficiency, 1.0);
}

TEST_F(ExpanderSolverTest, SemiEmpiricalWithoutLeakagePassesAllFlowThroughChambers) {
  auto model = scroll_model();
  model.leakage_area = 0.0;

  const auto result = solve(config_for(model), supply_);
  ASSERT_EQ(result.flag, ExpanderFlag::Converged);
  ASSERT_TRUE(result.internal.has_value());
  EXPECT_EQ(result.internal->leakage_flow, 0.0);
  EXPECT_EQ(result.internal->internal_flow, 0.05);

  // Leakage bypasses the chambers and lowers the shaft speed
  const auto leaky = solve(config_for(scroll_model()), supply_);
  ASSERT_EQ(leaky.flag, ExpanderFlag::Converged);
  EXPECT_LT(leaky.speed, result.speed);
}

TEST_F(ExpanderSolverTest, RepeatedSolvesAreIdentical) {
  const auto config = config_for(scroll_model());
  const auto first = solve(config, supply_);
  const auto second = solve(config, supply_);

  EXPECT_EQ(first.flag, second.flag);
  EXPECT_EQ(first.iterations, second.iterations);
  EXPECT_DOUBLE_EQ(first.wall_temperature, second.wall_temperature);
  EXPECT_DOUBLE_EQ(first.power, second.power);
  EXPECT_DOUBLE_EQ(first.h_ex, second.h_ex);
  EXPECT_DOUBLE_EQ(first.speed, second.speed);
  EXPECT_DOUBLE_EQ(first.mass, second.mass);
}

TEST_F(ExpanderSolverTest, EqualPressuresFallBackBeforeAnyModel) {
  const auto result = solve(config_for(scroll_model()), supply_, supply_.pressure);

  EXPECT_EQ(result.flag, ExpanderFlag::NonPositivePressureRatio);
  EXPECT_NEAR(result.h_ex_s, result.h_su, 1e-6 * std::abs(result.h_su));
  EXPECT_DOUBLE_EQ(result.h_ex, result.h_ex_s);
  EXPECT_FALSE(result.internal.has_value());
  EXPECT_TRUE(std::isnan(result.wall_temperature));
}

TEST_F(ExpanderSolverTest, ZeroExhaustPressureFallsBackWithoutError) {
  for (const ExpanderConfig& config : {config_for(ConstantEfficiencyModel{0.7, 1.0, 0.0}), config_for(scroll_model())}) {
    const ExpanderSolver solver(*oracle_, config);
    auto result = solver.solve(supply_, 0.0, ambient_temperature);
    ASSERT_TRUE(result.has_value()) << result.error().full_message();
    EXPECT_EQ(result->flag, ExpanderFlag::NonPositivePressureRatio);
    EXPECT_DOUBLE_EQ(result->T_su, 413.15);
    EXPECT_TRUE(std::isnan(result->T_ex));
    EXPECT_DOUBLE_EQ(result->isentropic_efficiency, 1.0);
    EXPECT_DOUBLE_EQ(result->ambient_loss, 0.0);
    EXPECT_TRUE(std::isnan(result->wall_temperature));
  }
}

TEST(ValidateExpanderConfig, RejectsInvalidMachines) {
  ExpanderConfig config;
  config.model = ConstantEfficiencyModel{0.7, 1.0, 0.0};
  EXPECT_FALSE(validate_expander_config(config).has_value());

  config.swept_volume = 1e-5;
  EXPECT_TRUE(validate_expander_config(config).has_value());

  config.model = ConstantEfficiencyModel{0.0, 1.0, 0.0};
  EXPECT_FALSE(validate_expander_config(config).has_value());

  PolynomialEfficiencyModel polynomial;
  polynomial.efficiency_coefficients = core::RegressionCoefficients::Zero(7);
  polynomial.filling_factor_coefficients = core::RegressionCoefficients::Zero(6);
  config.model = polynomial;
  EXPECT_FALSE(validate_expander_config(config).has_value());

  config.model = ConstantEfficiencyModel{};
  config.h_min = 4e5;
  config.h_max = 3e5;
  EXPECT_FALSE(validate_expander_config(config).has_value());
}

TEST(EvaluateRegression, UsesQuadraticFeatures) {
  core::RegressionCoefficients c(6);
  c << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
  const double rp = 2.0;
  const double rho = 0.5;
  const double expected = 1.0 + 2.0 * rp + 3.0 * rho + 4.0 * rp * rp + 5.0 * rp * rho + 6.0 * rho * rho;
  EXPECT_DOUBLE_EQ(evaluate_regression(c, rp, rho, 1000.0), expected);
}

TEST(EvaluateRegression, AddsSpeedFeatures) {
  core::RegressionCoefficients c = core::RegressionCoefficients::Zero(10);
  c(6) = 1.0;
  c(7) = 2.0;
  c(8) = 3.0;
  c(9) = 4.0;
  const double N = 10.0;
  EXPECT_DOUBLE_EQ(evaluate_regression(c, 2.0, 0.5, N), N + 2.0 * N * N + 3.0 * N * 2.0 + 4.0 * N * 0.5);
}

TEST(EvaluateRegression, UnsupportedSizeIsNaN) {
  EXPECT_TRUE(std::isnan(evaluate_regression(core::RegressionCoefficients::Zero(4), 2.0, 1.0, 0.0)));
}

TEST(GammaRegression, DefaultsToConstant) {
  const GammaRegression gamma;
  EXPECT_DOUBLE_EQ(gamma.evaluate(10.0, 3.0), 1.1);

  core::PolynomialCoefficients c(2, 2);
  c << 1.0, 0.1, 0.01, 0.001;
  const GammaRegression fitted(c);
  EXPECT_NEAR(fitted.evaluate(2.0, 3.0), 1.0 + 0.1 * 3.0 + 0.01 * 2.0 + 0.001 * 6.0, 1e-12);
}

} // namespace
} // namespace orckit::expander
