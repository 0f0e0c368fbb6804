#include "orckit/thermophysics/fluid_library.hpp"
#include "orckit/thermophysics/stream.hpp"
#include "test_fluids.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace orckit::thermophysics {
namespace {

class FluidLibraryTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto oracle = create_property_oracle(test_support::fluids_with_thermal_oil());
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message();
    oracle_ = std::move(*oracle);
  }

  [[nodiscard]] auto eval(std::string_view fluid, Property out, Property in1, double v1, Property in2,
                          double v2) const -> double {
    auto value = oracle_->state(fluid, out, in1, v1, in2, v2);
    EXPECT_TRUE(value.has_value()) << (value ? "" : value.error().message());
    return value.value_or(std::numeric_limits<double>::quiet_NaN());
  }

  std::unique_ptr<PropertyOracle> oracle_;
};

TEST_F(FluidLibraryTest, ResolvesCoolPropAndDeclaredFluids) {
  EXPECT_TRUE(oracle_->has_fluid("R245fa"));
  EXPECT_TRUE(oracle_->has_fluid("R134a"));
  EXPECT_TRUE(oracle_->has_fluid("INCOMP::T66"));
  EXPECT_TRUE(oracle_->has_fluid("PiroblocBasic"));
  EXPECT_TRUE(oracle_->is_incompressible("PiroblocBasic"));
  EXPECT_TRUE(oracle_->is_incompressible("INCOMP::T66"));
  EXPECT_FALSE(oracle_->is_incompressible("R245fa"));
  EXPECT_FALSE(oracle_->has_fluid("NotARefrigerant"));
  EXPECT_FALSE(oracle_->has_fluid("INCOMP::NotAnOil"));

  const auto names = oracle_->fluid_names();
  EXPECT_NE(std::ranges::find(names, "R245fa"), names.end());
  EXPECT_NE(std::ranges::find(names, "PiroblocBasic"), names.end());
}

TEST_F(FluidLibraryTest, UnknownFluidIsUndefined) {
  auto value =
      oracle_->state("NotARefrigerant", Property::Enthalpy, Property::Pressure, 1e5, Property::Temperature, 300.0);
  EXPECT_FALSE(value.has_value());
}

TEST_F(FluidLibraryTest, ReportsCriticalConstants) {
  EXPECT_NEAR(eval("R245fa", Property::CriticalPressure, Property::Pressure, 0.0, Property::Quality, 1.0), 3.651e6,
              1e3);
  EXPECT_NEAR(eval("R134a", Property::CriticalPressure, Property::Pressure, 0.0, Property::Quality, 1.0), 4.0593e6,
              1e3);
  EXPECT_NEAR(eval("R245fa", Property::MolarMass, Property::Pressure, 0.0, Property::Quality, 1.0), 0.134048, 1e-5);
}

TEST_F(FluidLibraryTest, EnthalpyTemperatureRoundTrip) {
  const double P = 4e5;
  for (double T : {290.0, 320.0, 360.0, 420.0}) {
    const double h = eval("R245fa", Property::Enthalpy, Property::Pressure, P, Property::Temperature, T);
    const double T_back = eval("R245fa", Property::Temperature, Property::Pressure, P, Property::Enthalpy, h);
    EXPECT_NEAR(T_back, T, 1e-6) << "T = " << T;
  }
}

TEST_F(FluidLibraryTest, SaturationDomeIsConsistent) {
  const double P = 4e5;
  const double h_l = eval("R245fa", Property::Enthalpy, Property::Pressure, P, Property::Quality, 0.0);
  const double h_v = eval("R245fa", Property::Enthalpy, Property::Pressure, P, Property::Quality, 1.0);
  ASSERT_GT(h_v, h_l);

  const double h_mid = 0.5 * (h_l + h_v);
  EXPECT_NEAR(eval("R245fa", Property::Quality, Property::Pressure, P, Property::Enthalpy, h_mid), 0.5, 1e-9);

  // Saturation temperature is flat across the dome
  const double T_l = eval("R245fa", Property::Temperature, Property::Pressure, P, Property::Quality, 0.0);
  const double T_mid = eval("R245fa", Property::Temperature, Property::Pressure, P, Property::Enthalpy, h_mid);
  EXPECT_NEAR(T_mid, T_l, 1e-3);
  EXPECT_NEAR(T_l, 328.0, 5.0);

  const double rho_l = eval("R245fa", Property::Density, Property::Pressure, P, Property::Quality, 0.0);
  const double rho_v = eval("R245fa", Property::Density, Property::Pressure, P, Property::Quality, 1.0);
  EXPECT_GT(rho_l, 10.0 * rho_v);
}

TEST_F(FluidLibraryTest, QualityExtrapolatesOutsideTheDome) {
  const double P = 4e5;
  const double h_l = eval("R245fa", Property::Enthalpy, Property::Pressure, P, Property::Quality, 0.0);
  const double h_v = eval("R245fa", Property::Enthalpy, Property::Pressure, P, Property::Quality, 1.0);

  const double h_sub = h_l - 0.1 * (h_v - h_l);
  const double h_sup = h_v + 0.2 * (h_v - h_l);
  EXPECT_NEAR(eval("R245fa", Property::Quality, Property::Pressure, P, Property::Enthalpy, h_sub), -0.1, 1e-9);
  EXPECT_NEAR(eval("R245fa", Property::Quality, Property::Enthalpy, h_sup, Property::Pressure, P), 1.2, 1e-9);

  // Pairs without (P, H) go through CoolProp for both
  const double T_sub = eval("R245fa", Property::Temperature, Property::Pressure, P, Property::Enthalpy, h_sub);
  EXPECT_NEAR(eval("R245fa", Property::Quality, Property::Pressure, P, Property::Temperature, T_sub), -0.1, 1e-6);
}

TEST_F(FluidLibraryTest, EnthalpyIncreasesWithTemperature) {
  double previous = -std::numeric_limits<double>::infinity();
  for (double T = 280.0; T < 450.0; T += 10.0) {
    const double h = eval("R245fa", Property::Enthalpy, Property::Pressure, 4e5, Property::Temperature, T);
    EXPECT_GT(h, previous);
    previous = h;
  }
}

TEST_F(FluidLibraryTest, QualityIsUndefinedAboveCriticalPressure) {
  const double P_crit = eval("R245fa", Property::CriticalPressure, Property::Pressure, 0.0, Property::Quality, 1.0);
  const double h = eval("R245fa", Property::Enthalpy, Property::Pressure, 1.2 * P_crit, Property::Temperature, 450.0);
  EXPECT_FALSE(oracle_->state("R245fa", Property::Quality, Property::Pressure, 1.2 * P_crit, Property::Enthalpy, h)
                   .has_value());
  EXPECT_FALSE(oracle_->state("R245fa", Property::Enthalpy, Property::Pressure, 1.2 * P_crit, Property::Quality, 0.0)
                   .has_value());
}

TEST_F(FluidLibraryTest, TransportPropertiesArePositive) {
  for (double q : {0.0, 1.0}) {
    EXPECT_GT(eval("R245fa", Property::Viscosity, Property::Pressure, 4e5, Property::Quality, q), 0.0);
    EXPECT_GT(eval("R245fa", Property::Conductivity, Property::Pressure, 4e5, Property::Quality, q), 0.0);
    EXPECT_GT(eval("R245fa", Property::Prandtl, Property::Pressure, 4e5, Property::Quality, q), 0.0);
  }
  EXPECT_GT(eval("R245fa", Property::SurfaceTension, Property::Pressure, 4e5, Property::Quality, 0.0), 0.0);
}

TEST_F(FluidLibraryTest, DeclaredOilHasLinearEnthalpy) {
  const double h1 = eval("PiroblocBasic", Property::Enthalpy, Property::Pressure, 2e5, Property::Temperature, 350.0);
  const double h2 = eval("PiroblocBasic", Property::Enthalpy, Property::Pressure, 2e5, Property::Temperature, 351.0);
  const double cp = eval("PiroblocBasic", Property::SpecificHeat, Property::Pressure, 2e5, Property::Temperature, 350.5);
  EXPECT_NEAR(h2 - h1, cp, 1e-3 * cp);
  EXPECT_FALSE(oracle_->state("PiroblocBasic", Property::Quality, Property::Pressure, 2e5, Property::Enthalpy, h1)
                   .has_value());
}

TEST_F(FluidLibraryTest, CoolPropIncompressibleHasNoQuality) {
  const double h = eval("INCOMP::T66", Property::Enthalpy, Property::Pressure, 2e5, Property::Temperature, 350.0);
  EXPECT_NEAR(eval("INCOMP::T66", Property::Temperature, Property::Pressure, 2e5, Property::Enthalpy, h), 350.0, 1e-6);
  EXPECT_FALSE(
      oracle_->state("INCOMP::T66", Property::Quality, Property::Pressure, 2e5, Property::Enthalpy, h).has_value());
  EXPECT_FALSE(oracle_->state("INCOMP::T66", Property::CriticalPressure, Property::Pressure, 2e5,
                              Property::Quality, 1.0)
                   .has_value());
}

TEST(ResolveSupply, TemperatureSupplyGetsDome) {
  auto oracle = create_property_oracle(io::FluidsConfig{});
  ASSERT_TRUE(oracle.has_value());

  const Stream stream{"R245fa", 4e5, SupplyState::temperature(300.0), 0.1};
  auto supply = resolve_supply(**oracle, stream);
  ASSERT_TRUE(supply.has_value()) << supply.error().message();
  EXPECT_TRUE(supply->has_dome);
  EXPECT_LT(supply->enthalpy, supply->h_liquid);
  EXPECT_DOUBLE_EQ(supply->temperature, 300.0);
}

TEST(ResolveSupply, SupercriticalStreamHasNoDome) {
  auto oracle = create_property_oracle(io::FluidsConfig{});
  ASSERT_TRUE(oracle.has_value());

  const Stream stream{"R134a", 50.75e5, SupplyState::temperature(473.15), 0.16};
  auto supply = resolve_supply(**oracle, stream);
  ASSERT_TRUE(supply.has_value()) << supply.error().message();
  EXPECT_FALSE(supply->incompressible);
  EXPECT_FALSE(supply->has_dome);
}

TEST(ResolveSupply, IncompressibleStreamHasNoDome) {
  auto oracle = create_property_oracle(test_support::fluids_with_thermal_oil());
  ASSERT_TRUE(oracle.has_value());

  const Stream stream{"PiroblocBasic", 2e5, SupplyState::temperature(363.15), 0.09};
  auto supply = resolve_supply(**oracle, stream);
  ASSERT_TRUE(supply.has_value());
  EXPECT_TRUE(supply->incompressible);
  EXPECT_FALSE(supply->has_dome);
}

TEST(ResolveSupply, UndeclaredOilIsUnknown) {
  auto oracle = create_property_oracle(io::FluidsConfig{});
  ASSERT_TRUE(oracle.has_value());

  const Stream stream{"PiroblocBasic", 2e5, SupplyState::temperature(363.15), 0.09};
  EXPECT_FALSE(resolve_supply(**oracle, stream).has_value());
}

TEST(CreatePropertyOracle, DeclaredOilShadowsCoolPropName) {
  io::FluidsConfig config;
  auto oil = test_support::thermal_oil();
  oil.name = "Water";
  config.incompressible.push_back(oil);

  auto oracle = create_property_oracle(config);
  ASSERT_TRUE(oracle.has_value()) << oracle.error().message();
  EXPECT_TRUE((*oracle)->is_incompressible("Water"));
  auto cp = (*oracle)->state("Water", Property::SpecificHeat, Property::Pressure, 1e5, Property::Temperature,
                             oil.reference_temperature);
  ASSERT_TRUE(cp.has_value());
  EXPECT_DOUBLE_EQ(*cp, oil.cp_reference);
}

TEST(CreatePropertyOracle, RejectsInvalidFluid) {
  io::FluidsConfig config;
  IncompressibleFluidParameters broken;
  broken.name = "Broken";
  config.incompressible.push_back(broken);

  EXPECT_FALSE(create_property_oracle(config).has_value());
}

} // namespace
} // namespace orckit::thermophysics
