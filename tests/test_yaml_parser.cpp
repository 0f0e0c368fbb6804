#include "orckit/io/config_manager.hpp"
#include "orckit/io/yaml_parser.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <numbers>

namespace orckit::io {
namespace {

auto parse(std::string_view content) -> std::expected<Configuration, core::ConfigurationError> {
  YamlParser parser("inline.yaml");
  auto loaded = parser.load_string(content);
  if (!loaded) {
    return std::unexpected(core::ConfigurationError(loaded.error().message()));
  }
  return parser.parse();
}

constexpr std::string_view expander_case = R"(
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  internal_volume: 1.5e-3
  model:
    type: CstEff
    eta_is: 0.7
    filling_factor: 1.1
)";

TEST(YamlParser, ParsesConstantEfficiencyExpander) {
  auto config = parse(expander_case);
  ASSERT_TRUE(config.has_value()) << config.error().message();
  ASSERT_TRUE(config->expander.has_value());
  EXPECT_FALSE(config->heat_exchanger.has_value());

  const auto& expander = *config->expander;
  EXPECT_EQ(expander.supply.fluid, "R245fa");
  EXPECT_EQ(expander.supply.supply.kind, thermophysics::SupplyState::Kind::Temperature);
  EXPECT_DOUBLE_EQ(expander.supply.supply.value, 413.15);
  EXPECT_DOUBLE_EQ(expander.exhaust_pressure, 2.5e5);
  EXPECT_DOUBLE_EQ(expander.ambient_temperature, 293.15);

  const auto* model = std::get_if<expander::ConstantEfficiencyModel>(&expander.machine.model);
  ASSERT_NE(model, nullptr);
  EXPECT_DOUBLE_EQ(model->isentropic_efficiency, 0.7);
  EXPECT_DOUBLE_EQ(model->filling_factor, 1.1);
  EXPECT_DOUBLE_EQ(model->ambient_conductance, 0.0);

  EXPECT_EQ(config->output.output_directory, "orckit_outputs");
  EXPECT_TRUE(config->output.write_hdf5);
}

TEST(YamlParser, ParsesPolynomialExpanderRegressions) {
  auto config = parse(R"(
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, enthalpy: 4.6e5, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model:
    type: poleff
    coeffs_eta_is: [0.6, 0, 0, 0, 0, 0]
    coeffs_filling_factor: [0.9, 0, 0, 0, 0, 0, 1.0e-5, 0, 0, 0]
    AU_amb: 0.5
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  const auto& model = std::get<expander::PolynomialEfficiencyModel>(config->expander->machine.model);
  EXPECT_EQ(model.efficiency_coefficients.size(), 6);
  EXPECT_EQ(model.filling_factor_coefficients.size(), 10);
  EXPECT_DOUBLE_EQ(model.filling_factor_coefficients(6), 1.0e-5);
  EXPECT_DOUBLE_EQ(model.ambient_conductance, 0.5);
  EXPECT_EQ(config->expander->supply.supply.kind, thermophysics::SupplyState::Kind::Enthalpy);
}

TEST(YamlParser, ParsesCorrelatedPlateExchanger) {
  auto config = parse(R"(
heat_exchanger:
  hot: {fluid: PiroblocBasic, pressure: 2.0e5, temperature: 363.15, mass_flow: 0.09}
  cold: {fluid: R245fa, pressure: 4.188e5, temperature: 293.15, mass_flow: 0.0252}
  model:
    type: hConvCor
    hot: {single_phase: Martin, two_phase: longo_condensation, fact_corr_sp: 0.27}
    cold: {single_phase: martin, two_phase: Almalfi_Boiling, fact2_corr_2p: 0.9}
  geometry:
    total_area: 1.24
    hot: {volume: 0.0043, hydraulic_diameter: 3.5e-3, cross_section: 1.9e-4, n_canals: 50}
    cold: {volume: 0.0042, hydraulic_diameter: 3.5e-3, cross_section: 1.9e-4, n_canals: 49}
    plate: {chevron_angle_deg: 30, corrugation_pitch: 7.2e-3, plate_length: 0.46}
  void_fraction:
    cold: {model: hughmark, hughmark_simplified: true}
  n_tp_disc: 4
output:
  directory: results
  case_name: plate
  hdf5: false
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  ASSERT_TRUE(config->heat_exchanger.has_value());

  const auto& exchanger = config->heat_exchanger->exchanger;
  const auto& model = std::get<hex::CorrelationModel>(exchanger.model);
  EXPECT_EQ(model.hot.single_phase, hex::SinglePhaseCorrelation::Martin);
  EXPECT_EQ(model.hot.two_phase, hex::TwoPhaseCorrelation::LongoCondensation);
  EXPECT_EQ(model.cold.two_phase, hex::TwoPhaseCorrelation::AlmalfiBoiling);
  EXPECT_DOUBLE_EQ(model.hot.factor_single_phase, 0.27);
  EXPECT_DOUBLE_EQ(model.cold.exponent_factor_two_phase, 0.9);

  EXPECT_DOUBLE_EQ(exchanger.hot.area, 1.24);
  EXPECT_DOUBLE_EQ(exchanger.cold.area, 1.24);
  EXPECT_DOUBLE_EQ(exchanger.cold.n_canals, 49.0);
  EXPECT_NEAR(exchanger.plate.chevron_angle, std::numbers::pi / 6.0, 1e-12);
  EXPECT_EQ(exchanger.void_fraction_hot.model, hex::VoidFractionModel::Homogenous);
  EXPECT_EQ(exchanger.void_fraction_cold.model, hex::VoidFractionModel::Hughmark);
  EXPECT_TRUE(exchanger.void_fraction_cold.hughmark_simplified);
  EXPECT_EQ(exchanger.two_phase_subdivisions, 4);

  EXPECT_EQ(config->output.output_directory, "results");
  EXPECT_EQ(config->output.case_name, "plate");
  EXPECT_FALSE(config->output.write_hdf5);
}

TEST(YamlParser, ParsesCoefficientModels) {
  auto config = parse(R"(
heat_exchanger:
  hot: {fluid: PiroblocBasic, pressure: 2.0e5, temperature: 363.15, mass_flow: 0.09}
  cold: {fluid: R245fa, pressure: 4.188e5, temperature: 293.15, mass_flow: 0.0252}
  model:
    type: hconvvar
    hot_nominal: {liquid: 1500}
    cold_nominal: {liquid: 1000, two_phase: 3000, vapor: 600}
    cold_exponents: {two_phase: 0.6}
    nominal_hot_flow: 0.1
    nominal_cold_flow: 0.03
  geometry:
    hot: {area: 1.0}
    cold: {area: 1.1}
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  const auto& model = std::get<hex::ScaledCoefficientModel>(config->heat_exchanger->exchanger.model);
  EXPECT_DOUBLE_EQ(model.hot_nominal.liquid, 1500.0);
  EXPECT_DOUBLE_EQ(model.hot_nominal.vapor, 0.0);
  EXPECT_DOUBLE_EQ(model.cold_nominal.two_phase, 3000.0);
  EXPECT_DOUBLE_EQ(model.cold_exponents.two_phase, 0.6);
  EXPECT_DOUBLE_EQ(model.cold_exponents.liquid, 0.8);
  EXPECT_DOUBLE_EQ(model.nominal_cold_flow, 0.03);
}

TEST(YamlParser, ParsesCustomFluids) {
  auto config = parse(R"(
fluids:
  incompressible:
    - name: TestOil
      cp_reference: 2000
      density_reference: 850
      conductivity_reference: 0.12
      viscosity_reference: 0.05
      viscosity_activation: 8.0
      min_temperature: 260
      max_temperature: 600
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model: {type: csteff, eta_is: 0.7}
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  ASSERT_EQ(config->fluids.incompressible.size(), 1u);
  EXPECT_EQ(config->fluids.incompressible.front().name, "TestOil");
  EXPECT_DOUBLE_EQ(config->fluids.incompressible.front().cp_reference, 2000.0);
  EXPECT_DOUBLE_EQ(config->fluids.incompressible.front().viscosity_activation, 8.0);
  // Slopes default to constant properties
  EXPECT_DOUBLE_EQ(config->fluids.incompressible.front().cp_slope, 0.0);
  EXPECT_DOUBLE_EQ(config->fluids.incompressible.front().reference_temperature, 273.15);
}

TEST(YamlParser, RejectsIncompleteThermalOil) {
  auto config = parse(R"(
fluids:
  incompressible:
    - name: TestOil
      cp_reference: 2000
      density_reference: 850
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model: {type: csteff, eta_is: 0.7}
)");
  EXPECT_FALSE(config.has_value());
}

TEST(YamlParser, RejectsParametricPureFluids) {
  auto config = parse(R"(
fluids:
  pure:
    - name: R245fa
      vapor_cp: 1000
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model: {type: csteff, eta_is: 0.7}
)");
  EXPECT_FALSE(config.has_value());
}

TEST(YamlParser, RejectsEmptyCase) {
  auto config = parse("verbose: true\n");
  EXPECT_FALSE(config.has_value());
}

TEST(YamlParser, RejectsAmbiguousSupplyState) {
  auto config = parse(R"(
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, enthalpy: 4.6e5, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model: {type: csteff, eta_is: 0.7}
)");
  EXPECT_FALSE(config.has_value());
}

TEST(YamlParser, RejectsUnknownModel) {
  auto config = parse(R"(
expander:
  supply: {fluid: R245fa, pressure: 20.0e5, temperature: 413.15, mass_flow: 0.05}
  exhaust_pressure: 2.5e5
  swept_volume: 1.28e-5
  model: {type: turbine}
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("turbine"), std::string::npos);
}

TEST(YamlParser, RejectsWrongPolynomialEffectivenessSize) {
  auto config = parse(R"(
heat_exchanger:
  hot: {fluid: PiroblocBasic, pressure: 2.0e5, temperature: 363.15, mass_flow: 0.09}
  cold: {fluid: R245fa, pressure: 4.188e5, temperature: 293.15, mass_flow: 0.0252}
  model: {type: poleff, coefficients: [0.5, 0.1], nominal_hot_flow: 0.1, nominal_cold_flow: 0.03}
)");
  EXPECT_FALSE(config.has_value());
}

TEST(ConfigurationManager, LoadsDemoCase) {
  ConfigurationManager manager;
  auto config = manager.load(ORCKIT_SOURCE_DIR "/config/demo_case.yaml");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  EXPECT_TRUE(config->heat_exchanger.has_value());
  EXPECT_TRUE(config->expander.has_value());
  EXPECT_EQ(config->output.case_name, "demo_case");
}

TEST(ConfigurationManager, ReportsMissingFile) {
  ConfigurationManager manager;
  EXPECT_FALSE(manager.load("/nonexistent/case.yaml").has_value());
}

} // namespace
} // namespace orckit::io
