#include "orckit/io/yaml_parser.hpp"
#include "orckit/core/constants.hpp"
#include "orckit/core/expected_utils.hpp"

#include <iostream>

// Assigns node[key] to field when present, keeping the current value otherwise
#define ORCKIT_ASSIGN_OPTIONAL(node, key, field)                                                \
  ORCKIT_TRY_ASSIGN(field, extract_optional<std::remove_cvref_t<decltype(field)>>(node, key, field))

namespace orckit::io {

namespace {

// Child of a possibly undefined node; undefined nodes cannot be indexed
[[nodiscard]] auto child(const YAML::Node& node, const char* key) -> YAML::Node {
  if (!node) {
    return YAML::Node(YAML::NodeType::Undefined);
  }
  return node[key];
}

[[nodiscard]] auto to_matrix(const YAML::Node& sequence, std::string_view key)
    -> std::expected<core::PolynomialCoefficients, core::ConfigurationError> {
  if (!sequence.IsSequence() || sequence.size() == 0) {
    return std::unexpected(core::ConfigurationError(std::format("'{}' must be a non-empty list of rows", key)));
  }

  // A flat list is a single row: coefficients of y^j at x^0
  if (!sequence[0].IsSequence()) {
    core::PolynomialCoefficients matrix(1, sequence.size());
    for (std::size_t j = 0; j < sequence.size(); ++j) {
      matrix(0, static_cast<Eigen::Index>(j)) = sequence[j].as<double>();
    }
    return matrix;
  }

  const auto cols = sequence[0].size();
  core::PolynomialCoefficients matrix(sequence.size(), cols);
  for (std::size_t i = 0; i < sequence.size(); ++i) {
    if (sequence[i].size() != cols) {
      return std::unexpected(core::ConfigurationError(std::format("'{}': all rows must have {} entries", key, cols)));
    }
    for (std::size_t j = 0; j < cols; ++j) {
      matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = sequence[i][j].as<double>();
    }
  }
  return matrix;
}

[[nodiscard]] auto to_vector(const std::vector<double>& values) -> core::RegressionCoefficients {
  return Eigen::Map<const core::RegressionCoefficients>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_string(std::string_view content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(std::string(content));
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    Configuration config;

    if (!root_["heat_exchanger"] && !root_["expander"]) {
      return std::unexpected(core::ConfigurationError(
          "No component configured. Please provide a 'heat_exchanger' section, an 'expander' section, or both."));
    }

    ORCKIT_ASSIGN_OPTIONAL(root_, "verbose", config.verbose);

    if (root_["fluids"]) {
      ORCKIT_TRY_ASSIGN(config.fluids, parse_fluids_config(root_["fluids"]));
    }

    if (root_["heat_exchanger"]) {
      auto hex_result = parse_hex_config(root_["heat_exchanger"]);
      if (!hex_result) {
        return std::unexpected(hex_result.error());
      }
      config.heat_exchanger = std::move(hex_result.value());
    }

    if (root_["expander"]) {
      auto expander_result = parse_expander_config(root_["expander"]);
      if (!expander_result) {
        return std::unexpected(expander_result.error());
      }
      config.expander = std::move(expander_result.value());
    }

    auto out_result = parse_output_config(root_["output"]);
    if (!out_result) {
      return std::unexpected(out_result.error());
    }
    config.output = std::move(out_result.value());

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(
        core::ConfigurationError(std::format("YAML parsing error: {} at line {}", e.what(), e.mark.line)));
  } catch (const std::exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Unexpected error during parsing: {}", e.what())));
  }
}

auto YamlParser::parse_fluids_config(const YAML::Node& node) const
    -> std::expected<FluidsConfig, core::ConfigurationError> {
  FluidsConfig config;

  if (node["pure"]) {
    return std::unexpected(core::ConfigurationError(
        "fluids.pure is not supported: working fluids are resolved by CoolProp under their usual names"));
  }

  if (const auto incompressible_node = node["incompressible"]) {
    for (const auto& entry : incompressible_node) {
      thermophysics::IncompressibleFluidParameters params;
      ORCKIT_TRY_ASSIGN(params.name, extract_value<std::string>(entry, "name"));
      ORCKIT_TRY_ASSIGN(params.cp_reference, extract_value<double>(entry, "cp_reference"));
      ORCKIT_TRY_ASSIGN(params.density_reference, extract_value<double>(entry, "density_reference"));
      ORCKIT_TRY_ASSIGN(params.conductivity_reference, extract_value<double>(entry, "conductivity_reference"));
      ORCKIT_TRY_ASSIGN(params.viscosity_reference, extract_value<double>(entry, "viscosity_reference"));
      ORCKIT_TRY_ASSIGN(params.min_temperature, extract_value<double>(entry, "min_temperature"));
      ORCKIT_TRY_ASSIGN(params.max_temperature, extract_value<double>(entry, "max_temperature"));

      ORCKIT_ASSIGN_OPTIONAL(entry, "reference_temperature", params.reference_temperature);
      ORCKIT_ASSIGN_OPTIONAL(entry, "cp_slope", params.cp_slope);
      ORCKIT_ASSIGN_OPTIONAL(entry, "density_slope", params.density_slope);
      ORCKIT_ASSIGN_OPTIONAL(entry, "conductivity_slope", params.conductivity_slope);
      ORCKIT_ASSIGN_OPTIONAL(entry, "viscosity_activation", params.viscosity_activation);

      config.incompressible.push_back(std::move(params));
    }
  }

  return config;
}

auto YamlParser::parse_stream(const YAML::Node& node, std::string_view name) const
    -> std::expected<thermophysics::Stream, core::ConfigurationError> {
  if (!node) {
    return std::unexpected(core::ConfigurationError(std::format("Missing required stream '{}'", name)));
  }

  thermophysics::Stream stream;
  ORCKIT_TRY_ASSIGN(stream.fluid, extract_value<std::string>(node, "fluid"));
  ORCKIT_TRY_ASSIGN(stream.pressure, extract_value<double>(node, "pressure"));
  ORCKIT_TRY_ASSIGN(stream.mass_flow, extract_value<double>(node, "mass_flow"));

  const bool has_temperature = static_cast<bool>(node["temperature"]);
  const bool has_enthalpy = static_cast<bool>(node["enthalpy"]);
  if (has_temperature == has_enthalpy) {
    return std::unexpected(core::ValidationError(
        name, "exactly one of 'temperature' [K] or 'enthalpy' [J/kg] must describe the supply state"));
  }

  if (has_temperature) {
    double T = 0.0;
    ORCKIT_TRY_ASSIGN(T, extract_value<double>(node, "temperature"));
    stream.supply = thermophysics::SupplyState::temperature(T);
  } else {
    double h = 0.0;
    ORCKIT_TRY_ASSIGN(h, extract_value<double>(node, "enthalpy"));
    stream.supply = thermophysics::SupplyState::enthalpy(h);
  }
  return stream;
}

auto YamlParser::parse_phase_values(const YAML::Node& node, std::string_view key, hex::PhaseValues fallback) const
    -> std::expected<hex::PhaseValues, core::ConfigurationError> {
  const auto values_node = node[std::string(key)];
  if (!values_node) {
    return fallback;
  }
  hex::PhaseValues values = fallback;
  ORCKIT_ASSIGN_OPTIONAL(values_node, "liquid", values.liquid);
  ORCKIT_ASSIGN_OPTIONAL(values_node, "two_phase", values.two_phase);
  ORCKIT_ASSIGN_OPTIONAL(values_node, "vapor", values.vapor);
  return values;
}

auto YamlParser::parse_correlation_side(const YAML::Node& node, std::string_view side) const
    -> std::expected<hex::CorrelationSide, core::ConfigurationError> {
  hex::CorrelationSide correlation;
  if (!node) {
    return std::unexpected(core::ConfigurationError(std::format("hConvCor requires a '{}' correlation section", side)));
  }

  if (node["single_phase"]) {
    ORCKIT_TRY_ASSIGN(correlation.single_phase,
                      extract_enum(node, "single_phase", enum_mappings::single_phase_correlations));
  }
  if (node["two_phase"]) {
    ORCKIT_TRY_ASSIGN(correlation.two_phase, extract_enum(node, "two_phase", enum_mappings::two_phase_correlations));
  }
  ORCKIT_ASSIGN_OPTIONAL(node, "manual_single_phase", correlation.manual_single_phase);
  ORCKIT_ASSIGN_OPTIONAL(node, "manual_two_phase", correlation.manual_two_phase);
  ORCKIT_ASSIGN_OPTIONAL(node, "fact_corr_sp", correlation.factor_single_phase);
  ORCKIT_ASSIGN_OPTIONAL(node, "fact_corr_2p", correlation.factor_two_phase);
  ORCKIT_ASSIGN_OPTIONAL(node, "fact2_corr_sp", correlation.exponent_factor_single_phase);
  ORCKIT_ASSIGN_OPTIONAL(node, "fact2_corr_2p", correlation.exponent_factor_two_phase);
  return correlation;
}

auto YamlParser::parse_hex_model(const YAML::Node& node) const
    -> std::expected<hex::HexModel, core::ConfigurationError> {
  using enum_mappings::HexModelType;

  HexModelType type;
  ORCKIT_TRY_ASSIGN(type, extract_enum(node, "type", enum_mappings::hex_models));

  switch (type) {
  case HexModelType::ConstantPinch: {
    hex::ConstantPinchModel model;
    ORCKIT_TRY_ASSIGN(model.pinch, extract_value<double>(node, "pinch"));
    return model;
  }
  case HexModelType::ConstantEffectiveness: {
    hex::ConstantEffectivenessModel model;
    ORCKIT_TRY_ASSIGN(model.effectiveness, extract_value<double>(node, "effectiveness"));
    return model;
  }
  case HexModelType::PolynomialEffectiveness: {
    hex::PolynomialEffectivenessModel model;
    std::vector<double> coefficients;
    ORCKIT_TRY_ASSIGN(coefficients, extract_value<std::vector<double>>(node, "coefficients"));
    if (coefficients.size() != 6) {
      return std::unexpected(core::ValidationError("coefficients", "PolEff takes exactly 6 coefficients"));
    }
    model.coefficients = to_vector(coefficients);
    ORCKIT_TRY_ASSIGN(model.nominal_hot_flow, extract_value<double>(node, "nominal_hot_flow"));
    ORCKIT_TRY_ASSIGN(model.nominal_cold_flow, extract_value<double>(node, "nominal_cold_flow"));
    return model;
  }
  case HexModelType::ConstantCoefficient: {
    hex::ConstantCoefficientModel model;
    ORCKIT_TRY_ASSIGN(model.hot, parse_phase_values(node, "hot", model.hot));
    ORCKIT_TRY_ASSIGN(model.cold, parse_phase_values(node, "cold", model.cold));
    return model;
  }
  case HexModelType::ScaledCoefficient: {
    hex::ScaledCoefficientModel model;
    ORCKIT_TRY_ASSIGN(model.hot_nominal, parse_phase_values(node, "hot_nominal", model.hot_nominal));
    ORCKIT_TRY_ASSIGN(model.cold_nominal, parse_phase_values(node, "cold_nominal", model.cold_nominal));
    ORCKIT_TRY_ASSIGN(model.hot_exponents, parse_phase_values(node, "hot_exponents", model.hot_exponents));
    ORCKIT_TRY_ASSIGN(model.cold_exponents, parse_phase_values(node, "cold_exponents", model.cold_exponents));
    ORCKIT_TRY_ASSIGN(model.nominal_hot_flow, extract_value<double>(node, "nominal_hot_flow"));
    ORCKIT_TRY_ASSIGN(model.nominal_cold_flow, extract_value<double>(node, "nominal_cold_flow"));
    return model;
  }
  case HexModelType::Correlation: {
    hex::CorrelationModel model;
    ORCKIT_TRY_ASSIGN(model.hot, parse_correlation_side(node["hot"], "hot"));
    ORCKIT_TRY_ASSIGN(model.cold, parse_correlation_side(node["cold"], "cold"));
    return model;
  }
  }
  return std::unexpected(core::ConfigurationError("Unhandled heat exchanger model"));
}

auto YamlParser::parse_side_geometry(const YAML::Node& node, std::string_view side) const
    -> std::expected<hex::SideGeometry, core::ConfigurationError> {
  hex::SideGeometry geometry;
  if (!node) {
    return geometry;
  }

  ORCKIT_ASSIGN_OPTIONAL(node, "area", geometry.area);
  ORCKIT_ASSIGN_OPTIONAL(node, "volume", geometry.volume);
  ORCKIT_ASSIGN_OPTIONAL(node, "hydraulic_diameter", geometry.hydraulic_diameter);
  ORCKIT_ASSIGN_OPTIONAL(node, "cross_section", geometry.cross_section);
  ORCKIT_ASSIGN_OPTIONAL(node, "n_canals", geometry.n_canals);
  ORCKIT_ASSIGN_OPTIONAL(node, "tube_length", geometry.tube_length);
  ORCKIT_ASSIGN_OPTIONAL(node, "secondary_hydraulic_diameter", geometry.secondary_hydraulic_diameter);
  ORCKIT_ASSIGN_OPTIONAL(node, "n_tube_rows", geometry.n_tube_rows);
  ORCKIT_ASSIGN_OPTIONAL(node, "fin_pitch", geometry.fin_pitch);
  ORCKIT_ASSIGN_OPTIONAL(node, "longitudinal_pitch", geometry.longitudinal_pitch);

  if (const auto fins_node = node["fins"]) {
    hex::FinGeometry fins;
    ORCKIT_TRY_ASSIGN(fins.conductivity, extract_value<double>(fins_node, "conductivity"));
    ORCKIT_TRY_ASSIGN(fins.thickness, extract_value<double>(fins_node, "thickness"));
    ORCKIT_TRY_ASSIGN(fins.tube_radius, extract_value<double>(fins_node, "tube_radius"));
    ORCKIT_TRY_ASSIGN(fins.half_width, extract_value<double>(fins_node, "half_width"));
    ORCKIT_TRY_ASSIGN(fins.half_length, extract_value<double>(fins_node, "half_length"));
    ORCKIT_TRY_ASSIGN(fins.finned_area_fraction, extract_value<double>(fins_node, "finned_area_fraction"));
    ORCKIT_ASSIGN_OPTIONAL(fins_node, "area_ratio", fins.area_ratio);
    geometry.fins = fins;
  }

  if (geometry.area < 0.0 || geometry.volume < 0.0) {
    return std::unexpected(core::ValidationError(std::format("geometry.{}", side), "area and volume must be >= 0"));
  }
  return geometry;
}

auto YamlParser::parse_void_fraction(const YAML::Node& node) const
    -> std::expected<hex::VoidFractionSettings, core::ConfigurationError> {
  hex::VoidFractionSettings settings;
  if (!node) {
    return settings;
  }
  if (node["model"]) {
    ORCKIT_TRY_ASSIGN(settings.model, extract_enum(node, "model", enum_mappings::void_fraction_models));
  }
  ORCKIT_ASSIGN_OPTIONAL(node, "slip_ratio", settings.slip_ratio);
  ORCKIT_ASSIGN_OPTIONAL(node, "mass_averaged_void_fraction", settings.mass_averaged_void_fraction);
  ORCKIT_ASSIGN_OPTIONAL(node, "hughmark_simplified", settings.hughmark_simplified);
  return settings;
}

auto YamlParser::parse_hex_config(const YAML::Node& node) const
    -> std::expected<HexCaseConfig, core::ConfigurationError> {
  HexCaseConfig config;

  ORCKIT_TRY_ASSIGN(config.hot, parse_stream(node["hot"], "hot"));
  ORCKIT_TRY_ASSIGN(config.cold, parse_stream(node["cold"], "cold"));

  if (!node["model"]) {
    return std::unexpected(core::ConfigurationError("Missing required 'model' section in heat_exchanger"));
  }
  ORCKIT_TRY_ASSIGN(config.exchanger.model, parse_hex_model(node["model"]));

  const auto geometry_node = node["geometry"];
  ORCKIT_TRY_ASSIGN(config.exchanger.hot, parse_side_geometry(child(geometry_node, "hot"), "hot"));
  ORCKIT_TRY_ASSIGN(config.exchanger.cold, parse_side_geometry(child(geometry_node, "cold"), "cold"));

  // A_tot applies to both sides of a plate exchanger
  if (child(geometry_node, "total_area")) {
    double total_area = 0.0;
    ORCKIT_TRY_ASSIGN(total_area, extract_value<double>(geometry_node, "total_area"));
    config.exchanger.hot.area = total_area;
    config.exchanger.cold.area = total_area;
  }

  if (const auto plate_node = child(geometry_node, "plate")) {
    auto& plate = config.exchanger.plate;
    double chevron_angle_deg = plate.chevron_angle * 180.0 / constants::physical::pi;
    ORCKIT_ASSIGN_OPTIONAL(plate_node, "chevron_angle_deg", chevron_angle_deg);
    plate.chevron_angle = chevron_angle_deg * constants::physical::pi / 180.0;
    ORCKIT_ASSIGN_OPTIONAL(plate_node, "corrugation_pitch", plate.corrugation_pitch);
    ORCKIT_ASSIGN_OPTIONAL(plate_node, "enlargement_factor", plate.enlargement_factor);
    ORCKIT_ASSIGN_OPTIONAL(plate_node, "plate_length", plate.plate_length);
  }

  const auto void_node = node["void_fraction"];
  ORCKIT_TRY_ASSIGN(config.exchanger.void_fraction_hot, parse_void_fraction(child(void_node, "hot")));
  ORCKIT_TRY_ASSIGN(config.exchanger.void_fraction_cold, parse_void_fraction(child(void_node, "cold")));

  ORCKIT_ASSIGN_OPTIONAL(node, "n_tp_disc", config.exchanger.two_phase_subdivisions);
  if (config.exchanger.two_phase_subdivisions < 1) {
    return std::unexpected(core::ValidationError("n_tp_disc", "must be at least 1"));
  }

  return config;
}

auto YamlParser::parse_expander_model(const YAML::Node& node) const
    -> std::expected<expander::ExpanderModel, core::ConfigurationError> {
  using enum_mappings::ExpanderModelType;

  ExpanderModelType type;
  ORCKIT_TRY_ASSIGN(type, extract_enum(node, "type", enum_mappings::expander_models));

  switch (type) {
  case ExpanderModelType::ConstantEfficiency: {
    expander::ConstantEfficiencyModel model;
    ORCKIT_TRY_ASSIGN(model.isentropic_efficiency, extract_value<double>(node, "eta_is"));
    ORCKIT_ASSIGN_OPTIONAL(node, "filling_factor", model.filling_factor);
    ORCKIT_ASSIGN_OPTIONAL(node, "AU_amb", model.ambient_conductance);
    return model;
  }
  case ExpanderModelType::PolynomialEfficiency: {
    expander::PolynomialEfficiencyModel model;
    std::vector<double> efficiency;
    std::vector<double> filling_factor;
    ORCKIT_TRY_ASSIGN(efficiency, extract_value<std::vector<double>>(node, "coeffs_eta_is"));
    ORCKIT_TRY_ASSIGN(filling_factor, extract_value<std::vector<double>>(node, "coeffs_filling_factor"));
    model.efficiency_coefficients = to_vector(efficiency);
    model.filling_factor_coefficients = to_vector(filling_factor);
    ORCKIT_ASSIGN_OPTIONAL(node, "AU_amb", model.ambient_conductance);
    return model;
  }
  case ExpanderModelType::SemiEmpirical: {
    expander::SemiEmpiricalModel model;
    ORCKIT_ASSIGN_OPTIONAL(node, "r_v_in", model.built_in_volume_ratio);
    ORCKIT_ASSIGN_OPTIONAL(node, "A_leak", model.leakage_area);
    ORCKIT_ASSIGN_OPTIONAL(node, "d_su", model.supply_diameter);
    ORCKIT_ASSIGN_OPTIONAL(node, "alpha", model.proportional_loss);
    ORCKIT_ASSIGN_OPTIONAL(node, "W_dot_loss_0", model.constant_loss);
    ORCKIT_ASSIGN_OPTIONAL(node, "C_loss", model.loss_torque);
    ORCKIT_ASSIGN_OPTIONAL(node, "AU_su_n", model.supply_conductance);
    ORCKIT_ASSIGN_OPTIONAL(node, "AU_ex_n", model.exhaust_conductance);
    ORCKIT_ASSIGN_OPTIONAL(node, "AU_amb", model.ambient_conductance);
    ORCKIT_ASSIGN_OPTIONAL(node, "M_dot_n", model.nominal_mass_flow);

    if (const auto gamma_node = node["gamma"]) {
      if (gamma_node["superheated"]) {
        core::PolynomialCoefficients coefficients;
        ORCKIT_TRY_ASSIGN(coefficients, to_matrix(gamma_node["superheated"], "gamma.superheated"));
        model.gamma.superheated = expander::GammaRegression(std::move(coefficients));
      }
      if (gamma_node["two_phase"]) {
        core::PolynomialCoefficients coefficients;
        ORCKIT_TRY_ASSIGN(coefficients, to_matrix(gamma_node["two_phase"], "gamma.two_phase"));
        model.gamma.two_phase = expander::GammaRegression(std::move(coefficients));
      }
    }
    return model;
  }
  }
  return std::unexpected(core::ConfigurationError("Unhandled expander model"));
}

auto YamlParser::parse_expander_config(const YAML::Node& node) const
    -> std::expected<ExpanderCaseConfig, core::ConfigurationError> {
  ExpanderCaseConfig config;

  ORCKIT_TRY_ASSIGN(config.supply, parse_stream(node["supply"], "supply"));
  ORCKIT_TRY_ASSIGN(config.exhaust_pressure, extract_value<double>(node, "exhaust_pressure"));
  ORCKIT_ASSIGN_OPTIONAL(node, "ambient_temperature", config.ambient_temperature);

  ORCKIT_TRY_ASSIGN(config.machine.swept_volume, extract_value<double>(node, "swept_volume"));
  ORCKIT_ASSIGN_OPTIONAL(node, "internal_volume", config.machine.internal_volume);

  if (node["h_min"]) {
    double h_min = 0.0;
    ORCKIT_TRY_ASSIGN(h_min, extract_value<double>(node, "h_min"));
    config.machine.h_min = h_min;
  }
  if (node["h_max"]) {
    double h_max = 0.0;
    ORCKIT_TRY_ASSIGN(h_max, extract_value<double>(node, "h_max"));
    config.machine.h_max = h_max;
  }

  if (!node["model"]) {
    return std::unexpected(core::ConfigurationError("Missing required 'model' section in expander"));
  }
  ORCKIT_TRY_ASSIGN(config.machine.model, parse_expander_model(node["model"]));

  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {
  OutputConfig config;
  if (!node) {
    std::cout << "INFO: No 'output' section, writing to '" << config.output_directory << "'" << std::endl;
    return config;
  }

  ORCKIT_ASSIGN_OPTIONAL(node, "directory", config.output_directory);
  ORCKIT_ASSIGN_OPTIONAL(node, "case_name", config.case_name);
  ORCKIT_ASSIGN_OPTIONAL(node, "hdf5", config.write_hdf5);
  return config;
}

} // namespace orckit::io

#undef ORCKIT_ASSIGN_OPTIONAL
