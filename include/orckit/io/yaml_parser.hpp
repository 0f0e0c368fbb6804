#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <concepts>
#include <expected>
#include <format>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace orckit::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  // Like extract_value, with a fallback when the key is absent
  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key,
                                      T fallback) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_fluids_config(const YAML::Node& node) const -> std::expected<FluidsConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_stream(const YAML::Node& node, std::string_view name) const
      -> std::expected<thermophysics::Stream, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_hex_config(const YAML::Node& node) const -> std::expected<HexCaseConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_hex_model(const YAML::Node& node) const -> std::expected<hex::HexModel, core::ConfigurationError>;

  [[nodiscard]] auto parse_side_geometry(const YAML::Node& node, std::string_view side) const
      -> std::expected<hex::SideGeometry, core::ConfigurationError>;

  [[nodiscard]] auto parse_correlation_side(const YAML::Node& node, std::string_view side) const
      -> std::expected<hex::CorrelationSide, core::ConfigurationError>;

  [[nodiscard]] auto parse_phase_values(const YAML::Node& node, std::string_view key, hex::PhaseValues fallback) const
      -> std::expected<hex::PhaseValues, core::ConfigurationError>;

  [[nodiscard]] auto parse_void_fraction(const YAML::Node& node) const
      -> std::expected<hex::VoidFractionSettings, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_expander_config(const YAML::Node& node) const -> std::expected<ExpanderCaseConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_expander_model(const YAML::Node& node) const
      -> std::expected<expander::ExpanderModel, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parses a document already held in memory (tests, embedded cases)
  [[nodiscard]] auto load_string(std::string_view content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::vector<double>>) {
      auto sequence = node[std::string(key)];
      std::vector<double> result;
      result.reserve(sequence.size());

      for (const auto& item : sequence) {
        result.push_back(item.as<double>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key,
                                  T fallback) const -> std::expected<T, core::ConfigurationError> {
  if (!node || !node[std::string(key)]) {
    return fallback;
  }
  return extract_value<T>(node, key);
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(), ::tolower);

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

enum class HexModelType { ConstantPinch, ConstantEffectiveness, PolynomialEffectiveness, ConstantCoefficient,
                          ScaledCoefficient, Correlation };

enum class ExpanderModelType { ConstantEfficiency, PolynomialEfficiency, SemiEmpirical };

inline const std::unordered_map<std::string, HexModelType> hex_models = {
    {"cstpinch", HexModelType::ConstantPinch},
    {"csteff", HexModelType::ConstantEffectiveness},
    {"poleff", HexModelType::PolynomialEffectiveness},
    {"hconvcst", HexModelType::ConstantCoefficient},
    {"hconvvar", HexModelType::ScaledCoefficient},
    {"hconvcor", HexModelType::Correlation}};

inline const std::unordered_map<std::string, ExpanderModelType> expander_models = {
    {"csteff", ExpanderModelType::ConstantEfficiency},
    {"poleff", ExpanderModelType::PolynomialEfficiency},
    {"semiemp", ExpanderModelType::SemiEmpirical}};

inline const std::unordered_map<std::string, hex::SinglePhaseCorrelation> single_phase_correlations = {
    {"martin", hex::SinglePhaseCorrelation::Martin},
    {"wanniarachchi", hex::SinglePhaseCorrelation::Wanniarachchi},
    {"thonon", hex::SinglePhaseCorrelation::Thonon},
    {"gnielinski", hex::SinglePhaseCorrelation::Gnielinski},
    {"gnielinski_and_sha", hex::SinglePhaseCorrelation::GnielinskiSha},
    {"vdi_finned_tubes_staggered", hex::SinglePhaseCorrelation::VdiFinnedTubesStaggered},
    {"wang_finned_tubes_staggered", hex::SinglePhaseCorrelation::WangFinnedTubesStaggered},
    {"manual", hex::SinglePhaseCorrelation::Manual}};

inline const std::unordered_map<std::string, hex::TwoPhaseCorrelation> two_phase_correlations = {
    {"han_condensation", hex::TwoPhaseCorrelation::HanCondensation},
    {"longo_condensation", hex::TwoPhaseCorrelation::LongoCondensation},
    {"cavallini_condensation", hex::TwoPhaseCorrelation::CavalliniCondensation},
    {"shah_condensation", hex::TwoPhaseCorrelation::ShahCondensation},
    {"han_boiling", hex::TwoPhaseCorrelation::HanBoiling},
    {"almalfi_boiling", hex::TwoPhaseCorrelation::AlmalfiBoiling},
    {"cooper_boiling", hex::TwoPhaseCorrelation::CooperBoiling},
    {"manual", hex::TwoPhaseCorrelation::Manual}};

inline const std::unordered_map<std::string, hex::VoidFractionModel> void_fraction_models = {
    {"homogenous", hex::VoidFractionModel::Homogenous},
    {"homogeneous", hex::VoidFractionModel::Homogenous},
    {"zivi", hex::VoidFractionModel::Zivi},
    {"slipratio", hex::VoidFractionModel::SlipRatio},
    {"slip_ratio", hex::VoidFractionModel::SlipRatio},
    {"lockmart", hex::VoidFractionModel::LockhartMartinelli},
    {"lockhart_martinelli", hex::VoidFractionModel::LockhartMartinelli},
    {"premoli", hex::VoidFractionModel::Premoli},
    {"hughmark", hex::VoidFractionModel::Hughmark},
    {"zivi_integrated", hex::VoidFractionModel::ZiviIntegrated},
    {"personnal", hex::VoidFractionModel::Personal},
    {"personal", hex::VoidFractionModel::Personal}};

} // namespace enum_mappings

} // namespace orckit::io
