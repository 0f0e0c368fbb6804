#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include <optional>
#include <string_view>
#include <variant>

namespace orckit::hex {

enum class SinglePhaseCorrelation {
  Martin,
  Wanniarachchi,
  Thonon,
  Gnielinski,
  GnielinskiSha,
  VdiFinnedTubesStaggered,
  WangFinnedTubesStaggered,
  Manual
};

enum class TwoPhaseCorrelation {
  HanCondensation,
  LongoCondensation,
  CavalliniCondensation,
  ShahCondensation,
  HanBoiling,
  AlmalfiBoiling,
  CooperBoiling,
  Manual
};

enum class VoidFractionModel {
  Homogenous,
  Zivi,
  SlipRatio,
  LockhartMartinelli,
  Premoli,
  Hughmark,
  ZiviIntegrated,
  Personal
};

[[nodiscard]] constexpr auto is_condensation(TwoPhaseCorrelation c) noexcept -> bool {
  return c == TwoPhaseCorrelation::HanCondensation || c == TwoPhaseCorrelation::LongoCondensation ||
         c == TwoPhaseCorrelation::CavalliniCondensation || c == TwoPhaseCorrelation::ShahCondensation;
}

[[nodiscard]] constexpr auto is_boiling(TwoPhaseCorrelation c) noexcept -> bool {
  return c == TwoPhaseCorrelation::HanBoiling || c == TwoPhaseCorrelation::AlmalfiBoiling ||
         c == TwoPhaseCorrelation::CooperBoiling;
}

// ================================================================================================
// GEOMETRY
// ================================================================================================

/**
 * @brief Finned surface described by Schmidt's equivalent circular fin
 */
struct FinGeometry {
  double conductivity = 0.0;        // k [W/(m·K)]
  double thickness = 0.0;           // th [m]
  double tube_radius = 0.0;         // r [m]
  double half_width = 0.0;          // B [m]
  double half_length = 0.0;         // H [m]
  double finned_area_fraction = 0.0; // omega_f [-]
  double area_ratio = 1.0;          // omega_t [-], finned over bare tube area
};

struct SideGeometry {
  double area = 0.0;               // [m²]
  double volume = 0.0;             // [m³]
  double hydraulic_diameter = 0.0; // [m]
  double cross_section = 0.0;      // flow area of one canal [m²]
  double n_canals = 1.0;

  // Tube and fin bank geometry (Gnielinski_and_Sha, VDI, Wang)
  double tube_length = 0.0;
  double secondary_hydraulic_diameter = 0.0;
  double n_tube_rows = 0.0;
  double fin_pitch = 0.0;
  double longitudinal_pitch = 0.0;

  std::optional<FinGeometry> fins;
};

// Chevron plate geometry shared by both sides of a plate exchanger
struct PlateGeometry {
  double chevron_angle = 0.0;      // [rad]
  double corrugation_pitch = 0.0;  // [m]
  double enlargement_factor = 1.0; // phi [-]
  double plate_length = 0.0;       // [m]
};

struct VoidFractionSettings {
  VoidFractionModel model = VoidFractionModel::Homogenous;
  double slip_ratio = 1.0;
  double mass_averaged_void_fraction = 0.0; // Personal model
  bool hughmark_simplified = false;         // composite trapezoid instead of adaptive quadrature
};

// ================================================================================================
// MODELS
// ================================================================================================

struct PhaseValues {
  double liquid = 0.0;
  double two_phase = 0.0;
  double vapor = 0.0;
};

struct ConstantPinchModel {
  double pinch = 0.0; // [K]
};

struct ConstantEffectivenessModel {
  double effectiveness = 1.0;
};

/**
 * @brief eps = c1 + c2 rh + c3 rc + c4 rh² + c5 rh rc + c6 rc² with r = m_dot / m_dot_nominal
 */
struct PolynomialEffectivenessModel {
  core::RegressionCoefficients coefficients = core::RegressionCoefficients::Zero(6);
  double nominal_hot_flow = 1.0;
  double nominal_cold_flow = 1.0;
};

struct ConstantCoefficientModel {
  PhaseValues hot;
  PhaseValues cold;
};

// h = h_n (m_dot / m_dot_n)^n per side and phase
struct ScaledCoefficientModel {
  PhaseValues hot_nominal;
  PhaseValues cold_nominal;
  PhaseValues hot_exponents{0.8, 0.8, 0.8};
  PhaseValues cold_exponents{0.8, 0.8, 0.8};
  double nominal_hot_flow = 1.0;
  double nominal_cold_flow = 1.0;
};

struct CorrelationSide {
  SinglePhaseCorrelation single_phase = SinglePhaseCorrelation::Martin;
  TwoPhaseCorrelation two_phase = TwoPhaseCorrelation::Manual;
  double manual_single_phase = 0.0; // [W/(m²·K)]
  double manual_two_phase = 0.0;
  double factor_single_phase = 1.0;
  double factor_two_phase = 1.0;
  double exponent_factor_single_phase = 1.0;
  double exponent_factor_two_phase = 1.0;
};

struct CorrelationModel {
  CorrelationSide hot;
  CorrelationSide cold;
};

using HexModel = std::variant<ConstantPinchModel, ConstantEffectivenessModel, PolynomialEffectivenessModel,
                              ConstantCoefficientModel, ScaledCoefficientModel, CorrelationModel>;

[[nodiscard]] auto model_name(const HexModel& model) noexcept -> std::string_view;

// Area-matching models solve for the duty that consumes the available area
[[nodiscard]] auto is_area_matching(const HexModel& model) noexcept -> bool;

// Models whose coefficients are attached to the hot/cold labels and must follow a role swap
[[nodiscard]] auto supports_stream_reversal(const HexModel& model) noexcept -> bool;

struct HexConfig {
  HexModel model = ConstantEffectivenessModel{};
  SideGeometry hot;
  SideGeometry cold;
  PlateGeometry plate;
  VoidFractionSettings void_fraction_hot;
  VoidFractionSettings void_fraction_cold;
  int two_phase_subdivisions = constants::hex::default_two_phase_subdivisions;
};

} // namespace orckit::hex
